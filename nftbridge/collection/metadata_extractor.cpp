// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <nftbridge/collection/external_call_error.hpp>
#include <nftbridge/collection/metadata_extractor.hpp>
#include <nftbridge/contract/abi_decode.hpp>
#include <nftbridge/contract/abi_encode.hpp>
#include <nftbridge/contract/abi_selectors.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/fmt/address_fmt.hpp>
#include <nftbridge/core/fmt/int_fmt.hpp>
#include <nftbridge/core/likely.h>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <quill/Quill.h>

#include <boost/outcome/try.hpp>

#include <optional>
#include <string>
#include <utility>

NFTBRIDGE_NAMESPACE_BEGIN

std::array<TokenUriEntryPoint, 2> const TOKEN_URI_ENTRY_POINTS = {{
    {"tokenURI(uint256)", TOKEN_URI_SELECTOR},
    {"uri(uint256)", URI_SELECTOR},
}};

MetadataExtractor::MetadataExtractor(
    evmc::HostInterface &host, Address const &caller, int64_t const gas)
    : host_{host}
    , caller_{caller}
    , gas_{gas}
{
}

Result<byte_string> MetadataExtractor::static_call(
    Address const &collection, byte_string const &call_data) const
{
    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.flags = EVMC_STATIC;
    msg.gas = gas_;
    msg.recipient = collection;
    msg.sender = caller_;
    msg.code_address = collection;
    msg.input_data = call_data.data();
    msg.input_size = call_data.size();

    evmc::Result const result = host_.call(msg);
    if (NFTBRIDGE_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        return ExternalCallError::CallFailed;
    }
    return byte_string{result.output_data, result.output_size};
}

Result<std::string> MetadataExtractor::call_string(
    Address const &collection, byte_string const &call_data) const
{
    BOOST_OUTCOME_TRY(auto const output, static_call(collection, call_data));
    auto decoded = decode_string_response(output);
    if (NFTBRIDGE_UNLIKELY(decoded.has_error())) {
        return ExternalCallError::InvalidResponse;
    }
    return std::move(decoded).value();
}

std::optional<std::string> MetadataExtractor::token_uri(
    Address const &collection, uint256_t const &token_id) const
{
    for (auto const &entry : TOKEN_URI_ENTRY_POINTS) {
        auto uri =
            call_string(collection, abi_encode_call(entry.selector, token_id));
        if (uri.has_value()) {
            return std::move(uri).value();
        }
        LOG_DEBUG(
            "{} on {} for token {} failed: {}",
            entry.signature,
            collection,
            token_id,
            uri.error().message().c_str());
    }
    return std::nullopt;
}

Result<CollectionMetadata> MetadataExtractor::extract(
    Address const &collection,
    std::optional<std::span<uint256_t const>> const token_ids) const
{
    CollectionMetadata metadata;
    BOOST_OUTCOME_TRY(
        metadata.name,
        call_string(collection, abi_encode_call(NAME_SELECTOR)));
    BOOST_OUTCOME_TRY(
        metadata.symbol,
        call_string(collection, abi_encode_call(SYMBOL_SELECTOR)));

    auto base_uri =
        call_string(collection, abi_encode_call(BASE_URI_SELECTOR));
    if (base_uri.has_value()) {
        metadata.base_uri = std::move(base_uri).value();
    }

    if (!token_ids.has_value()) {
        return metadata;
    }

    metadata.token_uris.reserve(token_ids->size());
    for (auto const &id : *token_ids) {
        auto uri = token_uri(collection, id);
        if (!uri.has_value()) {
            LOG_WARNING(
                "no token uri for token {} of collection {}", id, collection);
        }
        metadata.token_uris.emplace_back(std::move(uri).value_or(""));
    }
    return metadata;
}

NFTBRIDGE_NAMESPACE_END
