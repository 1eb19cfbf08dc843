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

#pragma once

#include <nftbridge/core/address.hpp>
#include <nftbridge/core/byte_string.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/core/result.hpp>

#include <evmc/evmc.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

NFTBRIDGE_NAMESPACE_BEGIN

struct CollectionMetadata
{
    std::string name{};
    std::string symbol{};
    std::string base_uri{};
    std::vector<std::string> token_uris{};
};

// Getter taking a token id and returning its URI
struct TokenUriEntryPoint
{
    char const *signature;
    uint32_t selector;
};

// Probed in order, first success wins
extern std::array<TokenUriEntryPoint, 2> const TOKEN_URI_ENTRY_POINTS;

// Reads descriptive metadata from a collection contract through read-only
// calls. Source collections are untrusted, so only name and symbol are
// required; everything else degrades to an empty string.
class MetadataExtractor
{
    evmc::HostInterface &host_;
    Address caller_;
    int64_t gas_;

    Result<byte_string> static_call(
        Address const &collection, byte_string const &call_data) const;
    Result<std::string>
    call_string(Address const &collection, byte_string const &call_data) const;

public:
    MetadataExtractor(
        evmc::HostInterface &host, Address const &caller,
        int64_t gas = 1'000'000);

    Result<CollectionMetadata> extract(
        Address const &collection,
        std::optional<std::span<uint256_t const>> token_ids) const;

    std::optional<std::string>
    token_uri(Address const &collection, uint256_t const &token_id) const;
};

NFTBRIDGE_NAMESPACE_END
