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

#include "collection_test_host.hpp"

#include <nftbridge/collection/external_call_error.hpp>
#include <nftbridge/collection/metadata_extractor.hpp>
#include <nftbridge/contract/abi_selectors.hpp>
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/int.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <optional>
#include <span>
#include <string>
#include <vector>

using namespace nftbridge;
using namespace nftbridge::test;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto COLLECTION =
        0x5fbdb2315678afecb367f032d93f642f64180aa3_address;
    constexpr auto CALLER = 0x7a2088a1bfc9d81c55368ae168c2c02570cb814f_address;

    byte_string short_value(uint256_t const &packed)
    {
        auto const be = to_big_endian_bytes(packed);
        return byte_string{be.bytes, sizeof(be.bytes)};
    }

    void respond_name_and_symbol(CollectionTestHost &host)
    {
        host.respond(NAME_SELECTOR, abi_string("Everai"));
        host.respond(SYMBOL_SELECTOR, short_value(0x455641_u256));
    }
}

TEST(MetadataExtractor, name_symbol_and_base_uri)
{
    CollectionTestHost host;
    respond_name_and_symbol(host);
    host.respond(BASE_URI_SELECTOR, abi_string("ipfs://base/"));

    MetadataExtractor const extractor{host, CALLER};
    auto const res = extractor.extract(COLLECTION, std::nullopt);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().name, "Everai");
    EXPECT_EQ(res.value().symbol, "EVA");
    EXPECT_EQ(res.value().base_uri, "ipfs://base/");
    EXPECT_TRUE(res.value().token_uris.empty());

    ASSERT_EQ(host.calls.size(), 3);
    for (auto const &call : host.calls) {
        EXPECT_EQ(call.kind, EVMC_CALL);
        EXPECT_EQ(call.flags & EVMC_STATIC, EVMC_STATIC);
        EXPECT_EQ(call.recipient, COLLECTION);
    }
}

TEST(MetadataExtractor, missing_base_uri_is_empty)
{
    CollectionTestHost host;
    respond_name_and_symbol(host);

    MetadataExtractor const extractor{host, CALLER};
    auto const res = extractor.extract(COLLECTION, std::nullopt);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().base_uri, "");
}

TEST(MetadataExtractor, name_is_required)
{
    CollectionTestHost host;
    host.respond(SYMBOL_SELECTOR, abi_string("EVA"));

    MetadataExtractor const extractor{host, CALLER};
    auto const res = extractor.extract(COLLECTION, std::nullopt);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ExternalCallError::CallFailed);
}

TEST(MetadataExtractor, undecodable_symbol)
{
    CollectionTestHost host;
    host.respond(NAME_SELECTOR, abi_string("Everai"));
    host.respond(SYMBOL_SELECTOR, byte_string(7, 0x41));

    MetadataExtractor const extractor{host, CALLER};
    auto const res = extractor.extract(COLLECTION, std::nullopt);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ExternalCallError::InvalidResponse);
}

TEST(MetadataExtractor, token_uri_fallbacks)
{
    CollectionTestHost host;
    respond_name_and_symbol(host);
    host.respond(TOKEN_URI_SELECTOR, 1, abi_string("ipfs://token/1"));
    host.respond(URI_SELECTOR, 2, abi_string("ipfs://multi/2"));
    // token 3 answers tokenURI with garbage and uri with a packed value
    host.respond(TOKEN_URI_SELECTOR, 3, byte_string(5, 0xff));
    host.respond(URI_SELECTOR, 3, short_value(0x6f6b_u256));

    std::vector<uint256_t> const ids{1, 2, 3, 4};
    MetadataExtractor const extractor{host, CALLER};
    auto const res =
        extractor.extract(COLLECTION, std::span<uint256_t const>{ids});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(
        res.value().token_uris,
        (std::vector<std::string>{
            "ipfs://token/1", "ipfs://multi/2", "ok", ""}));
}

TEST(MetadataExtractor, token_uri_probes_in_order)
{
    CollectionTestHost host;
    host.respond(TOKEN_URI_SELECTOR, 9, abi_string("first"));
    host.respond(URI_SELECTOR, 9, abi_string("second"));

    MetadataExtractor const extractor{host, CALLER};
    EXPECT_EQ(extractor.token_uri(COLLECTION, 9), "first");
    EXPECT_EQ(host.calls.size(), 1);

    EXPECT_FALSE(extractor.token_uri(COLLECTION, 10).has_value());
    EXPECT_EQ(host.calls.size(), 1 + TOKEN_URI_ENTRY_POINTS.size());
}
