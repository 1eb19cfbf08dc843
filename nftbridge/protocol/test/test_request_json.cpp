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

#include <nftbridge/core/address.hpp>
#include <nftbridge/protocol/request.hpp>
#include <nftbridge/protocol/request_header.hpp>
#include <nftbridge/protocol/request_json.hpp>
#include <nftbridge/protocol/word.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

using namespace nftbridge;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    Request make_request()
    {
        Request r;
        r.header.kind = CollectionKind::Erc1155;
        r.header.withdraw_auto = true;
        r.hash =
            0xbb7ca67ee263bd2bb68dc88b530300222a3700bceca4e537079047fff89a0402_u256;
        r.collection_l1 = 0x5fbdb2315678afecb367f032d93f642f64180aa3_address;
        r.collection_l2 = L2Address{0x1234_u256};
        r.owner_l1 = 0xe7f1725e7734ce288f8367e1bb143e90bb3f0512_address;
        r.owner_l2 = L2Address{0xabcd_u256};
        r.name = "name";
        r.symbol = "SYM";
        r.token_ids = {1, 2};
        r.token_values = {5, 6};
        r.token_uris = {"ipfs://1", "ipfs://2"};
        r.new_owners = {L2Address{7}, L2Address{8}};
        return r;
    }
}

TEST(RequestJson, field_formats)
{
    auto const json = to_json(make_request());
    EXPECT_EQ(json["header"]["kind"], "erc1155");
    EXPECT_EQ(json["header"]["withdraw_auto"], true);
    EXPECT_EQ(json["header"]["burn_auto"], false);
    EXPECT_EQ(
        json["hash"],
        "0xbb7ca67ee263bd2bb68dc88b530300222a3700bceca4e537079047fff89a0402");
    EXPECT_EQ(
        json["collection_l1"], "0x5fbdb2315678afecb367f032d93f642f64180aa3");
    EXPECT_EQ(json["collection_l2"], "0x1234");
    EXPECT_EQ(json["owner_l2"], "0xabcd");
    EXPECT_EQ(json["symbol"], "SYM");
    ASSERT_EQ(json["token_ids"].size(), 2);
    EXPECT_EQ(
        json["token_ids"][1],
        "0x0000000000000000000000000000000000000000000000000000000000000002");
    EXPECT_EQ(json["token_uris"][0], "ipfs://1");
    EXPECT_EQ(json["new_owners"][1], "0x8");
}

TEST(RequestJson, unbound_collection_is_null)
{
    Request r = make_request();
    r.collection_l2.reset();
    auto const json = to_json(r);
    EXPECT_TRUE(json["collection_l2"].is_null());
    EXPECT_EQ(request_from_json(json), r);
}

TEST(RequestJson, round_trip)
{
    Request const r = make_request();
    EXPECT_EQ(request_from_json(to_json(r)), r);
    EXPECT_EQ(request_from_json(nlohmann::json::parse(to_json(r).dump())), r);
}

TEST(RequestJson, rejects_out_of_range_l2_address)
{
    auto json = to_json(make_request());
    json["owner_l2"] =
        "0x0800000000000000000000000000000000000000000000000000000000000000";
    EXPECT_THROW(request_from_json(json), std::invalid_argument);
}

TEST(RequestJson, rejects_unknown_kind)
{
    auto json = to_json(make_request());
    json["header"]["kind"] = "erc20";
    EXPECT_THROW(request_from_json(json), std::invalid_argument);
}

TEST(RequestJson, rejects_version_out_of_byte_range)
{
    auto json = to_json(make_request());
    json["header"]["version"] = 300;
    EXPECT_THROW(request_from_json(json), std::invalid_argument);

    json["header"]["version"] = -1;
    EXPECT_THROW(request_from_json(json), std::invalid_argument);

    json["header"]["version"] = 2;
    EXPECT_EQ(request_from_json(json).header.version, 2);
}

TEST(RequestJson, rejects_malformed_address)
{
    auto json = to_json(make_request());
    json["collection_l1"] = "0xnot-an-address";
    EXPECT_THROW(request_from_json(json), std::invalid_argument);
}

TEST(RequestJson, missing_field)
{
    auto json = to_json(make_request());
    json.erase("hash");
    EXPECT_THROW(request_from_json(json), nlohmann::json::exception);
}
