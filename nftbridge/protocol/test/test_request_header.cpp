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

#include <nftbridge/core/int.hpp>
#include <nftbridge/protocol/decode_error.hpp>
#include <nftbridge/protocol/request_header.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace nftbridge;
using namespace intx::literals;

TEST(RequestHeader, known_vectors)
{
    EXPECT_EQ(
        encode_request_header(CollectionKind::Erc721, false, false),
        0x0101_u256);
    EXPECT_EQ(
        encode_request_header(CollectionKind::Erc1155, false, false),
        0x0201_u256);
    EXPECT_EQ(
        encode_request_header(CollectionKind::Erc721, true, false),
        0x010101_u256);
    EXPECT_EQ(
        encode_request_header(CollectionKind::Erc721, true, true),
        0x01010101_u256);
    EXPECT_EQ(
        encode_request_header(CollectionKind::Erc721, false, true),
        0x01000101_u256);
}

TEST(RequestHeader, round_trip_all_combinations)
{
    for (auto const kind : {CollectionKind::Erc721, CollectionKind::Erc1155}) {
        for (bool const burn_auto : {false, true}) {
            for (bool const withdraw_auto : {false, true}) {
                RequestHeader const header{
                    .version = REQUEST_PROTOCOL_VERSION,
                    .kind = kind,
                    .burn_auto = burn_auto,
                    .withdraw_auto = withdraw_auto};
                auto const word = encode_request_header(header);
                EXPECT_EQ(
                    word,
                    encode_request_header(kind, burn_auto, withdraw_auto));

                auto const decoded = decode_request_header(word);
                ASSERT_TRUE(decoded.has_value());
                EXPECT_EQ(decoded.value(), header);
                EXPECT_EQ(can_use_withdraw_auto(word), withdraw_auto);
                EXPECT_EQ(can_use_burn_auto(word), burn_auto);
            }
        }
    }
}

TEST(RequestHeader, withdraw_auto_reads_its_own_byte)
{
    EXPECT_FALSE(can_use_withdraw_auto(0x0101_u256));
    EXPECT_FALSE(can_use_withdraw_auto(0x010101_u256));
    EXPECT_TRUE(can_use_withdraw_auto(0x01010101_u256));
    EXPECT_TRUE(can_use_withdraw_auto(0x01000201_u256));
    EXPECT_FALSE(can_use_withdraw_auto(0x02000101_u256));
}

TEST(RequestHeader, unsupported_version)
{
    auto const res = decode_request_header(0x0102_u256);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::UnsupportedVersion);

    auto const zero = decode_request_header(0_u256);
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), DecodeError::UnsupportedVersion);
}

TEST(RequestHeader, unknown_collection_kind)
{
    for (auto const word : {0x0001_u256, 0x0301_u256, 0xff01_u256}) {
        auto const res = decode_request_header(word);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::UnknownCollectionKind);
    }
}

TEST(RequestHeader, invalid_flag_byte)
{
    auto const burn = decode_request_header(0x020101_u256);
    ASSERT_TRUE(burn.has_error());
    EXPECT_EQ(burn.assume_error(), DecodeError::InvalidHeader);

    auto const withdraw = decode_request_header(0x02000101_u256);
    ASSERT_TRUE(withdraw.has_error());
    EXPECT_EQ(withdraw.assume_error(), DecodeError::InvalidHeader);
}

TEST(RequestHeader, reserved_bytes_must_be_zero)
{
    auto const low = decode_request_header(0x0100000101_u256);
    ASSERT_TRUE(low.has_error());
    EXPECT_EQ(low.assume_error(), DecodeError::InvalidHeader);

    auto const high = decode_request_header((1_u256 << 255) | 0x0101_u256);
    ASSERT_TRUE(high.has_error());
    EXPECT_EQ(high.assume_error(), DecodeError::InvalidHeader);
}
