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

#include <nftbridge/contract/abi_encode.hpp>
#include <nftbridge/contract/abi_selectors.hpp>
#include <nftbridge/core/byte_string.hpp>
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/keccak.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>

using namespace nftbridge;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    uint32_t selector_of(char const *const signature)
    {
        auto const h = keccak256(to_byte_string_view(signature));
        return (uint32_t{h.bytes[0]} << 24) | (uint32_t{h.bytes[1]} << 16) |
               (uint32_t{h.bytes[2]} << 8) | uint32_t{h.bytes[3]};
    }

    uint256_t word_at(byte_string const &b, size_t const i)
    {
        return intx::be::unsafe::load<uint256_t>(&b[i * 32]);
    }
}

TEST(AbiEncode, address)
{
    auto const addr = 0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48_address;
    auto const encoded = abi_encode_address(addr);
    EXPECT_EQ(
        encoded,
        0x000000000000000000000000a0b86991c6218b36c1d19d4a2e9eb0ce3606eb48_bytes32);
}

TEST(AbiEncode, bytes_are_padded)
{
    auto const encoded = abi_encode_bytes(to_byte_string_view("hello"));
    ASSERT_EQ(encoded.size(), 64);
    EXPECT_EQ(word_at(encoded, 0), 5);
    EXPECT_EQ(encoded.substr(32, 5), to_byte_string_view("hello"));
    EXPECT_EQ(encoded.substr(37), byte_string(27, 0));

    EXPECT_EQ(abi_encode_bytes({}).size(), 32);
    EXPECT_EQ(
        abi_encode_bytes(to_byte_string_view(std::string(32, 'a'))).size(),
        64);
}

TEST(AbiEncode, constructor_arguments)
{
    auto const owner = 0x00000000000000000000000000000000000000ff_address;

    AbiEncoder encoder;
    encoder.add_string("A");
    encoder.add_string("BB");
    encoder.add_address(owner);
    encoder.add_address(owner);
    auto const encoded = encoder.encode_final();

    ASSERT_EQ(encoded.size(), 8 * 32);
    EXPECT_EQ(word_at(encoded, 0), 0x80);
    EXPECT_EQ(word_at(encoded, 1), 0xc0);
    EXPECT_EQ(word_at(encoded, 2), 0xff);
    EXPECT_EQ(word_at(encoded, 3), 0xff);
    EXPECT_EQ(word_at(encoded, 4), 1);
    EXPECT_EQ(word_at(encoded, 5), 0x41_u256 << 248);
    EXPECT_EQ(word_at(encoded, 6), 2);
    EXPECT_EQ(word_at(encoded, 7), 0x4242_u256 << 240);
}

TEST(AbiEncode, call_data)
{
    auto const name = abi_encode_call(NAME_SELECTOR);
    EXPECT_EQ(name, (byte_string{0x06, 0xfd, 0xde, 0x03}));

    auto const token_uri = abi_encode_call(TOKEN_URI_SELECTOR, 7);
    ASSERT_EQ(token_uri.size(), 36);
    EXPECT_EQ(token_uri.substr(0, 4), (byte_string{0xc8, 0x7b, 0x56, 0xdd}));
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(&token_uri[4]), 7);
}

TEST(AbiEncode, selectors_match_signatures)
{
    EXPECT_EQ(NAME_SELECTOR, selector_of("name()"));
    EXPECT_EQ(SYMBOL_SELECTOR, selector_of("symbol()"));
    EXPECT_EQ(BASE_URI_SELECTOR, selector_of("baseURI()"));
    EXPECT_EQ(TOKEN_URI_SELECTOR, selector_of("tokenURI(uint256)"));
    EXPECT_EQ(URI_SELECTOR, selector_of("uri(uint256)"));
}
