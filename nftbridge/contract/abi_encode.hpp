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

#include <nftbridge/core/byte_string.hpp>
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/core/address.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <utility>
#include <vector>

NFTBRIDGE_NAMESPACE_BEGIN

// Helpers for encoding call data and constructor arguments in the solidity
// ABI.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

inline bytes32_t abi_encode_uint(uint256_t const &i)
{
    return to_big_endian_bytes(i);
}

inline byte_string abi_encode_bytes(byte_string_view const input)
{
    byte_string output;
    size_t const padding = (32 - input.size() % 32) % 32;
    auto const size = abi_encode_uint(input.size());
    output.append(size.bytes, sizeof(size.bytes));
    output += input;
    output.append(padding, 0);
    return output;
}

// Encodes a tuple
//  * static types : Have size <= 32 are padded out and added to the "head".
//  * dynamic types: size > 32. The "head" stores the offset in the tail, and
//                   the actual data is stored in the tail.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#formal-specification-of-the-encoding
class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(bytes32_t const &data)
    {
        head_.append(data.bytes, sizeof(data.bytes));
    }

    void add_dynamic(byte_string const &data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        head_.append(sizeof(bytes32_t), 0);
        tail_ += data;
    }

public:
    void add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
    }

    void add_uint(uint256_t const &i)
    {
        add_static(abi_encode_uint(i));
    }

    void add_string(std::string_view const s)
    {
        add_dynamic(abi_encode_bytes(to_byte_string_view(s)));
    }

    byte_string encode_final()
    {
        for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
            auto const encoded = abi_encode_uint(head_.size() + tail_cumsum);
            std::memcpy(&head_[unresolved], encoded.bytes, sizeof(bytes32_t));
        }

        return std::move(head_) + std::move(tail_);
    }
};

// Call data for a function taking no arguments
inline byte_string abi_encode_call(uint32_t const selector)
{
    byte_string output(4, 0);
    output[0] = static_cast<uint8_t>(selector >> 24);
    output[1] = static_cast<uint8_t>(selector >> 16);
    output[2] = static_cast<uint8_t>(selector >> 8);
    output[3] = static_cast<uint8_t>(selector);
    return output;
}

// Call data for a function taking a single uint256
inline byte_string
abi_encode_call(uint32_t const selector, uint256_t const &arg)
{
    auto output = abi_encode_call(selector);
    auto const encoded = abi_encode_uint(arg);
    output.append(encoded.bytes, sizeof(encoded.bytes));
    return output;
}

NFTBRIDGE_NAMESPACE_END
