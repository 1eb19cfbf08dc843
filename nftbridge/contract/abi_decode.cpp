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

#include <nftbridge/contract/abi_decode.hpp>
#include <nftbridge/contract/abi_decode_error.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/likely.h>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <string>

NFTBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t WORD_SIZE = 32;

std::string trim_zero_bytes(byte_string_view bytes)
{
    while (!bytes.empty() && bytes.front() == 0) {
        bytes.remove_prefix(1);
    }
    while (!bytes.empty() && bytes.back() == 0) {
        bytes.remove_suffix(1);
    }
    return std::string{bytes.begin(), bytes.end()};
}

// Right aligned packing: the leading zero bytes are padding
std::string unpack_word(byte_string_view word)
{
    while (!word.empty() && word.front() == 0) {
        word.remove_prefix(1);
    }
    return std::string{word.begin(), word.end()};
}

Result<std::string> decode_word_run(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const count, abi_decode_uint(enc));
    if (NFTBRIDGE_UNLIKELY(count != enc.size() / WORD_SIZE)) {
        return AbiDecodeError::LengthMismatch;
    }
    if (NFTBRIDGE_UNLIKELY(enc.size() % WORD_SIZE != 0)) {
        return AbiDecodeError::InvalidPadding;
    }

    std::string output;
    while (!enc.empty()) {
        output += unpack_word(enc.substr(0, WORD_SIZE));
        enc.remove_prefix(WORD_SIZE);
    }
    return output;
}

NFTBRIDGE_ANONYMOUS_NAMESPACE_END

NFTBRIDGE_NAMESPACE_BEGIN

Result<uint256_t> abi_decode_uint(byte_string_view &enc)
{
    if (NFTBRIDGE_UNLIKELY(enc.size() < WORD_SIZE)) {
        return AbiDecodeError::InputTooShort;
    }
    auto const output = intx::be::unsafe::load<uint256_t>(enc.data());
    enc.remove_prefix(WORD_SIZE);
    return output;
}

Result<std::string> abi_decode_string(byte_string_view const enc)
{
    byte_string_view head = enc;
    BOOST_OUTCOME_TRY(auto const offset, abi_decode_uint(head));
    if (NFTBRIDGE_UNLIKELY(
            offset < WORD_SIZE || offset > enc.size() - WORD_SIZE ||
            offset % WORD_SIZE != 0)) {
        return AbiDecodeError::InvalidOffset;
    }

    byte_string_view tail = enc.substr(static_cast<size_t>(offset));
    BOOST_OUTCOME_TRY(auto const length, abi_decode_uint(tail));
    if (NFTBRIDGE_UNLIKELY(length > tail.size())) {
        return AbiDecodeError::InputTooShort;
    }

    auto const n = static_cast<size_t>(length);
    size_t const padded = (n + WORD_SIZE - 1) / WORD_SIZE * WORD_SIZE;
    if (NFTBRIDGE_UNLIKELY(tail.size() < padded)) {
        return AbiDecodeError::InputTooShort;
    }
    auto const padding = tail.substr(n, padded - n);
    if (NFTBRIDGE_UNLIKELY(!std::ranges::all_of(
            padding, [](auto const b) { return b == 0; }))) {
        return AbiDecodeError::InvalidPadding;
    }

    return std::string{tail.begin(), tail.begin() + static_cast<long>(n)};
}

Result<std::string> decode_string_response(byte_string_view const enc)
{
    if (enc.size() == WORD_SIZE) {
        return trim_zero_bytes(enc);
    }
    if (NFTBRIDGE_UNLIKELY(enc.size() < WORD_SIZE)) {
        return AbiDecodeError::InputTooShort;
    }

    auto abi = abi_decode_string(enc);
    if (abi.has_value()) {
        return abi;
    }
    auto run = decode_word_run(enc);
    if (run.has_value()) {
        return run;
    }
    return abi;
}

NFTBRIDGE_NAMESPACE_END
