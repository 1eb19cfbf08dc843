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

#include <nftbridge/contract/abi_decode_error.hpp>
#include <nftbridge/core/byte_string.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/core/result.hpp>

#include <string>

NFTBRIDGE_NAMESPACE_BEGIN

// Consumes one 32-byte word from the front of `enc`. Dirty high order bits
// are not an error here; callers that narrow the value check its range.
Result<uint256_t> abi_decode_uint(byte_string_view &enc);

// Strict ABI dynamic string: an offset word, then at that offset a byte
// length word followed by the zero padded data.
Result<std::string> abi_decode_string(byte_string_view enc);

// Return data of a string getter on a collection contract. Accepted shapes,
// tried in this order:
//
//   * exactly one word: a packed short value, zero bytes trimmed on both
//     ends
//   * an ABI dynamic string
//   * a word count followed by that many packed short-string words, each
//     right aligned, concatenated in order
Result<std::string> decode_string_response(byte_string_view enc);

NFTBRIDGE_NAMESPACE_END
