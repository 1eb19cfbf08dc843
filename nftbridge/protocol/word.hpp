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
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/core/result.hpp>

#include <span>
#include <string>

NFTBRIDGE_NAMESPACE_BEGIN

// Wire unit of the request protocol. Wide enough for a 256-bit hash and for
// either chain's address without truncation.
using Word = uint256_t;

using word_span = std::span<Word const>;

Word to_word(Address const &);

inline Word to_word(L2Address const &address)
{
    return address.value;
}

// Narrowing conversions refuse any word whose value does not fit the
// address width of the target chain.
Result<Address> word_to_address(Word const &);
Result<L2Address> word_to_l2_address(Word const &);

// Consumes one word from the front of `enc`
Result<Word> decode_word(word_span &enc);

// "0x" followed by exactly 64 lowercase hex digits
std::string to_hex_word(Word const &);

NFTBRIDGE_NAMESPACE_END
