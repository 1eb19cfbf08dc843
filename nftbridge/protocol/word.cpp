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
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/likely.h>
#include <nftbridge/protocol/decode_error.hpp>
#include <nftbridge/protocol/word.hpp>

#include <cstring>
#include <string>

NFTBRIDGE_NAMESPACE_BEGIN

Word to_word(Address const &address)
{
    return to_l2_address(address).value;
}

Result<Address> word_to_address(Word const &word)
{
    if (NFTBRIDGE_UNLIKELY((word >> 160) != 0)) {
        return DecodeError::AddressOverflow;
    }
    bytes32_t const be = to_big_endian_bytes(word);
    Address address{};
    std::memcpy(address.bytes, &be.bytes[12], sizeof(Address));
    return address;
}

Result<L2Address> word_to_l2_address(Word const &word)
{
    if (NFTBRIDGE_UNLIKELY(!is_valid_l2_address(word))) {
        return DecodeError::AddressOverflow;
    }
    return L2Address{word};
}

Result<Word> decode_word(word_span &enc)
{
    if (NFTBRIDGE_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }
    Word const word = enc.front();
    enc = enc.subspan(1);
    return word;
}

std::string to_hex_word(Word const &word)
{
    std::string const digits = intx::hex(word);
    return "0x" + std::string(64 - digits.size(), '0') + digits;
}

NFTBRIDGE_NAMESPACE_END
