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

#include <nftbridge/core/assert.h>
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/likely.h>
#include <nftbridge/protocol/decode_error.hpp>
#include <nftbridge/protocol/string_codec.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstring>
#include <string>

NFTBRIDGE_NAMESPACE_BEGIN

Word pack_short_string(std::string_view const chunk)
{
    NFTBRIDGE_ASSERT(chunk.size() <= WORD_STRING_BYTES);

    bytes32_t be{};
    std::memcpy(
        &be.bytes[WORD_STRING_BYTES - chunk.size()],
        chunk.data(),
        chunk.size());
    return from_big_endian_bytes(be);
}

Result<std::string> unpack_short_string(Word const &word, size_t const length)
{
    if (NFTBRIDGE_UNLIKELY(length > WORD_STRING_BYTES)) {
        return DecodeError::InvalidString;
    }

    bytes32_t const be = to_big_endian_bytes(word);
    size_t const pad = WORD_STRING_BYTES - length;
    // bytes above the declared length must be clear
    if (NFTBRIDGE_UNLIKELY(
            std::any_of(be.bytes, be.bytes + pad, [](uint8_t const b) {
                return b != 0;
            }))) {
        return DecodeError::InvalidString;
    }
    return std::string(reinterpret_cast<char const *>(&be.bytes[pad]), length);
}

void encode_string(std::vector<Word> &out, std::string_view const s)
{
    out.emplace_back(s.size());
    if (s.size() <= WORD_STRING_BYTES) {
        out.emplace_back(pack_short_string(s));
        return;
    }
    for (size_t i = 0; i < s.size(); i += WORD_STRING_BYTES) {
        out.emplace_back(pack_short_string(s.substr(i, WORD_STRING_BYTES)));
    }
}

Result<std::string> decode_string(word_span &enc)
{
    BOOST_OUTCOME_TRY(auto const length_word, decode_word(enc));

    // a length describing more bytes than the remaining words could carry is
    // a truncated stream, not an allocation request
    uint256_t const capacity = uint256_t{enc.size()} * WORD_STRING_BYTES;
    if (NFTBRIDGE_UNLIKELY(length_word > capacity)) {
        return DecodeError::InputTooShort;
    }

    auto const length = static_cast<size_t>(length_word);
    size_t const words = string_payload_words(length);
    if (NFTBRIDGE_UNLIKELY(words > enc.size())) {
        return DecodeError::InputTooShort;
    }

    std::string s;
    s.reserve(length);
    for (size_t i = 0; i < words; ++i) {
        size_t const chunk =
            std::min(WORD_STRING_BYTES, length - i * WORD_STRING_BYTES);
        BOOST_OUTCOME_TRY(auto const part, unpack_short_string(enc[i], chunk));
        s += part;
    }
    enc = enc.subspan(words);
    return s;
}

NFTBRIDGE_NAMESPACE_END
