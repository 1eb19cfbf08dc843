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

#include <nftbridge/core/config.hpp>
#include <nftbridge/core/result.hpp>
#include <nftbridge/protocol/word.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

NFTBRIDGE_NAMESPACE_BEGIN

// Strings are encoded as a byte-length word followed by the payload. A string
// of at most WORD_STRING_BYTES bytes (the empty string included) is inlined
// in exactly one payload word; a longer string becomes a run of
// ceil(length / WORD_STRING_BYTES) words. Every payload word carries its
// bytes big-endian and right aligned, so the final partial chunk of a run is
// packed the same way as an inlined short string.
inline constexpr size_t WORD_STRING_BYTES = 32;

constexpr size_t string_payload_words(size_t const length)
{
    if (length <= WORD_STRING_BYTES) {
        return 1;
    }
    return (length + WORD_STRING_BYTES - 1) / WORD_STRING_BYTES;
}

// Total number of words for a string of `length` bytes, length word included
constexpr size_t string_word_count(size_t const length)
{
    return 1 + string_payload_words(length);
}

Word pack_short_string(std::string_view);

Result<std::string> unpack_short_string(Word const &, size_t length);

void encode_string(std::vector<Word> &out, std::string_view);

Result<std::string> decode_string(word_span &enc);

NFTBRIDGE_NAMESPACE_END
