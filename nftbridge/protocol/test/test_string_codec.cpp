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

#include <nftbridge/protocol/decode_error.hpp>
#include <nftbridge/protocol/string_codec.hpp>
#include <nftbridge/protocol/word.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <string>
#include <vector>

using namespace nftbridge;
using namespace intx::literals;

namespace
{
    std::vector<Word> encode(std::string const &s)
    {
        std::vector<Word> out;
        encode_string(out, s);
        return out;
    }
}

TEST(StringCodec, word_counts)
{
    EXPECT_EQ(string_word_count(0), 2);
    EXPECT_EQ(string_word_count(1), 2);
    EXPECT_EQ(string_word_count(32), 2);
    EXPECT_EQ(string_word_count(33), 3);
    EXPECT_EQ(string_word_count(64), 3);
    EXPECT_EQ(string_word_count(65), 4);
    EXPECT_EQ(string_word_count(170), 7);
}

TEST(StringCodec, short_string_is_right_aligned)
{
    auto const words = encode("abc");
    ASSERT_EQ(words.size(), 2);
    EXPECT_EQ(words[0], 3);
    EXPECT_EQ(words[1], 0x616263_u256);
}

TEST(StringCodec, empty_string_takes_one_payload_word)
{
    auto const words = encode("");
    ASSERT_EQ(words.size(), 2);
    EXPECT_EQ(words[0], 0);
    EXPECT_EQ(words[1], 0);

    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "");
    EXPECT_TRUE(enc.empty());
}

TEST(StringCodec, long_string_splits_into_chunks)
{
    std::string const s(40, 'x');
    auto const words = encode(s);
    ASSERT_EQ(words.size(), 3);
    EXPECT_EQ(words[0], 40);
    EXPECT_EQ(words[1], pack_short_string(std::string(32, 'x')));
    EXPECT_EQ(words[2], pack_short_string(std::string(8, 'x')));

    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), s);
    EXPECT_TRUE(enc.empty());
}

TEST(StringCodec, exact_multiple_of_word)
{
    std::string s;
    for (int i = 0; i < 64; ++i) {
        s.push_back(static_cast<char>('a' + i % 26));
    }
    auto const words = encode(s);
    ASSERT_EQ(words.size(), 3);

    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), s);
}

TEST(StringCodec, decode_leaves_trailing_words)
{
    auto words = encode("name");
    words.push_back(99);
    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "name");
    ASSERT_EQ(enc.size(), 1);
    EXPECT_EQ(enc[0], 99);
}

TEST(StringCodec, length_beyond_input)
{
    std::vector<Word> const words{100, 0x61_u256};
    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), DecodeError::InputTooShort);
}

TEST(StringCodec, huge_length_is_truncation)
{
    std::vector<Word> const words{~0_u256, 0};
    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), DecodeError::InputTooShort);
}

TEST(StringCodec, missing_payload_word)
{
    std::vector<Word> const words{0};
    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), DecodeError::InputTooShort);
}

TEST(StringCodec, payload_wider_than_length)
{
    std::vector<Word> const words{1, 0x6162_u256};
    word_span enc{words};
    auto const decoded = decode_string(enc);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), DecodeError::InvalidString);
}
