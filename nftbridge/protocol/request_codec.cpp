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
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/likely.h>
#include <nftbridge/protocol/decode_error.hpp>
#include <nftbridge/protocol/request_codec.hpp>
#include <nftbridge/protocol/request_header.hpp>
#include <nftbridge/protocol/string_codec.hpp>
#include <nftbridge/protocol/validation_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

NFTBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

// header, hash, collection_l1, collection_l2, owner_l1, owner_l2
constexpr size_t FIXED_WORDS = 6;

template <class T>
constexpr bool aligned_with(std::vector<T> const &v, size_t const n)
{
    return v.empty() || v.size() == n;
}

// Alignment rules shared by the encoder and the decoder; each side maps a
// violation to its own error domain.
enum class Shape
{
    Ok,
    Misaligned,
    UnexpectedValues,
};

// Words the decoder would reject or read back differently.
bool encodable_l2_addresses(Request const &r)
{
    if (!is_valid_l2_address(r.owner_l2.value)) {
        return false;
    }
    if (r.collection_l2.has_value() &&
        !is_valid_l2_address(r.collection_l2->value)) {
        return false;
    }
    for (auto const &owner : r.new_owners) {
        if (!is_valid_l2_address(owner.value)) {
            return false;
        }
    }
    return true;
}

Shape check_shape(Request const &r)
{
    size_t const n = r.token_ids.size();
    if (!aligned_with(r.token_values, n) || !aligned_with(r.token_uris, n) ||
        !aligned_with(r.new_owners, n)) {
        return Shape::Misaligned;
    }
    if (r.header.kind == CollectionKind::Erc721 && !r.token_values.empty()) {
        return Shape::UnexpectedValues;
    }
    return Shape::Ok;
}

// Each array element takes at least one word, so a count above the remaining
// word count can never be satisfied.
Result<size_t> decode_count(word_span &enc)
{
    BOOST_OUTCOME_TRY(auto const count, decode_word(enc));
    if (NFTBRIDGE_UNLIKELY(count > enc.size())) {
        return DecodeError::InputTooShort;
    }
    return static_cast<size_t>(count);
}

Result<std::vector<uint256_t>> decode_uint_array(word_span &enc)
{
    BOOST_OUTCOME_TRY(auto const count, decode_count(enc));
    std::vector<uint256_t> values(enc.begin(), enc.begin() + count);
    enc = enc.subspan(count);
    return values;
}

Result<std::vector<std::string>> decode_string_array(word_span &enc)
{
    BOOST_OUTCOME_TRY(auto const count, decode_count(enc));
    std::vector<std::string> strings;
    strings.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(auto s, decode_string(enc));
        strings.emplace_back(std::move(s));
    }
    return strings;
}

Result<std::vector<L2Address>> decode_l2_address_array(word_span &enc)
{
    BOOST_OUTCOME_TRY(auto const count, decode_count(enc));
    std::vector<L2Address> addresses;
    addresses.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(auto const address, word_to_l2_address(enc[i]));
        addresses.push_back(address);
    }
    enc = enc.subspan(count);
    return addresses;
}

Result<Address> decode_address(word_span &enc)
{
    BOOST_OUTCOME_TRY(auto const word, decode_word(enc));
    return word_to_address(word);
}

Result<L2Address> decode_l2_address(word_span &enc)
{
    BOOST_OUTCOME_TRY(auto const word, decode_word(enc));
    return word_to_l2_address(word);
}

template <class T, class F>
void encode_array(std::vector<Word> &out, std::vector<T> const &v, F &&f)
{
    out.emplace_back(v.size());
    for (auto const &e : v) {
        f(e);
    }
}

NFTBRIDGE_ANONYMOUS_NAMESPACE_END

NFTBRIDGE_NAMESPACE_BEGIN

Result<void> validate_request_shape(Request const &request)
{
    if (NFTBRIDGE_UNLIKELY(
            request.header.version != REQUEST_PROTOCOL_VERSION)) {
        return ValidationError::UnsupportedVersion;
    }
    if (NFTBRIDGE_UNLIKELY(!encodable_l2_addresses(request))) {
        return ValidationError::L2AddressOutOfRange;
    }
    // zero on the wire means unset
    if (NFTBRIDGE_UNLIKELY(
            request.collection_l2.has_value() &&
            request.collection_l2->is_zero())) {
        return ValidationError::ZeroCollectionL2;
    }
    switch (check_shape(request)) {
    case Shape::Misaligned:
        return ValidationError::MisalignedTokenArrays;
    case Shape::UnexpectedValues:
        return ValidationError::UnexpectedTokenValues;
    case Shape::Ok:
        break;
    }
    return outcome::success();
}

size_t serialized_length(Request const &request)
{
    size_t n = FIXED_WORDS;
    n += string_word_count(request.name.size());
    n += string_word_count(request.symbol.size());
    n += string_word_count(request.uri.size());
    n += 1 + request.token_ids.size();
    n += 1 + request.token_values.size();
    n += 1;
    for (auto const &uri : request.token_uris) {
        n += string_word_count(uri.size());
    }
    n += 1 + request.new_owners.size();
    return n;
}

Result<std::vector<Word>> serialize_request(Request const &request)
{
    BOOST_OUTCOME_TRY(validate_request_shape(request));

    std::vector<Word> out;
    out.reserve(serialized_length(request));

    out.push_back(encode_request_header(request.header));
    out.push_back(request.hash);
    out.push_back(to_word(request.collection_l1));
    out.push_back(
        request.collection_l2.has_value() ? to_word(*request.collection_l2)
                                          : Word{0});
    out.push_back(to_word(request.owner_l1));
    out.push_back(to_word(request.owner_l2));

    encode_string(out, request.name);
    encode_string(out, request.symbol);
    encode_string(out, request.uri);

    encode_array(out, request.token_ids, [&](uint256_t const &id) {
        out.push_back(id);
    });
    encode_array(out, request.token_values, [&](uint256_t const &value) {
        out.push_back(value);
    });
    encode_array(out, request.token_uris, [&](std::string const &uri) {
        encode_string(out, uri);
    });
    encode_array(out, request.new_owners, [&](L2Address const &owner) {
        out.push_back(to_word(owner));
    });

    return out;
}

Result<Request> decode_request(word_span &enc)
{
    Request request;

    BOOST_OUTCOME_TRY(auto const header_word, decode_word(enc));
    BOOST_OUTCOME_TRY(request.header, decode_request_header(header_word));
    BOOST_OUTCOME_TRY(request.hash, decode_word(enc));
    BOOST_OUTCOME_TRY(request.collection_l1, decode_address(enc));
    BOOST_OUTCOME_TRY(auto const collection_l2, decode_l2_address(enc));
    if (!collection_l2.is_zero()) {
        request.collection_l2 = collection_l2;
    }
    BOOST_OUTCOME_TRY(request.owner_l1, decode_address(enc));
    BOOST_OUTCOME_TRY(request.owner_l2, decode_l2_address(enc));

    BOOST_OUTCOME_TRY(request.name, decode_string(enc));
    BOOST_OUTCOME_TRY(request.symbol, decode_string(enc));
    BOOST_OUTCOME_TRY(request.uri, decode_string(enc));

    BOOST_OUTCOME_TRY(request.token_ids, decode_uint_array(enc));
    BOOST_OUTCOME_TRY(request.token_values, decode_uint_array(enc));
    BOOST_OUTCOME_TRY(request.token_uris, decode_string_array(enc));
    BOOST_OUTCOME_TRY(request.new_owners, decode_l2_address_array(enc));

    if (NFTBRIDGE_UNLIKELY(check_shape(request) != Shape::Ok)) {
        return DecodeError::ArrayLengthUnexpected;
    }

    return request;
}

Result<DecodedRequest>
deserialize_request(word_span const words, size_t const offset)
{
    if (NFTBRIDGE_UNLIKELY(offset > words.size())) {
        return DecodeError::InputTooShort;
    }

    word_span enc = words.subspan(offset);
    BOOST_OUTCOME_TRY(auto request, decode_request(enc));
    return DecodedRequest{
        .request = std::move(request),
        .next_offset = words.size() - enc.size()};
}

Result<std::vector<Request>> deserialize_request_batch(word_span const words)
{
    std::vector<Request> requests;
    word_span enc = words;
    while (!enc.empty()) {
        BOOST_OUTCOME_TRY(auto request, decode_request(enc));
        requests.emplace_back(std::move(request));
    }
    return requests;
}

NFTBRIDGE_NAMESPACE_END
