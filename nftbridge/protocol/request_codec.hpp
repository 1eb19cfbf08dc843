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
#include <nftbridge/protocol/request.hpp>
#include <nftbridge/protocol/word.hpp>

#include <cstddef>
#include <vector>

NFTBRIDGE_NAMESPACE_BEGIN

// Checks that a request decodes back to itself once put on the wire: the
// protocol version, the L2 address range, a present collection_l2 being
// nonzero, and the array alignment invariants.
Result<void> validate_request_shape(Request const &);

// Number of words serialize_request produces, computed without encoding
size_t serialized_length(Request const &);

Result<std::vector<Word>> serialize_request(Request const &);

struct DecodedRequest
{
    Request request;
    size_t next_offset;
};

// Decodes the request starting at `offset`. next_offset points just past the
// consumed words so several requests can share one envelope.
Result<DecodedRequest> deserialize_request(word_span words, size_t offset);

// Consumes one request from the front of `enc`
Result<Request> decode_request(word_span &enc);

// Decodes consecutive requests until the stream is exhausted
Result<std::vector<Request>> deserialize_request_batch(word_span words);

NFTBRIDGE_NAMESPACE_END
