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

#include <nftbridge/core/byte_string.hpp>
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/keccak.hpp>
#include <nftbridge/protocol/request_hash.hpp>
#include <nftbridge/protocol/word.hpp>

NFTBRIDGE_NAMESPACE_BEGIN

uint256_t compute_request_hash(
    uint256_t const &sequence, Address const &collection_l1,
    L2Address const &collection_l2, std::span<uint256_t const> const token_ids)
{
    byte_string preimage;
    preimage.reserve((3 + token_ids.size()) * sizeof(bytes32_t));

    auto const append = [&preimage](Word const &word) {
        bytes32_t const be = to_big_endian_bytes(word);
        preimage.append(be.bytes, sizeof(be.bytes));
    };

    append(sequence);
    append(to_word(collection_l1));
    append(to_word(collection_l2));
    for (auto const &id : token_ids) {
        append(id);
    }

    return from_big_endian_bytes(to_bytes(keccak256(preimage)));
}

NFTBRIDGE_NAMESPACE_END
