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

#include <span>

NFTBRIDGE_NAMESPACE_BEGIN

// Identity of a transfer: keccak256 over the 32-byte big-endian words
//
//   sequence || collection_l1 (zero padded) || collection_l2 || token_ids...
//
// Only the binding fields are covered; descriptive strings are informational
// and may differ between two encodings of the same transfer.
uint256_t compute_request_hash(
    uint256_t const &sequence, Address const &collection_l1,
    L2Address const &collection_l2, std::span<uint256_t const> token_ids);

NFTBRIDGE_NAMESPACE_END
