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

#include <nftbridge/core/byte_string.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/core/keccak.hpp>

#include <evmc/evmc.hpp>

#include <bit>
#include <cstddef>

NFTBRIDGE_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

constexpr bytes32_t to_bytes(hash256 const n) noexcept
{
    return std::bit_cast<bytes32_t>(n);
}

// Big-endian image of a 256-bit integer, the layout used on the wire and in
// every hash preimage
inline bytes32_t to_big_endian_bytes(uint256_t const &n) noexcept
{
    return intx::be::store<bytes32_t>(n);
}

inline uint256_t from_big_endian_bytes(bytes32_t const &b) noexcept
{
    return intx::be::load<uint256_t>(b);
}

NFTBRIDGE_NAMESPACE_END
