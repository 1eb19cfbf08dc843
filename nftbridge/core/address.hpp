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
#include <nftbridge/core/int.hpp>

#include <evmc/evmc.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>

NFTBRIDGE_NAMESPACE_BEGIN

// L1 side account or contract address
using Address = ::evmc::address;

static_assert(sizeof(Address) == 20);
static_assert(alignof(Address) == 1);

// L2 addresses are field elements; valid contract addresses are strictly
// below 2^251.
inline constexpr uint256_t L2_ADDRESS_BOUND = uint256_t{1} << 251;

// L2 side account or contract address. Kept distinct from Address so that a
// word is never silently narrowed into the wrong chain's address width.
struct L2Address
{
    uint256_t value{};

    constexpr bool is_zero() const noexcept
    {
        return value == 0;
    }

    friend constexpr bool
    operator==(L2Address const &, L2Address const &) noexcept = default;
};

constexpr bool is_valid_l2_address(uint256_t const &value) noexcept
{
    return value < L2_ADDRESS_BOUND;
}

// Widening is always lossless: any 160-bit address is a valid L2 address.
inline L2Address to_l2_address(Address const &address) noexcept
{
    uint8_t padded[32]{};
    for (size_t i = 0; i < sizeof(Address); ++i) {
        padded[12 + i] = address.bytes[i];
    }
    return L2Address{intx::be::load<uint256_t>(padded)};
}

NFTBRIDGE_NAMESPACE_END

template <>
struct std::hash<nftbridge::L2Address>
{
    size_t operator()(nftbridge::L2Address const &a) const noexcept
    {
        size_t h = 0;
        for (size_t i = 0; i < 4; ++i) {
            h ^= std::hash<uint64_t>{}(a.value[i]) + 0x9e3779b97f4a7c15ULL +
                 (h << 6) + (h >> 2);
        }
        return h;
    }
};
