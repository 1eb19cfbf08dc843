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
#include <nftbridge/core/int.hpp>
#include <nftbridge/protocol/request_hash.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <vector>

using namespace nftbridge;
using namespace evmc::literals;
using namespace intx::literals;

TEST(RequestHash, regression_vector)
{
    std::vector<uint256_t> const ids{88};
    EXPECT_EQ(
        compute_request_hash(123, Address{}, L2Address{1}, ids),
        0xbb7ca67ee263bd2bb68dc88b530300222a3700bceca4e537079047fff89a0402_u256);
}

TEST(RequestHash, deterministic)
{
    std::vector<uint256_t> const ids{1, 2, 3};
    auto const l1 = 0x00000000000000000000000000000000deadbeef_address;
    EXPECT_EQ(
        compute_request_hash(7, l1, L2Address{42}, ids),
        compute_request_hash(7, l1, L2Address{42}, ids));
}

TEST(RequestHash, order_sensitive)
{
    std::vector<uint256_t> const forward{1, 2};
    std::vector<uint256_t> const reverse{2, 1};
    EXPECT_NE(
        compute_request_hash(1, Address{}, L2Address{1}, forward),
        compute_request_hash(1, Address{}, L2Address{1}, reverse));
}

TEST(RequestHash, every_input_contributes)
{
    std::vector<uint256_t> const ids{88};
    auto const base = compute_request_hash(123, Address{}, L2Address{1}, ids);
    EXPECT_NE(base, compute_request_hash(124, Address{}, L2Address{1}, ids));
    EXPECT_NE(
        base,
        compute_request_hash(
            123,
            0x0000000000000000000000000000000000000001_address,
            L2Address{1},
            ids));
    EXPECT_NE(base, compute_request_hash(123, Address{}, L2Address{2}, ids));
    std::vector<uint256_t> const more{88, 89};
    EXPECT_NE(base, compute_request_hash(123, Address{}, L2Address{1}, more));
}
