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

#include <nftbridge/collection/collection_resolver.hpp>
#include <nftbridge/core/address.hpp>
#include <nftbridge/protocol/validation_error.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <optional>

using namespace nftbridge;
using namespace evmc::literals;

namespace
{
    constexpr auto L1 = 0x00000000000000000000000000000000000000a1_address;
    constexpr auto OTHER_L1 =
        0x00000000000000000000000000000000000000b1_address;
    L2Address const L2{0xa2};
    L2Address const OTHER_L2{0xb2};
}

TEST(CollectionResolver, missing_l1_address)
{
    auto const res =
        resolve_collection(Address{}, L2, std::nullopt, std::nullopt);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ValidationError::MissingL1Address);
}

TEST(CollectionResolver, unbound_without_declared_l2)
{
    auto const res =
        resolve_collection(L1, std::nullopt, std::nullopt, std::nullopt);
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res.value().has_value());
}

TEST(CollectionResolver, bound_without_declared_l2)
{
    auto const res = resolve_collection(L1, std::nullopt, std::nullopt, L2);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), L2);
}

TEST(CollectionResolver, declared_and_consistent)
{
    auto const res = resolve_collection(L1, L2, L1, L2);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), L2);
}

TEST(CollectionResolver, declared_but_unbound_is_not_adopted)
{
    auto const res = resolve_collection(L1, L2, std::nullopt, std::nullopt);
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res.value().has_value());
}

TEST(CollectionResolver, l2_mismatch)
{
    auto const res = resolve_collection(L1, OTHER_L2, std::nullopt, L2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ValidationError::L2AddressMismatch);
}

TEST(CollectionResolver, l1_mismatch)
{
    auto const res = resolve_collection(L1, L2, OTHER_L1, std::nullopt);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ValidationError::L1AddressMismatch);
}

TEST(CollectionResolver, l2_mismatch_checked_first)
{
    auto const res = resolve_collection(L1, OTHER_L2, OTHER_L1, L2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ValidationError::L2AddressMismatch);
}
