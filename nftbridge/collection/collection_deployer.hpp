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
#include <nftbridge/core/byte_string.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/core/result.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <string_view>

NFTBRIDGE_NAMESPACE_BEGIN

// Creation bytecode of the bridgeable collection contract, without
// constructor arguments
struct CollectionTemplate
{
    byte_string init_code{};
    int64_t gas{10'000'000};
};

// Template code followed by the ABI encoded constructor arguments
// (string name, string symbol, address bridge, address owner). The
// controller acts as both bridge and owner.
byte_string bridgeable_collection_init_code(
    CollectionTemplate const &, std::string_view name, std::string_view symbol,
    Address const &controller);

// Address the collection lands at when `controller` deploys it with
// CREATE2. Pure in its inputs.
Address bridgeable_collection_address(
    CollectionTemplate const &, uint256_t const &salt_seed,
    std::string_view name, std::string_view symbol,
    Address const &controller);

// Issues exactly one CREATE2 through the host. Any failure is final.
Result<Address> deploy_bridgeable_collection(
    evmc::HostInterface &, CollectionTemplate const &,
    uint256_t const &salt_seed, std::string_view name,
    std::string_view symbol, Address const &controller);

NFTBRIDGE_NAMESPACE_END
