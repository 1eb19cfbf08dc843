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
#include <nftbridge/protocol/request_header.hpp>

#include <optional>
#include <string>
#include <vector>

NFTBRIDGE_NAMESPACE_BEGIN

// One cross-chain transfer of tokens of a single collection.
//
// token_values, token_uris and new_owners are each either empty or exactly
// as long as token_ids. token_values is only meaningful for multi supply
// collections.
struct Request
{
    RequestHeader header;
    uint256_t hash;

    Address collection_l1;
    // absent until the collection is bound on L2
    std::optional<L2Address> collection_l2;

    Address owner_l1;
    L2Address owner_l2;

    std::string name;
    std::string symbol;
    std::string uri;

    std::vector<uint256_t> token_ids;
    std::vector<uint256_t> token_values;
    std::vector<std::string> token_uris;
    std::vector<L2Address> new_owners;

    friend bool operator==(Request const &, Request const &) = default;
};

NFTBRIDGE_NAMESPACE_END
