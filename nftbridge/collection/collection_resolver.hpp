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
#include <nftbridge/core/result.hpp>

#include <optional>

NFTBRIDGE_NAMESPACE_BEGIN

// Decides which L2 collection a request maps to, given the addresses the
// request declares and whatever binding already exists for them.
//
//   l1_req    collection_l1 of the request, must not be zero
//   l2_req    collection_l2 of the request, if declared
//   l1_bound  L1 collection currently bound to l2_req
//   l2_bound  L2 collection currently bound to l1_req
//
// Returns the bound L2 collection, or nothing when the collection has yet to
// be deployed. A declared l2_req is only ever checked against the bindings,
// never adopted as a new binding.
Result<std::optional<L2Address>> resolve_collection(
    Address const &l1_req, std::optional<L2Address> const &l2_req,
    std::optional<Address> const &l1_bound,
    std::optional<L2Address> const &l2_bound);

NFTBRIDGE_NAMESPACE_END
