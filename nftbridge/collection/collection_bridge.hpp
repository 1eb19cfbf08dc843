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

#include <nftbridge/collection/collection_bindings.hpp>
#include <nftbridge/collection/collection_deployer.hpp>
#include <nftbridge/core/address.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/int.hpp>
#include <nftbridge/core/result.hpp>
#include <nftbridge/protocol/request.hpp>

#include <evmc/evmc.hpp>

NFTBRIDGE_NAMESPACE_BEGIN

// L2 collection that receives the tokens of `request`. An unbound collection
// is deployed from `tmpl` under the request's name and symbol and bound to
// its L1 address. Bindings are only written once deployment has succeeded.
Result<L2Address> bind_or_deploy_collection(
    CollectionBindings &, evmc::HostInterface &,
    CollectionTemplate const &tmpl, Address const &controller,
    Request const &request, uint256_t const &salt_seed);

NFTBRIDGE_NAMESPACE_END
