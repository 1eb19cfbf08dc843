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

#include <nftbridge/collection/collection_bridge.hpp>
#include <nftbridge/core/config.hpp>

#include <boost/outcome/try.hpp>

NFTBRIDGE_NAMESPACE_BEGIN

Result<L2Address> bind_or_deploy_collection(
    CollectionBindings &bindings, evmc::HostInterface &host,
    CollectionTemplate const &tmpl, Address const &controller,
    Request const &request, uint256_t const &salt_seed)
{
    BOOST_OUTCOME_TRY(
        auto const bound,
        bindings.resolve(request.collection_l1, request.collection_l2));
    if (bound.has_value()) {
        return *bound;
    }

    BOOST_OUTCOME_TRY(
        auto const deployed,
        deploy_bridgeable_collection(
            host, tmpl, salt_seed, request.name, request.symbol, controller));
    auto const l2 = to_l2_address(deployed);
    BOOST_OUTCOME_TRY(bindings.bind(request.collection_l1, l2));
    return l2;
}

NFTBRIDGE_NAMESPACE_END
