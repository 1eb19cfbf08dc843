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

#include <nftbridge/core/config.hpp>
#include <nftbridge/protocol/request_header.hpp>
#include <nftbridge/protocol/request_route.hpp>

#include <vector>

NFTBRIDGE_NAMESPACE_BEGIN

std::vector<AutoAction> auto_actions(Word const &header)
{
    std::vector<AutoAction> actions;
    if (can_use_withdraw_auto(header)) {
        actions.push_back(AutoAction::WithdrawAuto);
    }
    if (can_use_burn_auto(header)) {
        actions.push_back(AutoAction::BurnAuto);
    }
    return actions;
}

RequestRoute route_request(Request const &request, BridgeChain const source)
{
    Word const collection_l1 = to_word(request.collection_l1);
    Word const collection_l2 =
        request.collection_l2.has_value() ? to_word(*request.collection_l2)
                                          : Word{0};
    Word const owner_l1 = to_word(request.owner_l1);
    Word const owner_l2 = to_word(request.owner_l2);

    if (source == BridgeChain::L2) {
        return RequestRoute{
            .source = BridgeChain::L2,
            .destination = BridgeChain::L1,
            .collection_src = collection_l2,
            .collection_dst = collection_l1,
            .from = owner_l2,
            .to = owner_l1};
    }
    return RequestRoute{
        .source = BridgeChain::L1,
        .destination = BridgeChain::L2,
        .collection_src = collection_l1,
        .collection_dst = collection_l2,
        .from = owner_l1,
        .to = owner_l2};
}

NFTBRIDGE_NAMESPACE_END
