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
#include <nftbridge/protocol/request.hpp>
#include <nftbridge/protocol/word.hpp>

#include <vector>

NFTBRIDGE_NAMESPACE_BEGIN

enum class BridgeChain
{
    L1,
    L2,
};

// Follow-up transactions a relay may submit without a user claim step
enum class AutoAction
{
    WithdrawAuto,
    BurnAuto,
};

std::vector<AutoAction> auto_actions(Word const &header);

// Source and destination of a request, as words so both chains' address
// widths are carried without conversion.
struct RequestRoute
{
    BridgeChain source;
    BridgeChain destination;
    Word collection_src;
    Word collection_dst;
    Word from;
    Word to;

    friend bool
    operator==(RequestRoute const &, RequestRoute const &) = default;
};

RequestRoute route_request(Request const &, BridgeChain source);

NFTBRIDGE_NAMESPACE_END
