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

#include <cstddef>
#include <optional>
#include <unordered_map>

NFTBRIDGE_NAMESPACE_BEGIN

// Two-way association between L1 collections and their L2 counterparts. Both
// directions are always updated together.
class CollectionBindings
{
    std::unordered_map<Address, L2Address> l1_to_l2_;
    std::unordered_map<L2Address, Address> l2_to_l1_;

public:
    std::optional<L2Address> l2_for(Address const &) const;
    std::optional<Address> l1_for(L2Address const &) const;

    Result<std::optional<L2Address>>
    resolve(Address const &l1, std::optional<L2Address> const &l2) const;

    // Binding an existing pair again is a no-op; binding either side to a
    // different partner fails and leaves the store unchanged.
    Result<void> bind(Address const &l1, L2Address const &l2);

    size_t size() const
    {
        return l1_to_l2_.size();
    }
};

NFTBRIDGE_NAMESPACE_END
