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

#include <nftbridge/collection/collection_bindings.hpp>
#include <nftbridge/collection/collection_resolver.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/fmt/address_fmt.hpp>
#include <nftbridge/core/likely.h>
#include <nftbridge/protocol/validation_error.hpp>

#include <evmc/evmc.hpp>

#include <quill/Quill.h>

#include <optional>

NFTBRIDGE_NAMESPACE_BEGIN

std::optional<L2Address> CollectionBindings::l2_for(Address const &l1) const
{
    auto const it = l1_to_l2_.find(l1);
    if (it == l1_to_l2_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Address> CollectionBindings::l1_for(L2Address const &l2) const
{
    auto const it = l2_to_l1_.find(l2);
    if (it == l2_to_l1_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::optional<L2Address>> CollectionBindings::resolve(
    Address const &l1, std::optional<L2Address> const &l2) const
{
    std::optional<Address> l1_bound;
    if (l2.has_value()) {
        l1_bound = l1_for(*l2);
    }
    return resolve_collection(l1, l2, l1_bound, l2_for(l1));
}

Result<void> CollectionBindings::bind(Address const &l1, L2Address const &l2)
{
    auto const l2_bound = l2_for(l1);
    auto const l1_bound = l1_for(l2);
    if (l2_bound.has_value() && l1_bound.has_value() && *l2_bound == l2 &&
        *l1_bound == l1) {
        return outcome::success();
    }
    if (NFTBRIDGE_UNLIKELY(l2_bound.has_value() || l1_bound.has_value())) {
        return ValidationError::CollectionAlreadyBound;
    }

    l1_to_l2_.emplace(l1, l2);
    l2_to_l1_.emplace(l2, l1);
    LOG_INFO("bound collection {} to {}", l1, l2);
    return outcome::success();
}

NFTBRIDGE_NAMESPACE_END
