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
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/fmt/address_fmt.hpp>
#include <nftbridge/core/likely.h>
#include <nftbridge/protocol/validation_error.hpp>

#include <evmc/evmc.hpp>

#include <quill/Quill.h>

#include <optional>

NFTBRIDGE_NAMESPACE_BEGIN

Result<std::optional<L2Address>> resolve_collection(
    Address const &l1_req, std::optional<L2Address> const &l2_req,
    std::optional<Address> const &l1_bound,
    std::optional<L2Address> const &l2_bound)
{
    if (NFTBRIDGE_UNLIKELY(l1_req == Address{})) {
        return ValidationError::MissingL1Address;
    }

    if (!l2_req.has_value()) {
        LOG_DEBUG(
            "collection {} declares no l2 address, bound={}",
            l1_req,
            l2_bound.has_value());
        return l2_bound;
    }

    if (NFTBRIDGE_UNLIKELY(l2_bound.has_value() && *l2_bound != *l2_req)) {
        LOG_DEBUG(
            "collection {} is bound to {}, request declares {}",
            l1_req,
            *l2_bound,
            *l2_req);
        return ValidationError::L2AddressMismatch;
    }
    if (NFTBRIDGE_UNLIKELY(l1_bound.has_value() && *l1_bound != l1_req)) {
        LOG_DEBUG(
            "l2 collection {} is bound to {}, request declares {}",
            *l2_req,
            *l1_bound,
            l1_req);
        return ValidationError::L1AddressMismatch;
    }

    return l2_bound;
}

NFTBRIDGE_NAMESPACE_END
