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
#include <nftbridge/core/bytes.hpp>
#include <nftbridge/core/config.hpp>
#include <nftbridge/core/keccak.hpp>

NFTBRIDGE_NAMESPACE_BEGIN

Address hash_and_clip(byte_string const &);

Address create2_contract_address(
    Address const &from, bytes32_t const &salt, hash256 const &code_hash);

NFTBRIDGE_NAMESPACE_END
