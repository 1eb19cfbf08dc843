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

#include <cstdint>

NFTBRIDGE_NAMESPACE_BEGIN

// First four bytes of keccak256 over the canonical signature

// name()
inline constexpr uint32_t NAME_SELECTOR = 0x06fdde03;

// symbol()
inline constexpr uint32_t SYMBOL_SELECTOR = 0x95d89b41;

// baseURI()
inline constexpr uint32_t BASE_URI_SELECTOR = 0x6c0360eb;

// tokenURI(uint256), ERC-721 metadata extension
inline constexpr uint32_t TOKEN_URI_SELECTOR = 0xc87b56dd;

// uri(uint256), ERC-1155 metadata extension
inline constexpr uint32_t URI_SELECTOR = 0x0e89341c;

NFTBRIDGE_NAMESPACE_END
