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

#include <nftbridge/collection/create_contract_address.hpp>
#include <nftbridge/core/config.hpp>

#include <cstring>

NFTBRIDGE_NAMESPACE_BEGIN

// Low 20 bytes of the keccak256 digest
Address hash_and_clip(byte_string const &b)
{
    auto const h = keccak256(b);
    Address result{};
    std::memcpy(result.bytes, &h.bytes[12], sizeof(Address));
    return result;
}

// EIP-1014
Address create2_contract_address(
    Address const &from, bytes32_t const &salt, hash256 const &code_hash)
{
    byte_string b{0xff};
    b.append(from.bytes, sizeof(Address));
    b.append(salt.bytes, sizeof(bytes32_t));
    b.append(code_hash.bytes, sizeof(hash256));
    return hash_and_clip(b);
}

NFTBRIDGE_NAMESPACE_END
