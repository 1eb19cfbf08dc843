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
#include <nftbridge/core/result.hpp>
#include <nftbridge/protocol/word.hpp>

#include <cstdint>

NFTBRIDGE_NAMESPACE_BEGIN

inline constexpr uint8_t REQUEST_PROTOCOL_VERSION = 1;

enum class CollectionKind : uint8_t
{
    Erc721 = 1, // single supply
    Erc1155 = 2, // multi supply
};

// Header word layout, low to high byte:
//
//   [version][collection kind][burn auto][withdraw auto]
//
// Bytes 4..31 are reserved and always zero. Each field is located by its
// byte position so the decoder never depends on how many high-order bytes
// happen to be zero.
struct RequestHeader
{
    uint8_t version{REQUEST_PROTOCOL_VERSION};
    CollectionKind kind{CollectionKind::Erc721};
    bool burn_auto{false};
    bool withdraw_auto{false};

    friend bool
    operator==(RequestHeader const &, RequestHeader const &) = default;
};

Word encode_request_header(RequestHeader const &);

inline Word encode_request_header(
    CollectionKind const kind, bool const burn_auto, bool const withdraw_auto)
{
    return encode_request_header(RequestHeader{
        .version = REQUEST_PROTOCOL_VERSION,
        .kind = kind,
        .burn_auto = burn_auto,
        .withdraw_auto = withdraw_auto});
}

Result<RequestHeader> decode_request_header(Word const &);

bool can_use_withdraw_auto(Word const &header);
bool can_use_burn_auto(Word const &header);

NFTBRIDGE_NAMESPACE_END
