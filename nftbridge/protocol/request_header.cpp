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
#include <nftbridge/core/likely.h>
#include <nftbridge/protocol/decode_error.hpp>
#include <nftbridge/protocol/request_header.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

NFTBRIDGE_ANONYMOUS_NAMESPACE_BEGIN

constexpr unsigned VERSION_BYTE = 0;
constexpr unsigned KIND_BYTE = 1;
constexpr unsigned BURN_AUTO_BYTE = 2;
constexpr unsigned WITHDRAW_AUTO_BYTE = 3;
constexpr unsigned HEADER_BYTES = 4;

constexpr uint8_t header_byte(Word const &header, unsigned const i)
{
    return static_cast<uint8_t>(header >> (8 * i));
}

constexpr Word to_header_byte(uint8_t const value, unsigned const i)
{
    return Word{value} << (8 * i);
}

Result<bool> decode_flag(Word const &header, unsigned const i)
{
    switch (header_byte(header, i)) {
    case 0:
        return false;
    case 1:
        return true;
    default:
        return DecodeError::InvalidHeader;
    }
}

NFTBRIDGE_ANONYMOUS_NAMESPACE_END

NFTBRIDGE_NAMESPACE_BEGIN

Word encode_request_header(RequestHeader const &header)
{
    return to_header_byte(header.version, VERSION_BYTE) |
           to_header_byte(static_cast<uint8_t>(header.kind), KIND_BYTE) |
           to_header_byte(header.burn_auto ? 1 : 0, BURN_AUTO_BYTE) |
           to_header_byte(header.withdraw_auto ? 1 : 0, WITHDRAW_AUTO_BYTE);
}

Result<RequestHeader> decode_request_header(Word const &word)
{
    if (NFTBRIDGE_UNLIKELY((word >> (8 * HEADER_BYTES)) != 0)) {
        return DecodeError::InvalidHeader;
    }

    RequestHeader header;

    header.version = header_byte(word, VERSION_BYTE);
    if (NFTBRIDGE_UNLIKELY(header.version != REQUEST_PROTOCOL_VERSION)) {
        return DecodeError::UnsupportedVersion;
    }

    switch (header_byte(word, KIND_BYTE)) {
    case static_cast<uint8_t>(CollectionKind::Erc721):
        header.kind = CollectionKind::Erc721;
        break;
    case static_cast<uint8_t>(CollectionKind::Erc1155):
        header.kind = CollectionKind::Erc1155;
        break;
    default:
        return DecodeError::UnknownCollectionKind;
    }

    BOOST_OUTCOME_TRY(header.burn_auto, decode_flag(word, BURN_AUTO_BYTE));
    BOOST_OUTCOME_TRY(
        header.withdraw_auto, decode_flag(word, WITHDRAW_AUTO_BYTE));

    return header;
}

bool can_use_withdraw_auto(Word const &header)
{
    return header_byte(header, WITHDRAW_AUTO_BYTE) == 1;
}

bool can_use_burn_auto(Word const &header)
{
    return header_byte(header, BURN_AUTO_BYTE) == 1;
}

NFTBRIDGE_NAMESPACE_END
