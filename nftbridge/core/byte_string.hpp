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

#include <evmc/bytes.hpp>

#include <string_view>

NFTBRIDGE_NAMESPACE_BEGIN

using byte_string = evmc::bytes;

using byte_string_view = evmc::bytes_view;

inline byte_string_view to_byte_string_view(std::string_view const s)
{
    return {reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

NFTBRIDGE_NAMESPACE_END
