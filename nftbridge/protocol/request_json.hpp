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

#include <nlohmann/json_fwd.hpp>

NFTBRIDGE_NAMESPACE_BEGIN

// Words and addresses are hex strings, descriptive fields plain strings,
// an unbound collection_l2 is null.
nlohmann::json to_json(Request const &);

// Throws std::invalid_argument on malformed values and
// nlohmann::json::exception on missing or mistyped fields.
Request request_from_json(nlohmann::json const &);

NFTBRIDGE_NAMESPACE_END
