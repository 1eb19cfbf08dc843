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

// status-code headers moved between Boost releases
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

NFTBRIDGE_NAMESPACE_BEGIN

// Failures while reading a request out of a word stream
enum class DecodeError
{
    Success = 0,
    InputTooShort,
    UnsupportedVersion,
    UnknownCollectionKind,
    InvalidHeader,
    AddressOverflow,
    InvalidString,
    ArrayLengthUnexpected,
};

NFTBRIDGE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<nftbridge::DecodeError>
    : quick_status_code_from_enum_defaults<nftbridge::DecodeError>
{
    static constexpr auto const domain_name = "Request Decode Error";
    static constexpr auto const domain_uuid =
        "5b0e8c41-7a1f-4c0d-9a6e-2f3d8b71c9e4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
