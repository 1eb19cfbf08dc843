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

#include <nftbridge/protocol/validation_error.hpp>

// status-code headers moved between Boost releases
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<nftbridge::ValidationError>::mapping> const &
quick_status_code_from_enum<nftbridge::ValidationError>::value_mappings()
{
    using nftbridge::ValidationError;

    static std::initializer_list<mapping> const v = {
        {ValidationError::Success, "success", {errc::success}},
        {ValidationError::MissingL1Address, "missing l1 address", {}},
        {ValidationError::L1AddressMismatch, "l1 address mismatch", {}},
        {ValidationError::L2AddressMismatch, "l2 address mismatch", {}},
        {ValidationError::MisalignedTokenArrays,
         "token arrays not aligned with token ids",
         {}},
        {ValidationError::UnexpectedTokenValues,
         "token values on single supply collection",
         {}},
        {ValidationError::CollectionAlreadyBound,
         "collection already bound",
         {}},
        {ValidationError::UnsupportedVersion, "unsupported version", {}},
        {ValidationError::L2AddressOutOfRange, "l2 address out of range", {}},
        {ValidationError::ZeroCollectionL2,
         "collection l2 present but zero",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
