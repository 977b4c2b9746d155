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

#include <seimons/core/config.hpp>
#include <seimons/core/int.hpp>
#include <seimons/core/likely.h>
#include <seimons/core/result.hpp>

#include <initializer_list>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

SEIMONS_NAMESPACE_BEGIN

enum class MathError
{
    Success = 0,
    Overflow,
};

/// x + y, or MathError::Overflow if the sum does not fit in 256 bits
Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y);

SEIMONS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<seimons::MathError>
    : quick_status_code_from_enum_defaults<seimons::MathError>
{
    static constexpr auto const domain_name = "Math Error";
    static constexpr auto const domain_uuid =
        "5f0c2a91-7be3-4d6e-9a41-c3d8e1f27b06";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
