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

#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>

#include <initializer_list>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

RESTAKE_NAMESPACE_BEGIN

// Asset amounts and share balances never wrap. Totals that would pass
// 2^256 - 1 and draws below zero are reported instead.
enum class AmountError
{
    Success = 0,
    Overflow,
    Underflow,
};

Result<uint256_t> checked_add(uint256_t const &amount, uint256_t const &added);
Result<uint256_t>
checked_sub(uint256_t const &amount, uint256_t const &drawn);

RESTAKE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<restake::AmountError>
    : quick_status_code_from_enum_defaults<restake::AmountError>
{
    static constexpr auto const domain_name = "Amount Error";
    static constexpr auto const domain_uuid =
        "5b0e2f7a-9c41-4d8e-a6f3-2e17c0d94b68";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
