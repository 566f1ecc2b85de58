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

#include <restake/core/int.hpp>
#include <restake/core/likely.h>
#include <restake/execution/core/contract/amount_math.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <intx/intx.hpp>

RESTAKE_NAMESPACE_BEGIN

Result<uint256_t> checked_add(uint256_t const &amount, uint256_t const &added)
{
    auto const [sum, carry] = intx::addc(amount, added);
    if (RESTAKE_UNLIKELY(carry)) {
        return AmountError::Overflow;
    }
    return sum;
}

Result<uint256_t> checked_sub(uint256_t const &amount, uint256_t const &drawn)
{
    if (RESTAKE_UNLIKELY(drawn > amount)) {
        return AmountError::Underflow;
    }
    return amount - drawn;
}

RESTAKE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<restake::AmountError>::mapping> const &
quick_status_code_from_enum<restake::AmountError>::value_mappings()
{
    using restake::AmountError;

    static std::initializer_list<mapping> const v = {
        {AmountError::Success, "success", {errc::success}},
        {AmountError::Overflow, "amount overflow", {}},
        {AmountError::Underflow, "amount underflow", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
