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
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/amount_math.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/vault/share_ledger.hpp>
#include <restake/execution/vault/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

RESTAKE_VAULT_NAMESPACE_BEGIN

ShareLedger::ShareLedger(State &state)
    : vars{state}
{
}

uint256_t ShareLedger::shares_of(Address const &owner) const
{
    return vars.shares(owner).load().native();
}

uint256_t ShareLedger::total_supply() const
{
    return vars.total_supply.load().native();
}

Result<void> ShareLedger::mint(Address const &owner, uint256_t const &shares)
{
    BOOST_OUTCOME_TRY(
        auto const supply, checked_add(total_supply(), shares));
    BOOST_OUTCOME_TRY(auto const balance, checked_add(shares_of(owner), shares));
    vars.total_supply.store(supply);
    vars.shares(owner).store(balance);
    return outcome::success();
}

Result<void> ShareLedger::burn(Address const &owner, uint256_t const &shares)
{
    uint256_t const balance = shares_of(owner);
    if (RESTAKE_UNLIKELY(shares > balance)) {
        return VaultError::InsufficientShares;
    }
    BOOST_OUTCOME_TRY(auto const supply, checked_sub(total_supply(), shares));
    vars.total_supply.store(supply);
    if (shares == balance) {
        vars.shares(owner).clear();
    }
    else {
        vars.shares(owner).store(balance - shares);
    }
    return outcome::success();
}

uint256_t ShareLedger::max_withdraw(Address const &owner) const
{
    return shares_of(owner);
}

RESTAKE_VAULT_NAMESPACE_END
