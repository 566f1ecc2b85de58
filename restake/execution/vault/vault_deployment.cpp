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

#include <restake/core/likely.h>
#include <restake/execution/state/state.hpp>
#include <restake/execution/vault/constants.hpp>
#include <restake/execution/vault/vault_deployment.hpp>
#include <restake/execution/vault/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <utility>

RESTAKE_VAULT_NAMESPACE_BEGIN

VaultDeployment::VaultDeployment(
    State &state, VaultConfig config, BlockHeader const &header)
    : gateway{state}
    , ledger{state}
    , vault{state, gateway, ledger, std::move(config), header}
    , shares{state, ledger, vault}
{
}

Result<void> VaultDeployment::execute_matured_unstake(Address const &depositor)
{
    auto const request = vault.get_unstake_request(depositor);
    if (RESTAKE_UNLIKELY(!request.has_value())) {
        return VaultError::NoScheduledUnstake;
    }
    if (RESTAKE_UNLIKELY(request->state != UnstakeState::Scheduled)) {
        return VaultError::InvalidUnstakeState;
    }

    auto const &config = vault.config();
    BOOST_OUTCOME_TRY(gateway.syscall_execute_unstake(
        VAULT_CA, config.op, config.asset, request->amount.native()));
    BOOST_OUTCOME_TRY(vault.syscall_unstake_executed(depositor));
    return outcome::success();
}

RESTAKE_VAULT_NAMESPACE_END
