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

#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/block_header.hpp>
#include <restake/execution/delegation/multi_asset_delegation.hpp>
#include <restake/execution/vault/config.hpp>
#include <restake/execution/vault/liquid_delegation_vault.hpp>
#include <restake/execution/vault/share_ledger.hpp>
#include <restake/execution/vault/share_vault.hpp>
#include <restake/execution/vault/vault_config.hpp>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

// The full vault stack over one call's state: reference gateway, share
// ledger, orchestrator and deposit/withdraw surface.
struct VaultDeployment
{
    delegation::MultiAssetDelegation gateway;
    ShareLedger ledger;
    LiquidDelegationVault vault;
    ShareVault shares;

    VaultDeployment(State &, VaultConfig, BlockHeader const &);

    // System transition for a matured unstake of `depositor`: the gateway
    // releases the depositor's part of the vault's pending unstake, then
    // the ledger entry moves to Executed.
    Result<void> execute_matured_unstake(Address const &depositor);
};

RESTAKE_VAULT_NAMESPACE_END
