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

#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/vault/config.hpp>
#include <restake/execution/vault/liquid_delegation_vault.hpp>
#include <restake/execution/vault/share_ledger.hpp>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

// Deposit and withdraw entry points of the vault. Shares are minted and
// burned 1:1 with the asset; delegation bookkeeping is left to the
// orchestrator hooks. Only native assets are moved between accounts, token
// transfers are not modelled.
class ShareVault
{
    State &state_;
    ShareLedger &ledger_;
    LiquidDelegationVault &vault_;

public:
    ShareVault(State &, ShareLedger &, LiquidDelegationVault &);

    Result<void> deposit(Address const &depositor, uint256_t const &assets);
    Result<void> withdraw(Address const &owner, uint256_t const &assets);

private:
    // event Deposit(
    //     address indexed owner,
    //     uint256         assets,
    //     uint256         shares);
    void emit_deposit_event(
        Address const &owner, u256_be const &assets, u256_be const &shares);

    // event Withdraw(
    //     address indexed owner,
    //     uint256         assets,
    //     uint256         shares);
    void emit_withdraw_event(
        Address const &owner, u256_be const &assets, u256_be const &shares);
};

RESTAKE_VAULT_NAMESPACE_END
