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

#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/likely.h>
#include <restake/core/restake_exception.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/core/contract/events.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/vault/constants.hpp>
#include <restake/execution/vault/share_vault.hpp>
#include <restake/execution/vault/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

RESTAKE_VAULT_NAMESPACE_BEGIN

ShareVault::ShareVault(
    State &state, ShareLedger &ledger, LiquidDelegationVault &vault)
    : state_{state}
    , ledger_{ledger}
    , vault_{vault}
{
}

Result<void>
ShareVault::deposit(Address const &depositor, uint256_t const &assets)
{
    if (RESTAKE_UNLIKELY(assets == 0)) {
        return VaultError::InvalidAmount;
    }

    bool const native =
        vault_.config().asset.kind == delegation::AssetKind::Native;
    if (native) {
        if (RESTAKE_UNLIKELY(state_.get_balance(depositor) < assets)) {
            return VaultError::InsufficientBalance;
        }
        state_.subtract_from_balance(depositor, assets);
        state_.add_to_balance(VAULT_CA, assets);
    }

    BOOST_OUTCOME_TRY(ledger_.mint(depositor, assets));
    BOOST_OUTCOME_TRY(vault_.on_deposit(depositor, assets));

    emit_deposit_event(depositor, assets, assets);
    return outcome::success();
}

Result<void> ShareVault::withdraw(Address const &owner, uint256_t const &assets)
{
    if (RESTAKE_UNLIKELY(assets == 0)) {
        return VaultError::InvalidAmount;
    }
    if (RESTAKE_UNLIKELY(ledger_.shares_of(owner) < assets)) {
        return VaultError::InsufficientShares;
    }

    BOOST_OUTCOME_TRY(vault_.on_withdraw(owner, assets));
    BOOST_OUTCOME_TRY(ledger_.burn(owner, assets));

    if (vault_.config().asset.kind == delegation::AssetKind::Native) {
        RESTAKE_ASSERT_THROW(
            state_.get_balance(VAULT_CA) >= assets, "vault insolvent");
        state_.subtract_from_balance(VAULT_CA, assets);
        state_.add_to_balance(owner, assets);
    }

    emit_withdraw_event(owner, assets, assets);
    return outcome::success();
}

void ShareVault::emit_deposit_event(
    Address const &owner, u256_be const &assets, u256_be const &shares)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Deposit(address,uint256,uint256)");
    static_assert(
        signature ==
        0x90890809c654f11d6e72a28fa60149770a0d11ec6c92319d6ceb2bb0a4ea1a15_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(owner)
                           .data(assets)
                           .data(shares)
                           .build();
    state_.store_log(event);
}

void ShareVault::emit_withdraw_event(
    Address const &owner, u256_be const &assets, u256_be const &shares)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Withdraw(address,uint256,uint256)");
    static_assert(
        signature ==
        0xf279e6a1f5e320cca91135676d9cb6e44ca8a08c0b88342bcdb1144f6511b568_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(owner)
                           .data(assets)
                           .data(shares)
                           .build();
    state_.store_log(event);
}

RESTAKE_VAULT_NAMESPACE_END
