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
#include <restake/core/restake_exception.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/amount_math.hpp>
#include <restake/execution/core/fmt/address_fmt.hpp>
#include <restake/execution/core/fmt/bytes_fmt.hpp>
#include <restake/execution/core/fmt/int_fmt.hpp>
#include <restake/execution/delegation/multi_asset_delegation.hpp>
#include <restake/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

MultiAssetDelegation::MultiAssetDelegation(State &state)
    : state_{state}
    , vars{state}
{
}

Result<void> MultiAssetDelegation::delegate(
    Address const &delegator, OperatorId const &op, Asset const &asset,
    uint256_t const &amount, std::span<uint64_t const> blueprint_selection)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return DelegationError::InvalidAmount;
    }

    auto const status = vars.operator_status(op).load();
    if (RESTAKE_UNLIKELY(status == OperatorStatus::Unknown)) {
        return DelegationError::UnknownOperator;
    }
    if (RESTAKE_UNLIKELY(status != OperatorStatus::Active)) {
        return DelegationError::OperatorNotActive;
    }

    if (RESTAKE_UNLIKELY(blueprint_selection.empty())) {
        return DelegationError::EmptyBlueprintSelection;
    }
    for (auto const blueprint_id : blueprint_selection) {
        if (RESTAKE_UNLIKELY(
                vars.blueprint(op, blueprint_id).load().native() == 0)) {
            return DelegationError::UnknownBlueprint;
        }
    }

    // delegated funds are always new, idle amounts stay reserved for the
    // withdrawal they were unstaked for
    if (asset.kind == AssetKind::Native) {
        if (RESTAKE_UNLIKELY(state_.get_balance(delegator) < amount)) {
            return DelegationError::InsufficientBalance;
        }
    }

    auto del_storage = vars.delegation(delegator, op, asset);
    auto del = del_storage.load();
    BOOST_OUTCOME_TRY(
        auto const new_amount, checked_add(del.amount.native(), amount));
    del.amount = new_amount;
    del_storage.store(del);

    if (asset.kind == AssetKind::Native) {
        state_.subtract_from_balance(delegator, amount);
        state_.add_to_balance(DELEGATION_CA, amount);
    }

    LOG_DEBUG(
        "MultiAssetDelegation: {} delegated {} to operator {}",
        delegator,
        amount,
        op);

    return outcome::success();
}

Result<void> MultiAssetDelegation::schedule_unstake(
    Address const &delegator, OperatorId const &op, Asset const &asset,
    uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return DelegationError::InvalidAmount;
    }
    if (RESTAKE_UNLIKELY(
            vars.operator_status(op).load() == OperatorStatus::Unknown)) {
        return DelegationError::UnknownOperator;
    }

    auto del_storage = vars.delegation(delegator, op, asset);
    auto del = del_storage.load();
    uint256_t const pending = del.unstake_pending.native();
    uint256_t const free = del.amount.native() - pending;
    if (RESTAKE_UNLIKELY(amount > free)) {
        return DelegationError::InsufficientDelegation;
    }
    del.unstake_pending = pending + amount;
    del_storage.store(del);

    LOG_DEBUG(
        "MultiAssetDelegation: {} scheduled unstake of {} from operator {}",
        delegator,
        amount,
        op);

    return outcome::success();
}

Result<void> MultiAssetDelegation::cancel_unstake(
    Address const &delegator, OperatorId const &op, Asset const &asset,
    uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return DelegationError::InvalidAmount;
    }

    auto del_storage = vars.delegation(delegator, op, asset);
    auto del = del_storage.load();
    uint256_t const pending = del.unstake_pending.native();
    if (RESTAKE_UNLIKELY(amount > pending)) {
        return DelegationError::InsufficientUnstake;
    }
    del.unstake_pending = pending - amount;
    del_storage.store(del);

    return outcome::success();
}

Result<void> MultiAssetDelegation::schedule_withdraw(
    Address const &delegator, Asset const &asset, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return DelegationError::InvalidAmount;
    }

    auto idle_storage = vars.idle(delegator, asset);
    uint256_t const idle = idle_storage.load().native();
    if (RESTAKE_UNLIKELY(amount > idle)) {
        return DelegationError::InsufficientIdle;
    }

    auto withdraw_storage = vars.pending_withdraw(delegator);
    auto withdraw = withdraw_storage.load_checked().value_or(
        PendingWithdraw{.amount = uint256_t{0}, .asset = asset});
    if (RESTAKE_UNLIKELY(withdraw.asset != asset)) {
        return DelegationError::AssetMismatch;
    }
    BOOST_OUTCOME_TRY(
        auto const new_amount, checked_add(withdraw.amount.native(), amount));
    withdraw.amount = new_amount;

    withdraw_storage.store(withdraw);
    idle_storage.store(idle - amount);

    LOG_DEBUG(
        "MultiAssetDelegation: {} scheduled withdraw of {}",
        delegator,
        amount);

    return outcome::success();
}

Result<void> MultiAssetDelegation::execute_withdraw(Address const &delegator)
{
    auto withdraw_storage = vars.pending_withdraw(delegator);
    auto const withdraw = withdraw_storage.load_checked();
    if (!withdraw.has_value()) {
        return outcome::success();
    }

    uint256_t const amount = withdraw->amount.native();
    release(delegator, withdraw->asset, amount);
    withdraw_storage.clear();

    LOG_DEBUG(
        "MultiAssetDelegation: paid out withdraw of {} to {}",
        amount,
        delegator);

    return outcome::success();
}

Result<void> MultiAssetDelegation::cancel_withdraw(
    Address const &delegator, Asset const &asset, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return DelegationError::InvalidAmount;
    }

    auto withdraw_storage = vars.pending_withdraw(delegator);
    auto withdraw = withdraw_storage.load_checked();
    if (RESTAKE_UNLIKELY(!withdraw.has_value())) {
        return DelegationError::InsufficientWithdraw;
    }
    if (RESTAKE_UNLIKELY(withdraw->asset != asset)) {
        return DelegationError::AssetMismatch;
    }
    uint256_t const pending = withdraw->amount.native();
    if (RESTAKE_UNLIKELY(amount > pending)) {
        return DelegationError::InsufficientWithdraw;
    }

    if (amount == pending) {
        withdraw_storage.clear();
    }
    else {
        withdraw->amount = pending - amount;
        withdraw_storage.store(*withdraw);
    }

    // the cancelled amount goes back to the delegator, not to idle
    release(delegator, asset, amount);

    LOG_DEBUG(
        "MultiAssetDelegation: {} cancelled withdraw of {}",
        delegator,
        amount);

    return outcome::success();
}

void MultiAssetDelegation::release(
    Address const &delegator, Asset const &asset, uint256_t const &amount)
{
    if (asset.kind != AssetKind::Native || amount == 0) {
        return;
    }
    RESTAKE_ASSERT_THROW(
        state_.get_balance(DELEGATION_CA) >= amount,
        "delegation gateway insolvent");
    state_.subtract_from_balance(DELEGATION_CA, amount);
    state_.add_to_balance(delegator, amount);
}

Result<void> MultiAssetDelegation::register_operator(OperatorId const &op)
{
    auto status_storage = vars.operator_status(op);
    if (RESTAKE_UNLIKELY(status_storage.load() != OperatorStatus::Unknown)) {
        return DelegationError::OperatorExists;
    }
    status_storage.store(OperatorStatus::Active);

    LOG_INFO("MultiAssetDelegation: registered operator {}", op);

    return outcome::success();
}

Result<void>
MultiAssetDelegation::set_operator_active(OperatorId const &op, bool const active)
{
    auto status_storage = vars.operator_status(op);
    if (RESTAKE_UNLIKELY(status_storage.load() == OperatorStatus::Unknown)) {
        return DelegationError::UnknownOperator;
    }
    status_storage.store(
        active ? OperatorStatus::Active : OperatorStatus::Leaving);
    return outcome::success();
}

Result<void> MultiAssetDelegation::add_blueprint(
    OperatorId const &op, uint64_t const blueprint_id)
{
    if (RESTAKE_UNLIKELY(
            vars.operator_status(op).load() == OperatorStatus::Unknown)) {
        return DelegationError::UnknownOperator;
    }
    vars.blueprint(op, blueprint_id).store(1);
    return outcome::success();
}

OperatorStatus MultiAssetDelegation::get_operator_status(OperatorId const &op)
{
    return vars.operator_status(op).load();
}

MultiAssetDelegation::Delegation MultiAssetDelegation::get_delegation(
    Address const &delegator, OperatorId const &op, Asset const &asset)
{
    return vars.delegation(delegator, op, asset).load();
}

uint256_t
MultiAssetDelegation::get_idle(Address const &delegator, Asset const &asset)
{
    return vars.idle(delegator, asset).load().native();
}

std::optional<MultiAssetDelegation::PendingWithdraw>
MultiAssetDelegation::get_pending_withdraw(Address const &delegator)
{
    return vars.pending_withdraw(delegator).load_checked();
}

Result<void> MultiAssetDelegation::syscall_execute_unstake(
    Address const &delegator, OperatorId const &op, Asset const &asset,
    uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return DelegationError::InvalidAmount;
    }

    auto del_storage = vars.delegation(delegator, op, asset);
    auto const del = del_storage.load();
    uint256_t const pending = del.unstake_pending.native();
    if (RESTAKE_UNLIKELY(amount > pending)) {
        return DelegationError::InsufficientUnstake;
    }

    uint256_t const remaining = del.amount.native() - amount;
    if (remaining == 0) {
        del_storage.clear();
    }
    else {
        del_storage.store(Delegation{
            .amount = remaining, .unstake_pending = pending - amount});
    }

    auto idle_storage = vars.idle(delegator, asset);
    BOOST_OUTCOME_TRY(
        auto const idle, checked_add(idle_storage.load().native(), amount));
    idle_storage.store(idle);

    LOG_DEBUG(
        "MultiAssetDelegation: executed unstake of {} for {} from operator {}",
        amount,
        delegator,
        op);

    return outcome::success();
}

RESTAKE_DELEGATION_NAMESPACE_END
