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

#include <restake/core/byte_string.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/block_header.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_slot.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/core/receipt.hpp>
#include <restake/execution/delegation/delegation_gateway.hpp>
#include <restake/execution/vault/config.hpp>
#include <restake/execution/vault/constants.hpp>
#include <restake/execution/vault/requests.hpp>
#include <restake/execution/vault/vault_accounting.hpp>
#include <restake/execution/vault/vault_config.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <optional>
#include <utility>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

// Per depositor unstake/withdraw state machine in front of a delegation
// gateway. The vault account is the delegator of record; this class keeps,
// for every depositor, which part of the vault's position that depositor is
// unwinding.
//
//   scheduleUnstake ---> Scheduled --(system)--> Executed
//        ^                   |                      |
//        |             cancelUnstake         scheduleWithdraw
//        |                   v                      v
//        +-------------- (absent)       WithdrawRequest Scheduled
//                                        |                    |
//                             withdraw hook (partial)  cancelWithdrawAndRedelegate
//
// Scheduling over a live request replaces it: a scheduled unstake is
// cancelled at the gateway and a scheduled withdraw is delegated again before
// the new request is placed, so the gateway never holds more for a depositor
// than the ledger records.
//
// Each operation calls the gateway before it writes the ledger. An operation
// that returns an error must be rejected by the caller (State::pop_reject),
// which undoes every ledger write, balance change and log of that operation.
class LiquidDelegationVault
{
    State &state_;
    delegation::DelegationGateway &gateway_;
    VaultAccounting const &accounting_;
    VaultConfig const config_;
    BlockHeader const &header_;

public:
    LiquidDelegationVault(
        State &, delegation::DelegationGateway &, VaultAccounting const &,
        VaultConfig, BlockHeader const &);

    class Variables
    {
        State &state_;

        enum Namespace : uint8_t
        {
            NSUnstakeRequest = 0x01,
            NSWithdrawRequest = 0x02,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        // mapping(address => UnstakeRequest) unstake_request
        StorageVariable<UnstakeRequest>
        unstake_request(Address const &depositor) const
        {
            return {
                state_, VAULT_CA, packed_slot(NSUnstakeRequest, depositor)};
        }

        // mapping(address => WithdrawRequest) withdraw_request
        StorageVariable<WithdrawRequest>
        withdraw_request(Address const &depositor) const
        {
            return {
                state_, VAULT_CA, packed_slot(NSWithdrawRequest, depositor)};
        }
    } vars;

    VaultConfig const &config() const noexcept
    {
        return config_;
    }

    std::optional<UnstakeRequest> get_unstake_request(Address const &) const;
    std::optional<WithdrawRequest> get_withdraw_request(Address const &) const;

    ///////////////////////////
    // Depositor operations  //
    ///////////////////////////
    Result<void>
    schedule_unstake(Address const &depositor, uint256_t const &amount);
    Result<void> cancel_unstake(Address const &depositor);
    Result<void>
    schedule_withdraw(Address const &depositor, uint256_t const &amount);
    Result<void> cancel_withdraw_and_redelegate(Address const &depositor);

    ///////////////////////////
    // External vault hooks  //
    ///////////////////////////

    // Called after shares were minted for `amount`. Failure must reject the
    // whole deposit, the mint included.
    Result<void> on_deposit(Address const &depositor, uint256_t const &amount);

    // Called before `amount` is released to `owner`. Failure must stop the
    // transfer.
    Result<void> on_withdraw(Address const &owner, uint256_t const &amount);

    ////////////////////
    //  System Calls  //
    ////////////////////

    // The gateway completed the unstake of `depositor`
    Result<void> syscall_unstake_executed(Address const &depositor);

    using PrecompileFunc = Result<byte_string> (LiquidDelegationVault::*)(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    /////////////////
    // Precompiles //
    /////////////////
    static std::pair<PrecompileFunc, uint64_t>
    precompile_dispatch(byte_string_view &);

    Result<byte_string> precompile_schedule_unstake(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_cancel_unstake(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_schedule_withdraw(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_cancel_withdraw_and_redelegate(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_get_unstake_request(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_get_withdraw_request(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_get_config(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

private:
    // Cancels `amount` of the vault's pending withdraw at the gateway and
    // delegates it again on behalf of `depositor`
    Result<void>
    redelegate_withdraw(Address const &depositor, uint256_t const &amount);

    /////////////
    // Events //
    /////////////

    // event UnstakeScheduled(
    //     address indexed depositor,
    //     uint256         amount,
    //     uint64          timestamp);
    void emit_unstake_scheduled_event(
        Address const &depositor, u256_be const &amount, u64_be timestamp);

    // event UnstakeCancelled(
    //     address indexed depositor,
    //     uint256         amount);
    void emit_unstake_cancelled_event(
        Address const &depositor, u256_be const &amount);

    // event UnstakeExecuted(
    //     address indexed depositor,
    //     uint256         amount);
    void emit_unstake_executed_event(
        Address const &depositor, u256_be const &amount);

    // event WithdrawScheduled(
    //     address indexed depositor,
    //     uint256         amount,
    //     uint64          timestamp);
    void emit_withdraw_scheduled_event(
        Address const &depositor, u256_be const &amount, u64_be timestamp);

    // event WithdrawCancelled(
    //     address indexed depositor,
    //     uint256         amount);
    void emit_withdraw_cancelled_event(
        Address const &depositor, u256_be const &amount);

    // event AssetsDelegated(
    //     address indexed depositor,
    //     uint256         amount);
    void emit_assets_delegated_event(
        Address const &depositor, u256_be const &amount);

    void emit_log(Receipt::Log const &);
};

RESTAKE_VAULT_NAMESPACE_END
