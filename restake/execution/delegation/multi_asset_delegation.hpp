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

#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_slot.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/delegation/config.hpp>
#include <restake/execution/delegation/constants.hpp>
#include <restake/execution/delegation/delegation_error.hpp>
#include <restake/execution/delegation/delegation_gateway.hpp>

#include <cstdint>
#include <optional>
#include <span>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_DELEGATION_NAMESPACE_BEGIN

enum class OperatorStatus : uint8_t
{
    Unknown = 0,
    Active = 1,
    Leaving = 2,
};

// Reference delegation gateway. Positions live in state under DELEGATION_CA,
// so every call commits or rolls back together with the operation that
// placed it.
//
// Per delegator the books are:
//  * delegation(delegator, operator, asset): delegated amount and the part
//    of it with a pending unstake
//  * idle(delegator, asset): unstaked amounts held by the gateway, only
//    available to withdraw
//  * pending_withdraw(delegator): one pending withdrawal (asset, amount)
//
// Delegation always pulls new funds from the delegator. A cancelled
// withdrawal is paid back to the delegator like an executed one.
class MultiAssetDelegation final : public DelegationGateway
{
    State &state_;

    // pays a native amount held by the gateway out to the delegator
    void
    release(Address const &delegator, Asset const &, uint256_t const &amount);

public:
    explicit MultiAssetDelegation(State &);

    struct Delegation
    {
        u256_be amount;
        u256_be unstake_pending;
    };

    static_assert(sizeof(Delegation) == 64);
    static_assert(alignof(Delegation) == 1);

    struct PendingWithdraw
    {
        u256_be amount;
        Asset asset;
    };

    static_assert(sizeof(PendingWithdraw) == 53);
    static_assert(alignof(PendingWithdraw) == 1);

    class Variables
    {
        State &state_;

        enum Namespace : uint8_t
        {
            NSOperator = 0x01,
            NSBlueprint = 0x02,
            NSDelegation = 0x03,
            NSIdle = 0x04,
            NSPendingWithdraw = 0x05,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        // mapping(bytes32 => uint8) operator_status
        StorageVariable<OperatorStatus> operator_status(OperatorId const &op)
        {
            return {state_, DELEGATION_CA, hashed_slot(NSOperator, op)};
        }

        // mapping(bytes32 => mapping(uint64 => uint8)) blueprint
        StorageVariable<u8_be>
        blueprint(OperatorId const &op, uint64_t const blueprint_id)
        {
            struct
            {
                OperatorId op;
                u64_be blueprint_id;
            } key{.op = op, .blueprint_id = blueprint_id};

            return {state_, DELEGATION_CA, hashed_slot(NSBlueprint, key)};
        }

        // clang-format off
        // mapping(address => mapping(bytes32 => mapping(Asset => Delegation)))
        // clang-format on
        StorageVariable<Delegation> delegation(
            Address const &delegator, OperatorId const &op, Asset const &asset)
        {
            struct
            {
                Address delegator;
                OperatorId op;
                Asset asset;
            } key{.delegator = delegator, .op = op, .asset = asset};

            return {state_, DELEGATION_CA, hashed_slot(NSDelegation, key)};
        }

        // mapping(address => mapping(Asset => uint256)) idle
        StorageVariable<u256_be>
        idle(Address const &delegator, Asset const &asset)
        {
            struct
            {
                Address delegator;
                Asset asset;
            } key{.delegator = delegator, .asset = asset};

            return {state_, DELEGATION_CA, hashed_slot(NSIdle, key)};
        }

        // mapping(address => PendingWithdraw) pending_withdraw
        StorageVariable<PendingWithdraw>
        pending_withdraw(Address const &delegator)
        {
            return {
                state_,
                DELEGATION_CA,
                packed_slot(NSPendingWithdraw, delegator)};
        }
    } vars;

    ////////////////////
    //  Gateway calls //
    ////////////////////
    Result<void> delegate(
        Address const &delegator, OperatorId const &, Asset const &,
        uint256_t const &amount,
        std::span<uint64_t const> blueprint_selection) override;

    Result<void> schedule_unstake(
        Address const &delegator, OperatorId const &, Asset const &,
        uint256_t const &amount) override;

    Result<void> cancel_unstake(
        Address const &delegator, OperatorId const &, Asset const &,
        uint256_t const &amount) override;

    Result<void> schedule_withdraw(
        Address const &delegator, Asset const &,
        uint256_t const &amount) override;

    Result<void> execute_withdraw(Address const &delegator) override;

    Result<void> cancel_withdraw(
        Address const &delegator, Asset const &,
        uint256_t const &amount) override;

    ////////////////////
    // Administration //
    ////////////////////
    Result<void> register_operator(OperatorId const &);
    Result<void> set_operator_active(OperatorId const &, bool active);
    Result<void> add_blueprint(OperatorId const &, uint64_t blueprint_id);

    /////////////
    // Getters //
    /////////////
    OperatorStatus get_operator_status(OperatorId const &);
    Delegation get_delegation(
        Address const &delegator, OperatorId const &, Asset const &);
    uint256_t get_idle(Address const &delegator, Asset const &);
    std::optional<PendingWithdraw>
    get_pending_withdraw(Address const &delegator);

    ////////////////////
    //  System Calls  //
    ////////////////////

    // Completes `amount` of a matured unstake: it leaves the operator and
    // becomes idle.
    Result<void> syscall_execute_unstake(
        Address const &delegator, OperatorId const &, Asset const &,
        uint256_t const &amount);
};

RESTAKE_DELEGATION_NAMESPACE_END
