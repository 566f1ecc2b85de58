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
#include <restake/core/restake_exception.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/delegation/constants.hpp>
#include <restake/execution/delegation/delegation_error.hpp>
#include <restake/execution/delegation/multi_asset_delegation.hpp>
#include <restake/execution/state/block_state.hpp>
#include <restake/execution/state/state.hpp>

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace restake::delegation;

namespace
{
    constexpr auto OP_A{
        0x000000000000000000000000000000000000000000000000000000000000000a_bytes32};
    constexpr auto OP_B{
        0x000000000000000000000000000000000000000000000000000000000000000b_bytes32};
    constexpr auto DELEGATOR = 0xde1e_address;
    constexpr auto TOKEN = 0x70c3_address;

    std::vector<uint64_t> const SELECTION{1, 2};
}

struct MultiAssetDelegationTest : public ::testing::Test
{
    BlockState bs{};
    State state{bs};
    MultiAssetDelegation gateway{state};

    void SetUp() override
    {
        state.add_to_balance(DELEGATOR, 1000);
        ASSERT_FALSE(gateway.register_operator(OP_A).has_error());
        ASSERT_FALSE(gateway.add_blueprint(OP_A, 1).has_error());
        ASSERT_FALSE(gateway.add_blueprint(OP_A, 2).has_error());
    }

    Result<void> delegate(
        uint256_t const &amount, OperatorId const &op = OP_A,
        Asset const &asset = native_asset())
    {
        return gateway.delegate(
            DELEGATOR, op, asset, amount, std::span{SELECTION});
    }

    uint256_t delegated(Asset const &asset = native_asset())
    {
        return gateway.get_delegation(DELEGATOR, OP_A, asset).amount.native();
    }

    uint256_t unstaking(Asset const &asset = native_asset())
    {
        return gateway.get_delegation(DELEGATOR, OP_A, asset)
            .unstake_pending.native();
    }
};

TEST_F(MultiAssetDelegationTest, operator_admin)
{
    EXPECT_EQ(gateway.get_operator_status(OP_A), OperatorStatus::Active);
    EXPECT_EQ(gateway.get_operator_status(OP_B), OperatorStatus::Unknown);

    auto res = gateway.register_operator(OP_A);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::OperatorExists);

    res = gateway.set_operator_active(OP_B, true);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::UnknownOperator);

    res = gateway.add_blueprint(OP_B, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::UnknownOperator);

    EXPECT_FALSE(gateway.set_operator_active(OP_A, false).has_error());
    EXPECT_EQ(gateway.get_operator_status(OP_A), OperatorStatus::Leaving);
    EXPECT_FALSE(gateway.set_operator_active(OP_A, true).has_error());
    EXPECT_EQ(gateway.get_operator_status(OP_A), OperatorStatus::Active);
}

TEST_F(MultiAssetDelegationTest, delegate_pulls_native_funds)
{
    EXPECT_FALSE(delegate(300).has_error());
    EXPECT_EQ(delegated(), 300);
    EXPECT_EQ(state.get_balance(DELEGATOR), 700);
    EXPECT_EQ(state.get_balance(DELEGATION_CA), 300);
}

TEST_F(MultiAssetDelegationTest, delegate_checks)
{
    auto res = delegate(0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InvalidAmount);

    res = delegate(10, OP_B);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::UnknownOperator);

    res = gateway.delegate(DELEGATOR, OP_A, native_asset(), 10, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::EmptyBlueprintSelection);

    std::vector<uint64_t> const unknown{1, 3};
    res = gateway.delegate(
        DELEGATOR, OP_A, native_asset(), 10, std::span{unknown});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::UnknownBlueprint);

    res = delegate(1001);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientBalance);

    ASSERT_FALSE(gateway.set_operator_active(OP_A, false).has_error());
    res = delegate(10);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::OperatorNotActive);

    EXPECT_EQ(delegated(), 0);
    EXPECT_EQ(state.get_balance(DELEGATOR), 1000);
}

TEST_F(MultiAssetDelegationTest, unstake_lifecycle)
{
    ASSERT_FALSE(delegate(500).has_error());

    auto res = gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 501);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientDelegation);

    EXPECT_FALSE(gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 300)
                     .has_error());
    EXPECT_EQ(unstaking(), 300);

    // only the part that is not already unstaking can be scheduled
    res = gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 201);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientDelegation);

    res = gateway.cancel_unstake(DELEGATOR, OP_A, native_asset(), 301);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientUnstake);

    EXPECT_FALSE(gateway.cancel_unstake(DELEGATOR, OP_A, native_asset(), 100)
                     .has_error());
    EXPECT_EQ(unstaking(), 200);

    EXPECT_FALSE(
        gateway.syscall_execute_unstake(DELEGATOR, OP_A, native_asset(), 200)
            .has_error());
    EXPECT_EQ(delegated(), 300);
    EXPECT_EQ(unstaking(), 0);
    EXPECT_EQ(gateway.get_idle(DELEGATOR, native_asset()), 200);

    res = gateway.syscall_execute_unstake(DELEGATOR, OP_A, native_asset(), 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientUnstake);
}

TEST_F(MultiAssetDelegationTest, unstake_from_leaving_operator)
{
    ASSERT_FALSE(delegate(500).has_error());
    ASSERT_FALSE(gateway.set_operator_active(OP_A, false).has_error());

    EXPECT_FALSE(gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 500)
                     .has_error());
    EXPECT_FALSE(
        gateway.syscall_execute_unstake(DELEGATOR, OP_A, native_asset(), 500)
            .has_error());
    EXPECT_EQ(delegated(), 0);
    EXPECT_EQ(gateway.get_idle(DELEGATOR, native_asset()), 500);
}

TEST_F(MultiAssetDelegationTest, withdraw_lifecycle)
{
    ASSERT_FALSE(delegate(500).has_error());
    ASSERT_FALSE(gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 500)
                     .has_error());
    ASSERT_FALSE(
        gateway.syscall_execute_unstake(DELEGATOR, OP_A, native_asset(), 500)
            .has_error());

    auto res = gateway.schedule_withdraw(DELEGATOR, native_asset(), 501);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientIdle);

    EXPECT_FALSE(
        gateway.schedule_withdraw(DELEGATOR, native_asset(), 200).has_error());
    EXPECT_FALSE(
        gateway.schedule_withdraw(DELEGATOR, native_asset(), 100).has_error());
    auto const pending = gateway.get_pending_withdraw(DELEGATOR);
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->amount.native(), 300);
    EXPECT_EQ(pending->asset, native_asset());
    EXPECT_EQ(gateway.get_idle(DELEGATOR, native_asset()), 200);

    res = gateway.cancel_withdraw(DELEGATOR, native_asset(), 301);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientWithdraw);

    // a cancelled withdraw is paid back, idle is unchanged
    EXPECT_FALSE(
        gateway.cancel_withdraw(DELEGATOR, native_asset(), 100).has_error());
    EXPECT_EQ(gateway.get_idle(DELEGATOR, native_asset()), 200);
    EXPECT_EQ(gateway.get_pending_withdraw(DELEGATOR)->amount.native(), 200);
    EXPECT_EQ(state.get_balance(DELEGATOR), 600);
    EXPECT_EQ(state.get_balance(DELEGATION_CA), 400);

    EXPECT_FALSE(gateway.execute_withdraw(DELEGATOR).has_error());
    EXPECT_FALSE(gateway.get_pending_withdraw(DELEGATOR).has_value());
    EXPECT_EQ(state.get_balance(DELEGATOR), 800);
    EXPECT_EQ(state.get_balance(DELEGATION_CA), 200);

    // nothing pending is not an error
    EXPECT_FALSE(gateway.execute_withdraw(DELEGATOR).has_error());
    EXPECT_EQ(state.get_balance(DELEGATOR), 800);
}

TEST_F(MultiAssetDelegationTest, delegate_leaves_idle_untouched)
{
    ASSERT_FALSE(delegate(500).has_error());
    ASSERT_FALSE(gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 400)
                     .has_error());
    ASSERT_FALSE(
        gateway.syscall_execute_unstake(DELEGATOR, OP_A, native_asset(), 400)
            .has_error());
    EXPECT_EQ(state.get_balance(DELEGATOR), 500);

    EXPECT_FALSE(delegate(500).has_error());
    EXPECT_EQ(gateway.get_idle(DELEGATOR, native_asset()), 400);
    EXPECT_EQ(delegated(), 600);
    EXPECT_EQ(state.get_balance(DELEGATOR), 0);
    EXPECT_EQ(state.get_balance(DELEGATION_CA), 1000);

    // idle does not make up for a missing balance
    auto const res = delegate(1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientBalance);
    EXPECT_EQ(delegated(), 600);

    EXPECT_FALSE(
        gateway.schedule_withdraw(DELEGATOR, native_asset(), 400).has_error());
    EXPECT_EQ(gateway.get_idle(DELEGATOR, native_asset()), 0);
}

TEST_F(MultiAssetDelegationTest, assets_are_separate)
{
    auto const token = erc20_asset(TOKEN);
    ASSERT_FALSE(delegate(100).has_error());
    ASSERT_FALSE(delegate(700, OP_A, token).has_error());

    EXPECT_EQ(delegated(), 100);
    EXPECT_EQ(delegated(token), 700);
    // token funds are bookkeeping only
    EXPECT_EQ(state.get_balance(DELEGATOR), 900);

    ASSERT_FALSE(
        gateway.schedule_unstake(DELEGATOR, OP_A, token, 700).has_error());
    ASSERT_FALSE(gateway.syscall_execute_unstake(DELEGATOR, OP_A, token, 700)
                     .has_error());
    ASSERT_FALSE(gateway.schedule_withdraw(DELEGATOR, token, 300).has_error());

    auto res = gateway.cancel_withdraw(DELEGATOR, native_asset(), 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::AssetMismatch);

    // a second pending withdraw of another asset is refused
    ASSERT_FALSE(gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 100)
                     .has_error());
    ASSERT_FALSE(
        gateway.syscall_execute_unstake(DELEGATOR, OP_A, native_asset(), 100)
            .has_error());
    res = gateway.schedule_withdraw(DELEGATOR, native_asset(), 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::AssetMismatch);
}

TEST_F(MultiAssetDelegationTest, insolvent_gateway_throws)
{
    ASSERT_FALSE(delegate(500).has_error());
    ASSERT_FALSE(gateway.schedule_unstake(DELEGATOR, OP_A, native_asset(), 500)
                     .has_error());
    ASSERT_FALSE(
        gateway.syscall_execute_unstake(DELEGATOR, OP_A, native_asset(), 500)
            .has_error());
    ASSERT_FALSE(
        gateway.schedule_withdraw(DELEGATOR, native_asset(), 500).has_error());

    state.subtract_from_balance(DELEGATION_CA, 1);
    EXPECT_THROW(
        static_cast<void>(gateway.execute_withdraw(DELEGATOR)),
        RestakeException);
}
