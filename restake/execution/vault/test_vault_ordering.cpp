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
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/block_header.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/delegation/delegation_error.hpp>
#include <restake/execution/delegation/delegation_gateway.hpp>
#include <restake/execution/state/block_state.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/vault/constants.hpp>
#include <restake/execution/vault/liquid_delegation_vault.hpp>
#include <restake/execution/vault/requests.hpp>
#include <restake/execution/vault/vault_accounting.hpp>
#include <restake/execution/vault/vault_config.hpp>
#include <restake/execution/vault/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <cstdint>
#include <span>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace restake;
using namespace restake::vault;
using namespace ::testing;

using delegation::DelegationError;
using delegation::native_asset;

namespace
{
    constexpr auto OPERATOR{
        0x00000000000000000000000000000000000000000000000000000000000000aa_bytes32};
    constexpr auto ALICE = 0xa11ce_address;

    class MockGateway : public delegation::DelegationGateway
    {
    public:
        MOCK_METHOD(
            Result<void>, delegate,
            (Address const &, delegation::OperatorId const &,
             delegation::Asset const &, uint256_t const &,
             std::span<uint64_t const>),
            (override));
        MOCK_METHOD(
            Result<void>, schedule_unstake,
            (Address const &, delegation::OperatorId const &,
             delegation::Asset const &, uint256_t const &),
            (override));
        MOCK_METHOD(
            Result<void>, cancel_unstake,
            (Address const &, delegation::OperatorId const &,
             delegation::Asset const &, uint256_t const &),
            (override));
        MOCK_METHOD(
            Result<void>, schedule_withdraw,
            (Address const &, delegation::Asset const &, uint256_t const &),
            (override));
        MOCK_METHOD(
            Result<void>, execute_withdraw, (Address const &), (override));
        MOCK_METHOD(
            Result<void>, cancel_withdraw,
            (Address const &, delegation::Asset const &, uint256_t const &),
            (override));
    };

    struct FixedAccounting final : public VaultAccounting
    {
        uint256_t claimable{0};

        uint256_t max_withdraw(Address const &) const override
        {
            return claimable;
        }
    };

    Result<void> ok()
    {
        return outcome::success();
    }
}

struct VaultOrdering : public ::testing::Test
{
    BlockState bs{};
    State state{bs};
    BlockHeader header{.number = 7, .timestamp = 500};
    StrictMock<MockGateway> gateway{};
    FixedAccounting accounting{};
    LiquidDelegationVault vault{
        state, gateway, accounting,
        make_native_vault_config(OPERATOR, {4}).value(), header};

    void store_unstake(uint256_t const &amount, UnstakeState const s)
    {
        vault.vars.unstake_request(ALICE).store(UnstakeRequest{
            .amount = amount, .timestamp = uint64_t{1}, .state = s});
    }

    void store_withdraw(uint256_t const &amount)
    {
        vault.vars.withdraw_request(ALICE).store(WithdrawRequest{
            .amount = amount,
            .timestamp = uint64_t{1},
            .state = WithdrawState::Scheduled});
    }
};

TEST_F(VaultOrdering, schedule_unstake_calls_gateway_first)
{
    accounting.claimable = 1000;
    EXPECT_CALL(
        gateway,
        schedule_unstake(VAULT_CA, OPERATOR, native_asset(), uint256_t{700}))
        .WillOnce([&](auto const &, auto const &, auto const &, auto const &)
                      -> Result<void> {
            EXPECT_FALSE(vault.get_unstake_request(ALICE).has_value());
            EXPECT_TRUE(state.logs().empty());
            return ok();
        });

    EXPECT_FALSE(vault.schedule_unstake(ALICE, 700).has_error());

    auto const request = vault.get_unstake_request(ALICE);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->amount.native(), 700);
    EXPECT_EQ(request->timestamp.native(), 500);
    EXPECT_EQ(state.logs().size(), 1);
}

TEST_F(VaultOrdering, schedule_unstake_gateway_error_propagates)
{
    accounting.claimable = 1000;
    EXPECT_CALL(gateway, schedule_unstake(_, _, _, _))
        .WillOnce([](auto const &, auto const &, auto const &, auto const &)
                      -> Result<void> {
            return DelegationError::InsufficientDelegation;
        });

    auto const res = vault.schedule_unstake(ALICE, 700);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientDelegation);
    EXPECT_FALSE(vault.get_unstake_request(ALICE).has_value());
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(VaultOrdering, precondition_failures_skip_gateway)
{
    accounting.claimable = 100;

    // StrictMock fails on any gateway call
    EXPECT_EQ(
        vault.schedule_unstake(ALICE, 101).assume_error(),
        VaultError::ExceedsClaimableBalance);
    EXPECT_EQ(
        vault.cancel_unstake(ALICE).assume_error(),
        VaultError::NoScheduledUnstake);
    EXPECT_EQ(
        vault.schedule_withdraw(ALICE, 1).assume_error(),
        VaultError::InvalidUnstakeState);
    EXPECT_EQ(
        vault.cancel_withdraw_and_redelegate(ALICE).assume_error(),
        VaultError::NoScheduledWithdraw);
    EXPECT_EQ(
        vault.on_withdraw(ALICE, 1).assume_error(),
        VaultError::NoScheduledWithdraw);

    store_unstake(50, UnstakeState::Executed);
    EXPECT_EQ(
        vault.schedule_withdraw(ALICE, 51).assume_error(),
        VaultError::ExceedsUnstakeAmount);
    EXPECT_EQ(
        vault.schedule_unstake(ALICE, 10).assume_error(),
        VaultError::InvalidUnstakeState);

    store_withdraw(30);
    EXPECT_EQ(
        vault.on_withdraw(ALICE, 31).assume_error(),
        VaultError::ExceedsWithdrawAmount);
}

TEST_F(VaultOrdering, cancel_unstake_releases_recorded_amount)
{
    store_unstake(300, UnstakeState::Scheduled);
    EXPECT_CALL(
        gateway,
        cancel_unstake(VAULT_CA, OPERATOR, native_asset(), uint256_t{300}))
        .WillOnce([&](auto const &, auto const &, auto const &, auto const &)
                      -> Result<void> {
            EXPECT_TRUE(vault.get_unstake_request(ALICE).has_value());
            return ok();
        });

    EXPECT_FALSE(vault.cancel_unstake(ALICE).has_error());
    EXPECT_FALSE(vault.get_unstake_request(ALICE).has_value());
}

TEST_F(VaultOrdering, schedule_unstake_replaces_scheduled)
{
    accounting.claimable = 1000;
    store_unstake(300, UnstakeState::Scheduled);
    {
        InSequence seq;
        EXPECT_CALL(
            gateway,
            cancel_unstake(VAULT_CA, OPERATOR, native_asset(), uint256_t{300}))
            .WillOnce(
                [](auto const &, auto const &, auto const &, auto const &)
                    -> Result<void> { return ok(); });
        EXPECT_CALL(
            gateway,
            schedule_unstake(
                VAULT_CA, OPERATOR, native_asset(), uint256_t{800}))
            .WillOnce(
                [](auto const &, auto const &, auto const &, auto const &)
                    -> Result<void> { return ok(); });
    }

    EXPECT_FALSE(vault.schedule_unstake(ALICE, 800).has_error());
    EXPECT_EQ(vault.get_unstake_request(ALICE)->amount.native(), 800);
    EXPECT_EQ(state.logs().size(), 2);
}

TEST_F(VaultOrdering, schedule_unstake_replace_cancel_failure)
{
    accounting.claimable = 1000;
    store_unstake(300, UnstakeState::Scheduled);
    EXPECT_CALL(gateway, cancel_unstake(_, _, _, _))
        .WillOnce([](auto const &, auto const &, auto const &, auto const &)
                      -> Result<void> {
            return DelegationError::InsufficientUnstake;
        });

    auto const res = vault.schedule_unstake(ALICE, 800);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientUnstake);
    EXPECT_EQ(vault.get_unstake_request(ALICE)->amount.native(), 300);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(VaultOrdering, schedule_withdraw_redelegates_replaced_request)
{
    store_unstake(300, UnstakeState::Executed);
    store_withdraw(400);
    {
        InSequence seq;
        EXPECT_CALL(
            gateway,
            cancel_withdraw(VAULT_CA, native_asset(), uint256_t{400}))
            .WillOnce([](auto const &, auto const &, auto const &)
                          -> Result<void> { return ok(); });
        EXPECT_CALL(
            gateway,
            delegate(VAULT_CA, OPERATOR, native_asset(), uint256_t{400}, _))
            .WillOnce([](auto const &, auto const &, auto const &,
                         auto const &, auto) -> Result<void> { return ok(); });
        EXPECT_CALL(
            gateway,
            schedule_withdraw(VAULT_CA, native_asset(), uint256_t{300}))
            .WillOnce([](auto const &, auto const &, auto const &)
                          -> Result<void> { return ok(); });
    }

    EXPECT_FALSE(vault.schedule_withdraw(ALICE, 300).has_error());
    EXPECT_EQ(vault.get_withdraw_request(ALICE)->amount.native(), 300);
    EXPECT_FALSE(vault.get_unstake_request(ALICE).has_value());
    EXPECT_EQ(state.logs().size(), 3);
}

TEST_F(VaultOrdering, schedule_withdraw_gateway_failure)
{
    store_unstake(300, UnstakeState::Executed);
    EXPECT_CALL(
        gateway, schedule_withdraw(VAULT_CA, native_asset(), uint256_t{200}))
        .WillOnce(
            [](auto const &, auto const &, auto const &) -> Result<void> {
                return DelegationError::InsufficientIdle;
            });

    auto const res = vault.schedule_withdraw(ALICE, 200);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientIdle);

    auto const unstake = vault.get_unstake_request(ALICE);
    ASSERT_TRUE(unstake.has_value());
    EXPECT_EQ(unstake->amount.native(), 300);
    EXPECT_FALSE(vault.get_withdraw_request(ALICE).has_value());
}

TEST_F(VaultOrdering, redelegate_cancels_then_delegates)
{
    store_withdraw(400);
    {
        InSequence seq;
        EXPECT_CALL(
            gateway,
            cancel_withdraw(VAULT_CA, native_asset(), uint256_t{400}))
            .WillOnce([](auto const &, auto const &, auto const &)
                          -> Result<void> { return ok(); });
        EXPECT_CALL(
            gateway,
            delegate(VAULT_CA, OPERATOR, native_asset(), uint256_t{400}, _))
            .WillOnce([](auto const &, auto const &, auto const &,
                         auto const &,
                         std::span<uint64_t const> const selection)
                          -> Result<void> {
                EXPECT_THAT(
                    std::vector<uint64_t>(selection.begin(), selection.end()),
                    ElementsAre(4));
                return ok();
            });
    }

    EXPECT_FALSE(vault.cancel_withdraw_and_redelegate(ALICE).has_error());
    EXPECT_FALSE(vault.get_withdraw_request(ALICE).has_value());
    EXPECT_EQ(state.logs().size(), 2);
}

TEST_F(VaultOrdering, redelegate_failure_is_not_possible)
{
    store_withdraw(400);
    {
        InSequence seq;
        EXPECT_CALL(gateway, cancel_withdraw(_, _, _))
            .WillOnce([](auto const &, auto const &, auto const &)
                          -> Result<void> { return ok(); });
        EXPECT_CALL(gateway, delegate(_, _, _, _, _))
            .WillOnce([](auto const &, auto const &, auto const &,
                         auto const &, auto) -> Result<void> {
                return DelegationError::OperatorNotActive;
            });
    }

    auto const res = vault.cancel_withdraw_and_redelegate(ALICE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::DelegationNotPossible);

    auto const request = vault.get_withdraw_request(ALICE);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->amount.native(), 400);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(VaultOrdering, on_deposit_failure)
{
    EXPECT_CALL(
        gateway,
        delegate(VAULT_CA, OPERATOR, native_asset(), uint256_t{900}, _))
        .WillOnce([](auto const &, auto const &, auto const &, auto const &,
                     auto) -> Result<void> {
            return DelegationError::UnknownBlueprint;
        });

    auto const res = vault.on_deposit(ALICE, 900);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::DelegationFailed);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(VaultOrdering, on_withdraw_executes_before_drawdown)
{
    store_withdraw(400);
    EXPECT_CALL(gateway, execute_withdraw(VAULT_CA))
        .WillOnce([&](auto const &) -> Result<void> {
            auto const request = vault.get_withdraw_request(ALICE);
            EXPECT_TRUE(request.has_value());
            EXPECT_EQ(request->amount.native(), 400);
            return ok();
        });

    EXPECT_FALSE(vault.on_withdraw(ALICE, 150).has_error());
    auto const request = vault.get_withdraw_request(ALICE);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->amount.native(), 250);
}

TEST_F(VaultOrdering, on_withdraw_gateway_failure)
{
    store_withdraw(400);
    EXPECT_CALL(gateway, execute_withdraw(_))
        .WillOnce([](auto const &) -> Result<void> {
            return DelegationError::InsufficientWithdraw;
        });

    auto const res = vault.on_withdraw(ALICE, 400);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DelegationError::InsufficientWithdraw);
    EXPECT_TRUE(vault.get_withdraw_request(ALICE).has_value());
}
