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
#include <restake/execution/execute_batch.hpp>
#include <restake/execution/state/block_state.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/vault/constants.hpp>
#include <restake/execution/vault/requests.hpp>
#include <restake/execution/vault/vault_config.hpp>
#include <restake/execution/vault/vault_deployment.hpp>
#include <restake/execution/vault/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <oneapi/tbb/task_arena.h>

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace restake::vault;

namespace
{
    constexpr auto OPERATOR{
        0x00000000000000000000000000000000000000000000000000000000000000cc_bytes32};
    constexpr auto ALICE = 0xa11ce_address;
    constexpr auto BOB = 0xb0b_address;
    constexpr auto CAROL = 0xca201_address;

    BatchCall transfer(Address const &from, Address const &to, uint64_t amount)
    {
        return [=](State &state) -> Result<void> {
            if (state.get_balance(from) < amount) {
                return VaultError::InsufficientBalance;
            }
            state.subtract_from_balance(from, amount);
            state.add_to_balance(to, amount);
            return outcome::success();
        };
    }
}

struct ExecuteBatch : public ::testing::Test
{
    BlockState bs{};
    BlockHeader header{.number = 1, .timestamp = 10};
    VaultConfig const config{
        make_native_vault_config(OPERATOR, {1}).value()};

    void SetUp() override
    {
        bs.create_account(ALICE, 1000);
        bs.create_account(BOB, 1000);

        State state{bs};
        VaultDeployment d{state, config, header};
        ASSERT_FALSE(d.gateway.register_operator(OPERATOR).has_error());
        ASSERT_FALSE(d.gateway.add_blueprint(OPERATOR, 1).has_error());
        bs.merge(state);
    }

    template <typename F>
    BatchCall vault_call(F f)
    {
        return [this, f](State &state) -> Result<void> {
            VaultDeployment d{state, config, header};
            return f(d);
        };
    }
};

TEST_F(ExecuteBatch, empty)
{
    EXPECT_TRUE(execute_batch(bs, {}).empty());
}

TEST_F(ExecuteBatch, independent_calls)
{
    std::vector<BatchCall> const calls{
        transfer(ALICE, CAROL, 100), transfer(BOB, BOB, 0)};
    auto const receipts = execute_batch(bs, calls);

    ASSERT_EQ(receipts.size(), 2);
    for (auto const &receipt : receipts) {
        ASSERT_FALSE(receipt.has_error());
        EXPECT_EQ(receipt.value().status, 1);
    }
    EXPECT_EQ(bs.read_account(ALICE).value().balance, 900);
    EXPECT_EQ(bs.read_account(CAROL).value().balance, 100);
}

TEST_F(ExecuteBatch, conflicting_calls_are_serialized)
{
    std::vector<BatchCall> const calls{
        transfer(ALICE, CAROL, 600),
        transfer(ALICE, BOB, 300),
        transfer(ALICE, BOB, 300)};
    auto const receipts = execute_batch(bs, calls);

    ASSERT_EQ(receipts.size(), 3);
    EXPECT_FALSE(receipts[0].has_error());
    EXPECT_FALSE(receipts[1].has_error());
    // only 100 left by then
    ASSERT_TRUE(receipts[2].has_error());
    EXPECT_EQ(receipts[2].assume_error(), VaultError::InsufficientBalance);

    EXPECT_EQ(bs.read_account(ALICE).value().balance, 100);
    EXPECT_EQ(bs.read_account(BOB).value().balance, 1300);
    EXPECT_EQ(bs.read_account(CAROL).value().balance, 600);
}

TEST_F(ExecuteBatch, failed_call_leaves_no_trace)
{
    std::vector<BatchCall> const calls{
        [](State &state) -> Result<void> {
            state.add_to_balance(CAROL, 5);
            return VaultError::InvalidAmount;
        },
        transfer(BOB, CAROL, 1)};
    auto const receipts = execute_batch(bs, calls);

    ASSERT_TRUE(receipts[0].has_error());
    EXPECT_FALSE(receipts[1].has_error());
    EXPECT_EQ(bs.read_account(CAROL).value().balance, 1);
}

TEST_F(ExecuteBatch, vault_calls_see_earlier_calls)
{
    // the unstake only sees the shares once the deposit is merged
    std::vector<BatchCall> const calls{
        vault_call([](VaultDeployment &d) {
            return d.shares.deposit(ALICE, 400);
        }),
        vault_call([](VaultDeployment &d) {
            return d.shares.deposit(BOB, 200);
        }),
        vault_call([](VaultDeployment &d) {
            return d.vault.schedule_unstake(ALICE, 400);
        })};
    auto const receipts = execute_batch(bs, calls);

    ASSERT_EQ(receipts.size(), 3);
    for (auto const &receipt : receipts) {
        EXPECT_FALSE(receipt.has_error());
    }
    // AssetsDelegated and Deposit
    EXPECT_EQ(receipts[0].value().logs.size(), 2);
    ASSERT_EQ(receipts[2].value().logs.size(), 1);
    EXPECT_EQ(receipts[2].value().logs[0].address, VAULT_CA);

    State state{bs};
    VaultDeployment d{state, config, header};
    EXPECT_EQ(d.ledger.total_supply(), 600);
    auto const request = d.vault.get_unstake_request(ALICE);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->amount.native(), 400);
    EXPECT_EQ(request->state, UnstakeState::Scheduled);
    EXPECT_FALSE(d.vault.get_unstake_request(BOB).has_value());
}

TEST_F(ExecuteBatch, matches_serial_execution)
{
    std::vector<BatchCall> calls;
    for (unsigned i = 0; i < 32; ++i) {
        calls.push_back(transfer(i % 2 ? ALICE : BOB, CAROL, 10));
    }

    oneapi::tbb::task_arena arena{4};
    std::vector<Result<Receipt>> receipts;
    arena.execute([&] { receipts = execute_batch(bs, calls); });

    for (auto const &receipt : receipts) {
        EXPECT_FALSE(receipt.has_error());
    }
    EXPECT_EQ(bs.read_account(ALICE).value().balance, 840);
    EXPECT_EQ(bs.read_account(BOB).value().balance, 840);
    EXPECT_EQ(bs.read_account(CAROL).value().balance, 320);
}
