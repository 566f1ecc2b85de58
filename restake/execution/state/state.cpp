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

#include <restake/execution/state/state.hpp>

#include <restake/core/assert.h>
#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/core/likely.h>
#include <restake/core/restake_exception.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/receipt.hpp>
#include <restake/execution/state/account_state.hpp>
#include <restake/execution/state/block_state.hpp>
#include <restake/execution/state/depth_stack.hpp>

#include <limits>
#include <optional>
#include <utility>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

OriginalAccountState &State::original_account_state(Address const &address)
{
    auto it = original_.find(address);
    if (it == original_.end()) {
        // block state
        auto const account = block_state_.read_account(address);
        it = original_.try_emplace(address, account).first;
    }
    return it->second;
}

AccountState const &State::recent_account_state(Address const &address)
{
    // current
    auto const it = current_.find(address);
    if (it != current_.end()) {
        return it->second.recent();
    }
    // original
    return original_account_state(address);
}

AccountState &State::current_account_state(Address const &address)
{
    // current
    auto it = current_.find(address);
    if (RESTAKE_UNLIKELY(it == current_.end())) {
        // original; storage is copied lazily through original_storage
        AccountState account_state{original_account_state(address).account_};
        it = current_.try_emplace(address, std::move(account_state), depth_)
                 .first;
    }
    return it->second.current(depth_);
}

bytes32_t State::original_storage(Address const &address, bytes32_t const &key)
{
    auto &storage = original_account_state(address).storage_;
    auto it = storage.find(key);
    if (it == storage.end()) {
        bytes32_t const value = block_state_.read_storage(address, key);
        it = storage.try_emplace(key, value).first;
    }
    return it->second;
}

State::State(BlockState &block_state)
    : block_state_{block_state}
{
}

State::Map<Address, OriginalAccountState> const &State::original() const
{
    return original_;
}

State::Map<Address, DepthStack<AccountState>> const &State::current() const
{
    return current_;
}

void State::push()
{
    ++depth_;
}

void State::pop_accept()
{
    RESTAKE_ASSERT(depth_);

    for (auto &it : current_) {
        it.second.pop_accept(depth_);
    }

    logs_.pop_accept(depth_);

    --depth_;
}

void State::pop_reject()
{
    RESTAKE_ASSERT(depth_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.pop_reject(depth_)) {
            removals.push_back(it.first);
        }
    }

    logs_.pop_reject(depth_);

    while (removals.size()) {
        current_.erase(removals.back());
        removals.pop_back();
    }

    --depth_;
}

bool State::account_exists(Address const &address)
{
    return recent_account_state(address).account_.has_value();
}

uint256_t State::get_balance(Address const &address)
{
    auto const &account = recent_account_state(address).account_;
    if (RESTAKE_LIKELY(account.has_value())) {
        return account.value().balance;
    }
    return 0;
}

bytes32_t State::get_storage(Address const &address, bytes32_t const &key)
{
    auto const it = current_.find(address);
    if (it != current_.end()) {
        auto const &storage = it->second.recent().storage_;
        if (auto const it2 = storage.find(key); it2 != storage.end()) {
            return it2->second;
        }
    }
    return original_storage(address, key);
}

void State::create_account(Address const &address)
{
    auto &account = current_account_state(address).account_;
    if (RESTAKE_UNLIKELY(!account.has_value())) {
        account = Account{};
    }
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &account = current_account_state(address).account_;
    if (RESTAKE_UNLIKELY(!account.has_value())) {
        account = Account{};
    }

    RESTAKE_ASSERT_THROW(
        std::numeric_limits<uint256_t>::max() - delta >=
            account.value().balance,
        "balance overflow");

    account.value().balance += delta;
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account = current_account_state(address).account_;
    if (RESTAKE_UNLIKELY(!account.has_value())) {
        account = Account{};
    }

    RESTAKE_ASSERT_THROW(
        delta <= account.value().balance, "balance underflow");

    account.value().balance -= delta;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    // record the committed value so a concurrent writer is detected on merge
    (void)original_storage(address, key);

    auto &account_state = current_account_state(address);
    if (RESTAKE_UNLIKELY(!account_state.account_.has_value())) {
        account_state.account_ = Account{};
    }
    account_state.storage_.insert_or_assign(key, value);
}

std::vector<Receipt::Log> const &State::logs()
{
    return logs_.recent();
}

void State::store_log(Receipt::Log const &log)
{
    auto &logs = logs_.current(depth_);
    logs.push_back(log);
}

RESTAKE_NAMESPACE_END
