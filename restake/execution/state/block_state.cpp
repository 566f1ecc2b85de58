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

#include <restake/execution/state/block_state.hpp>

#include <restake/core/assert.h>
#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/state/account_state.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/state/state_deltas.hpp>

#include <optional>

RESTAKE_NAMESPACE_BEGIN

std::optional<Account> BlockState::read_account(Address const &address) const
{
    StateDeltas::const_accessor it{};
    if (state_.find(it, address)) {
        return it->second.account;
    }
    return std::nullopt;
}

bytes32_t
BlockState::read_storage(Address const &address, bytes32_t const &key) const
{
    StateDeltas::const_accessor it{};
    if (!state_.find(it, address)) {
        return {};
    }
    StorageDeltas::const_accessor it2{};
    if (it->second.storage.find(it2, key)) {
        return it2->second;
    }
    return {};
}

void BlockState::create_account(
    Address const &address, uint256_t const &balance)
{
    StateDeltas::accessor it{};
    state_.insert(it, address);
    it->second.account.balance = balance;
}

bool BlockState::can_merge(State const &state) const
{
    for (auto const &[address, account_state] : state.original()) {
        if (account_state.account_ != read_account(address)) {
            return false;
        }
        for (auto const &[key, value] : account_state.storage_) {
            if (value != read_storage(address, key)) {
                return false;
            }
        }
    }
    return true;
}

void BlockState::merge(State const &state)
{
    for (auto const &[address, stack] : state.current()) {
        RESTAKE_ASSERT(stack.size() == 1);
        RESTAKE_ASSERT(stack.depth() == 0);
        auto const &account_state = stack.recent();
        auto const &account = account_state.account_;
        if (!account.has_value()) {
            continue;
        }
        StateDeltas::accessor it{};
        state_.insert(it, address);
        it->second.account = account.value();
        for (auto const &[key, value] : account_state.storage_) {
            StorageDeltas::accessor it2{};
            it->second.storage.insert(it2, key);
            it2->second = value;
        }
    }
}

RESTAKE_NAMESPACE_END
