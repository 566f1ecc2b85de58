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
#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/receipt.hpp>
#include <restake/execution/state/account_state.hpp>
#include <restake/execution/state/depth_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

class BlockState;

// Overlay of one call over the committed BlockState. Every value read is
// remembered in `original_` so the call can later be validated against the
// committed state, and every mutation is recorded per push depth so a
// rejected operation leaves no trace.
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    BlockState &block_state_;

    Map<Address, OriginalAccountState> original_{};
    Map<Address, DepthStack<AccountState>> current_{};
    DepthStack<std::vector<Receipt::Log>> logs_{{}};

    unsigned depth_{0};

    OriginalAccountState &original_account_state(Address const &);
    AccountState const &recent_account_state(Address const &);
    AccountState &current_account_state(Address const &);
    bytes32_t original_storage(Address const &, bytes32_t const &key);

public:
    explicit State(BlockState &);

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    Map<Address, OriginalAccountState> const &original() const;
    Map<Address, DepthStack<AccountState>> const &current() const;

    void push();
    void pop_accept();
    void pop_reject();

    ////////////////////////////////////////

    bool account_exists(Address const &);
    uint256_t get_balance(Address const &);
    bytes32_t get_storage(Address const &, bytes32_t const &key);

    ////////////////////////////////////////

    void create_account(Address const &);
    void add_to_balance(Address const &, uint256_t const &delta);
    void subtract_from_balance(Address const &, uint256_t const &delta);
    void
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////

    std::vector<Receipt::Log> const &logs();
    void store_log(Receipt::Log const &);
};

RESTAKE_NAMESPACE_END
