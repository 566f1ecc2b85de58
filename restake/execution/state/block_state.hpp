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
#include <restake/execution/state/account_state.hpp>
#include <restake/execution/state/state_deltas.hpp>

#include <optional>

RESTAKE_NAMESPACE_BEGIN

class State;

// Committed state shared by every call of a batch. Reads are safe from any
// thread; merges are applied one call at a time, in batch order.
class BlockState final
{
    StateDeltas state_{};

public:
    BlockState() = default;

    BlockState(BlockState const &) = delete;
    BlockState &operator=(BlockState const &) = delete;

    std::optional<Account> read_account(Address const &) const;
    bytes32_t read_storage(Address const &, bytes32_t const &key) const;

    // Genesis allocation of a funded account
    void create_account(Address const &, uint256_t const &balance);

    bool can_merge(State const &) const;
    void merge(State const &);
};

RESTAKE_NAMESPACE_END
