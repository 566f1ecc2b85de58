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

#include <ankerl/unordered_dense.h>

#include <optional>

RESTAKE_NAMESPACE_BEGIN

struct Account
{
    uint256_t balance{0};

    friend bool operator==(Account const &, Account const &) = default;
};

// The view of one account held by a State: the account itself, absent until
// first created, and the storage slots read or written through this view.
class AccountState
{
public:
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    std::optional<Account> account_{};
    Map<bytes32_t, bytes32_t> storage_{};

    AccountState() = default;

    explicit AccountState(std::optional<Account> account)
        : account_{std::move(account)}
    {
    }
};

using OriginalAccountState = AccountState;

RESTAKE_NAMESPACE_END
