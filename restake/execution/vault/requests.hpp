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

#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/vault/config.hpp>

#include <cstdint>

RESTAKE_VAULT_NAMESPACE_BEGIN

// A zeroed request is an absent one, so `None` must stay 0 in both state
// enums.

enum class UnstakeState : uint8_t
{
    None = 0,
    Scheduled = 1,
    Executed = 2,
};

enum class WithdrawState : uint8_t
{
    None = 0,
    Scheduled = 1,
    Ready = 2, // never produced, the withdraw hook consumes from Scheduled
};

struct UnstakeRequest
{
    u256_be amount;
    u64_be timestamp;
    UnstakeState state;
};

static_assert(sizeof(UnstakeRequest) == 41);
static_assert(alignof(UnstakeRequest) == 1);

struct WithdrawRequest
{
    u256_be amount;
    u64_be timestamp;
    WithdrawState state;
};

static_assert(sizeof(WithdrawRequest) == 41);
static_assert(alignof(WithdrawRequest) == 1);

RESTAKE_VAULT_NAMESPACE_END
