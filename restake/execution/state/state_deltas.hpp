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
#include <restake/execution/core/address.hpp>
#include <restake/execution/state/account_state.hpp>

#include <oneapi/tbb/concurrent_hash_map.h>

RESTAKE_NAMESPACE_BEGIN

using StorageDeltas = oneapi::tbb::concurrent_hash_map<bytes32_t, bytes32_t>;

struct StateDelta
{
    Account account{};
    StorageDeltas storage{};
};

using StateDeltas = oneapi::tbb::concurrent_hash_map<Address, StateDelta>;

RESTAKE_NAMESPACE_END
