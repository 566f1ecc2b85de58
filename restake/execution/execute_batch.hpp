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

#include <restake/core/config.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/receipt.hpp>

#include <functional>
#include <span>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

class BlockState;
class State;

// One operation of a batch. It runs inside a checkpoint of its own State and
// is rejected as a whole when it returns an error.
using BatchCall = std::function<Result<void>(State &)>;

// Runs `calls` speculatively in parallel on the current TBB arena and merges
// them in order; a call whose reads were invalidated by an earlier call is
// executed again before it is merged. The result equals running the calls
// one after the other.
std::vector<Result<Receipt>>
execute_batch(BlockState &, std::span<BatchCall const> calls);

RESTAKE_NAMESPACE_END
