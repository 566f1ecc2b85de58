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

#include <restake/core/assert.h>
#include <restake/core/config.hpp>
#include <restake/core/result.hpp>
#include <restake/execution/core/receipt.hpp>
#include <restake/execution/execute_batch.hpp>
#include <restake/execution/state/block_state.hpp>
#include <restake/execution/state/state.hpp>

#include <oneapi/tbb/parallel_for.h>

#include <quill/Quill.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

RESTAKE_ANONYMOUS_NAMESPACE_BEGIN

Result<void> execute_call(BatchCall const &call, State &state)
{
    state.push();
    auto result = call(state);
    if (result.has_error()) {
        state.pop_reject();
    }
    else {
        state.pop_accept();
    }
    return result;
}

Result<Receipt> finalize(
    BlockState &block_state, State const &state, Result<void> result,
    std::vector<Receipt::Log> const &logs)
{
    if (result.has_error()) {
        return std::move(result.error());
    }
    block_state.merge(state);
    return Receipt{.status = 1, .logs = logs};
}

RESTAKE_ANONYMOUS_NAMESPACE_END

RESTAKE_NAMESPACE_BEGIN

std::vector<Result<Receipt>>
execute_batch(BlockState &block_state, std::span<BatchCall const> const calls)
{
    size_t const n = calls.size();

    std::vector<std::unique_ptr<State>> states(n);
    std::vector<std::optional<Result<void>>> results(n);

    oneapi::tbb::parallel_for(size_t{0}, n, [&](size_t const i) {
        states[i] = std::make_unique<State>(block_state);
        results[i].emplace(execute_call(calls[i], *states[i]));
    });

    std::vector<Result<Receipt>> receipts;
    receipts.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (block_state.can_merge(*states[i])) {
            receipts.push_back(finalize(
                block_state,
                *states[i],
                std::move(results[i]).value(),
                states[i]->logs()));
            continue;
        }

        LOG_DEBUG("execute_batch: re-executing call {} of {}", i, n);

        State state{block_state};
        auto result = execute_call(calls[i], state);
        RESTAKE_ASSERT(block_state.can_merge(state));
        receipts.push_back(
            finalize(block_state, state, std::move(result), state.logs()));
    }
    return receipts;
}

RESTAKE_NAMESPACE_END
