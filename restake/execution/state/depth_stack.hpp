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

#include <restake/core/assert.h>
#include <restake/core/config.hpp>

#include <cstddef>
#include <utility>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

// Value of T across the nesting depths of State::push. A depth only gets its
// own copy once it asks for a mutable value; the bottom frame holds the value
// the object had when it was first touched.
template <class T>
class DepthStack
{
    struct Frame
    {
        unsigned depth;
        T value;
    };

    std::vector<Frame> frames_{};

    Frame &top()
    {
        RESTAKE_ASSERT(!frames_.empty());
        return frames_.back();
    }

public:
    DepthStack(T value, unsigned const depth = 0)
    {
        frames_.push_back(Frame{.depth = depth, .value = std::move(value)});
    }

    DepthStack(DepthStack &&) = default;
    DepthStack(DepthStack const &) = delete;
    DepthStack &operator=(DepthStack &&) = default;
    DepthStack &operator=(DepthStack const &) = delete;

    std::size_t size() const
    {
        return frames_.size();
    }

    unsigned depth() const
    {
        RESTAKE_ASSERT(!frames_.empty());
        return frames_.back().depth;
    }

    T const &recent() const
    {
        RESTAKE_ASSERT(!frames_.empty());
        return frames_.back().value;
    }

    // copy on first write at `depth`
    T &current(unsigned const depth)
    {
        if (depth > top().depth) {
            Frame copy{.depth = depth, .value = top().value};
            frames_.push_back(std::move(copy));
        }
        return top().value;
    }

    // folds the frame of `depth` into the enclosing depth
    void pop_accept(unsigned const depth)
    {
        RESTAKE_ASSERT(depth);
        if (top().depth != depth) {
            return;
        }
        auto const n = frames_.size();
        if (n > 1 && frames_[n - 2].depth + 1 == depth) {
            frames_[n - 2].value = std::move(frames_[n - 1].value);
            frames_.pop_back();
        }
        else {
            top().depth = depth - 1;
        }
    }

    // drops the frame of `depth`; true when nothing is left
    bool pop_reject(unsigned const depth)
    {
        RESTAKE_ASSERT(depth);
        if (top().depth == depth) {
            frames_.pop_back();
        }
        return frames_.empty();
    }
};

RESTAKE_NAMESPACE_END
