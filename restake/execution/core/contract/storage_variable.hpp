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
#include <restake/core/unaligned.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <array>
#include <cstring>
#include <optional>
#include <type_traits>

RESTAKE_NAMESPACE_BEGIN

// A value of T laid out over N consecutive storage slots of a contract
// account, starting at `key`. The tail of the last slot is zero padded.
//
// All zero slots read as an absent value: an entry whose fields are all zero
// does not exist, so a request or position is removed with clear().
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);

private:
    using Slots = std::array<bytes32_t, N>;

    State &state_;
    Address const account_;
    std::array<bytes32_t, N> keys_;

    Slots read() const
    {
        Slots slots;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(account_, keys_[i]);
        }
        return slots;
    }

    void write(Slots const &slots)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(account_, keys_[i], slots[i]);
        }
    }

public:
    StorageVariable(State &state, Address const &account, bytes32_t const &key)
        : state_{state}
        , account_{account}
    {
        auto const first = intx::be::load<uint256_t>(key);
        for (size_t i = 0; i < N; ++i) {
            keys_[i] = intx::be::store<bytes32_t>(first + i);
        }
    }

    T load() const
    {
        auto const slots = read();
        return unaligned_load<T>(&slots[0].bytes[0]);
    }

    std::optional<T> load_checked() const
    {
        auto const slots = read();
        for (auto const &slot : slots) {
            if (slot != bytes32_t{}) {
                return unaligned_load<T>(&slots[0].bytes[0]);
            }
        }
        return std::nullopt;
    }

    void store(T const &value)
    {
        Slots slots{};
        std::memcpy(&slots[0].bytes, &value, sizeof(T));
        write(slots);
    }

    void clear()
    {
        write(Slots{});
    }
};

RESTAKE_NAMESPACE_END
