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
#include <restake/core/int.hpp>
#include <restake/core/unaligned.hpp>

#include <intx/intx.hpp>

#include <bit>
#include <concepts>

RESTAKE_NAMESPACE_BEGIN

// Unsigned integer held in big endian byte order, the layout of both a
// storage slot and an ABI word. Byte aligned so request entries pack without
// padding.
template <typename T>
    requires(unsigned_integral<T>)
struct BigEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    constexpr BigEndian(T const &x) noexcept
    {
        *this = x;
    }

    constexpr BigEndian &operator=(T const &x) noexcept
    {
        unaligned_store(bytes, intx::bswap(x));
        return *this;
    }

    [[nodiscard]] constexpr T native() const noexcept
    {
        return intx::bswap(std::bit_cast<T>(bytes));
    }

    constexpr bool operator==(BigEndian const &) const noexcept = default;
};

// request states and flags, timestamps and blueprint ids, amounts
using u8_be = BigEndian<uint8_t>;
using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;
static_assert(sizeof(u8_be) == sizeof(uint8_t));
static_assert(alignof(u8_be) == 1);
static_assert(sizeof(u64_be) == sizeof(uint64_t));
static_assert(alignof(u64_be) == 1);
static_assert(sizeof(u256_be) == sizeof(uint256_t));
static_assert(alignof(u256_be) == 1);

template <typename T>
concept BigEndianType = std::same_as<T, BigEndian<typename T::native_type>>;

RESTAKE_NAMESPACE_END
