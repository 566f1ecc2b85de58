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

#include <intx/intx.hpp>

#include <concepts>

RESTAKE_NAMESPACE_BEGIN

// Amounts, shares and balances are 256 bit like the EVM word they are
// stored in.
using uint256_t = ::intx::uint256;

static_assert(sizeof(uint256_t) == 32);
static_assert(alignof(uint256_t) == 8);

// integers that can be stored big endian in a storage slot or ABI word
template <class T>
concept unsigned_integral =
    std::unsigned_integral<T> || std::same_as<uint256_t, T>;

RESTAKE_NAMESPACE_END
