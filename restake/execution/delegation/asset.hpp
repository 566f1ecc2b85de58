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
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/config.hpp>

#include <cstdint>
#include <type_traits>

RESTAKE_DELEGATION_NAMESPACE_BEGIN

// Opaque handle of a staking operator
using OperatorId = bytes32_t;

enum class AssetKind : uint8_t
{
    Native = 0,
    Erc20 = 1,
};

// The asset a delegation moves. `token` is the zero address for the native
// asset.
struct Asset
{
    AssetKind kind;
    Address token;

    friend bool operator==(Asset const &, Asset const &) = default;
};

static_assert(sizeof(Asset) == 21);
static_assert(alignof(Asset) == 1);
static_assert(std::has_unique_object_representations_v<Asset>);

constexpr Asset native_asset() noexcept
{
    return Asset{.kind = AssetKind::Native, .token = {}};
}

constexpr Asset erc20_asset(Address const &token) noexcept
{
    return Asset{.kind = AssetKind::Erc20, .token = token};
}

RESTAKE_DELEGATION_NAMESPACE_END
