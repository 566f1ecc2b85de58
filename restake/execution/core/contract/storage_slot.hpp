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
#include <restake/core/unaligned.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>

#include <array>
#include <cstdint>
#include <type_traits>

RESTAKE_NAMESPACE_BEGIN

// Key of a mapping entry which fits in a single slot: the namespace byte
// followed by the key bytes, zero padded.
template <typename Key>
    requires(
        std::has_unique_object_representations_v<Key> &&
        sizeof(Key) < sizeof(bytes32_t))
constexpr bytes32_t packed_slot(uint8_t const ns, Key const &key) noexcept
{
    bytes32_t slot{};
    slot.bytes[0] = ns;
    unaligned_store(&slot.bytes[1], key);
    return slot;
}

// Key of a mapping entry whose key material does not fit behind the namespace
// byte: keccak256(ns . key), like a solidity mapping.
template <typename Key>
    requires std::has_unique_object_representations_v<Key>
bytes32_t hashed_slot(uint8_t const ns, Key const &key) noexcept
{
    std::array<unsigned char, 1 + sizeof(Key)> preimage{};
    preimage[0] = ns;
    unaligned_store(&preimage[1], key);
    return keccak256(preimage);
}

RESTAKE_NAMESPACE_END
