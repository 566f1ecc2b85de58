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

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/config.hpp>
#include <restake/core/likely.h>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_decode_error.hpp>
#include <restake/execution/core/contract/big_endian.hpp>

#include <concepts>
#include <cstring>

RESTAKE_NAMESPACE_BEGIN

// All solidity uints are are left padded to fit in 32 bytes. An address is
// treated as a uint160 by the encoder. All fixed sized values go in the
// "head".
// https://docs.soliditylang.org/en/latest/abi-spec.html
//
// Note that this only errors out when the input is too short. Any dirty
// higher order bits are ignored and not checked for overflow.
template <typename T>
    requires(
        BigEndianType<T> || std::same_as<T, Address> ||
        std::same_as<T, bytes32_t>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    static_assert(sizeof(T) <= 32);
    if (RESTAKE_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = 32 - sizeof(T);
    T output{};
    std::memcpy(&output, enc.data() + offset, sizeof(T));
    enc.remove_prefix(32);
    return output;
}

RESTAKE_NAMESPACE_END
