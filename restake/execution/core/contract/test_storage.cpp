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

#include <restake/core/bytes.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/core/contract/big_endian.hpp>
#include <restake/execution/core/contract/storage_slot.hpp>
#include <restake/execution/core/contract/storage_variable.hpp>
#include <restake/execution/state/block_state.hpp>
#include <restake/execution/state/state.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <cstdint>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    BlockState bs{};
    State state{bs};
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5_u256);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 5_u256);
    var.store(2000_u256);
    EXPECT_EQ(var.load().native(), 2000_u256);
    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 0);
}

TEST_F(Storage, struct_spanning_slots)
{
    struct S
    {
        u64_be x;
        u256_be z;
    };

    using Var = StorageVariable<S>;
    static_assert(Var::N == 2);

    Var var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(S{.x = 4, .z = 6_u256});
    S s = var.load();
    EXPECT_EQ(s.x.native(), 4);
    EXPECT_EQ(s.z.native(), 6);

    // the tail of z lands in the next slot
    EXPECT_EQ(
        state.get_storage(ADDRESS, bytes32_t{6001}),
        0x0000000000000006000000000000000000000000000000000000000000000000_bytes32);

    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(state.get_storage(ADDRESS, bytes32_t{6001}), bytes32_t{});
}

TEST_F(Storage, rejected_store_is_undone)
{
    StorageVariable<u64_be> var(state, ADDRESS, bytes32_t{1});
    var.store(uint64_t{7});

    state.push();
    var.store(uint64_t{8});
    EXPECT_EQ(var.load().native(), 8);
    state.pop_reject();

    EXPECT_EQ(var.load().native(), 7);
}

TEST(StorageSlot, packed)
{
    constexpr auto key = 0x00112233445566778899aabbccddeeff00112233_address;
    auto const slot = packed_slot(0x05, key);
    EXPECT_EQ(
        slot,
        0x0500112233445566778899aabbccddeeff001122330000000000000000000000_bytes32);
}

TEST(StorageSlot, hashed)
{
    constexpr auto key = 0xabcdef_address;

    std::array<unsigned char, 21> preimage{};
    preimage[0] = 0x03;
    std::copy(std::begin(key.bytes), std::end(key.bytes), &preimage[1]);
    EXPECT_EQ(hashed_slot(0x03, key), keccak256(preimage));

    // namespaces never collide for the same key
    EXPECT_NE(hashed_slot(0x03, key), hashed_slot(0x04, key));
    EXPECT_NE(hashed_slot(0x03, key), packed_slot(0x03, key));
}
