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

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_decode.hpp>
#include <restake/execution/core/contract/abi_decode_error.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace intx::literals;

template <typename T>
class UintDecodeTest : public ::testing::Test
{
};

typedef ::testing::Types<u8_be, u64_be, u256_be> UintTypes;
TYPED_TEST_SUITE(UintDecodeTest, UintTypes);

TYPED_TEST(UintDecodeTest, uint)
{
    TypeParam expected{255};
    bytes32_t const encoded = abi_encode_uint<TypeParam>(expected);
    byte_string_view input{encoded};
    auto const decoded_res = abi_decode_fixed<TypeParam>(input);
    EXPECT_TRUE(input.empty());
    ASSERT_TRUE(decoded_res.has_value());
    EXPECT_EQ(decoded_res.value().native(), expected.native());
}

TYPED_TEST(UintDecodeTest, input_too_short)
{
    TypeParam expected{255};
    bytes32_t const encoded = abi_encode_uint<TypeParam>(expected);
    byte_string_view input = byte_string_view{encoded}.substr(1);
    auto const decoded_res = abi_decode_fixed<TypeParam>(input);
    EXPECT_EQ(input.size(), 31);
    ASSERT_TRUE(decoded_res.has_error());
    EXPECT_EQ(decoded_res.assume_error(), AbiDecodeError::InputTooShort);
}

TEST(AbiDecode, address)
{
    constexpr auto expected = 0xdeadbeef000000000000000000f00d0000000100_address;
    bytes32_t const encoded = abi_encode_address(expected);
    byte_string_view input{encoded};
    auto const res = abi_decode_fixed<Address>(input);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), expected);
}

TEST(AbiDecode, consumes_one_word_at_a_time)
{
    byte_string encoded;
    encoded += abi_encode_uint(u256_be{1000_u256});
    encoded += abi_encode_address(0xabcd_address);
    encoded += uint8_t{0xff};

    byte_string_view input{encoded};
    auto const amount = abi_decode_fixed<u256_be>(input);
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(amount.value().native(), 1000);
    EXPECT_EQ(input.size(), 33);

    auto const address = abi_decode_fixed<Address>(input);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address.value(), 0xabcd_address);

    // leftovers are for the caller to reject
    EXPECT_EQ(input.size(), 1);
    EXPECT_TRUE(abi_decode_fixed<bytes32_t>(input).has_error());
}

TEST(AbiDecode, dirty_high_bits_ignored)
{
    auto const encoded =
        0xff000000000000000000000000000000000000000000000000000000000000ff_bytes32;
    byte_string_view input{encoded};
    auto const res = abi_decode_fixed<u64_be>(input);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().native(), 0xff);
}
