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
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/vault/vault_config.hpp>
#include <restake/execution/vault/vault_error.hpp>

#include <cstdint>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace restake;
using namespace restake::vault;
using ::testing::ElementsAre;

namespace
{
    constexpr auto OPERATOR{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
}

TEST(VaultConfig, native)
{
    auto const res = make_native_vault_config(OPERATOR, {3, 1, 2});
    ASSERT_FALSE(res.has_error());
    auto const &config = res.value();
    EXPECT_EQ(config.op, OPERATOR);
    EXPECT_EQ(config.asset, delegation::native_asset());
    EXPECT_EQ(config.asset.token, Address{});
    EXPECT_THAT(config.blueprint_selection, ElementsAre(3, 1, 2));
}

TEST(VaultConfig, erc20)
{
    constexpr auto token = 0xdead_address;
    auto const res = make_erc20_vault_config(OPERATOR, token, {5});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().asset.kind, delegation::AssetKind::Erc20);
    EXPECT_EQ(res.value().asset.token, token);
}

TEST(VaultConfig, empty_selection)
{
    auto res = make_native_vault_config(OPERATOR, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::InvalidBlueprintSelection);

    res = make_erc20_vault_config(OPERATOR, 0xdead_address, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::InvalidBlueprintSelection);
}

TEST(VaultConfig, zero_token)
{
    // the token is checked before the selection
    auto const res = make_erc20_vault_config(OPERATOR, Address{}, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::InvalidInput);
}
