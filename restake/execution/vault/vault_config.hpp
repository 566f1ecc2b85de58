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

#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/vault/config.hpp>

#include <cstdint>
#include <vector>

RESTAKE_VAULT_NAMESPACE_BEGIN

// Fixed at initialisation: who the vault delegates to, which asset it moves
// and which blueprints of the operator the delegation applies to.
struct VaultConfig
{
    delegation::OperatorId op;
    delegation::Asset asset;
    std::vector<uint64_t> blueprint_selection;
};

Result<VaultConfig> make_native_vault_config(
    delegation::OperatorId const &, std::vector<uint64_t> blueprint_selection);

Result<VaultConfig> make_erc20_vault_config(
    delegation::OperatorId const &, Address const &token,
    std::vector<uint64_t> blueprint_selection);

RESTAKE_VAULT_NAMESPACE_END
