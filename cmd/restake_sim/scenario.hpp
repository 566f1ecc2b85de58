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
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/block_header.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/execute_batch.hpp>
#include <restake/execution/vault/vault_config.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

class BlockState;

struct OperatorGenesis
{
    delegation::OperatorId id;
    bool active;
    std::vector<uint64_t> blueprints;
};

struct ScenarioAction
{
    std::string description;
    BatchCall call;
    // "success" or the message of the expected error
    std::optional<std::string> expect;
};

struct ScenarioBatch
{
    BlockHeader header;
    std::vector<ScenarioAction> actions;
};

struct Scenario
{
    vault::VaultConfig config;
    std::vector<OperatorGenesis> operators;
    std::vector<std::pair<Address, uint256_t>> balances;
    // every depositor named by the scenario, in order of appearance
    std::vector<Address> depositors;
    std::vector<ScenarioBatch> batches;
};

// Throws nlohmann::json::exception or std::invalid_argument on a malformed
// scenario.
Scenario load_scenario(std::filesystem::path const &);

// Funds the accounts and registers the operators of `scenario`.
Result<void> load_genesis(Scenario const &, BlockState &);

nlohmann::json dump_state(Scenario const &, BlockState &);

RESTAKE_NAMESPACE_END
