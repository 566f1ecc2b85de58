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

#include "scenario.hpp"

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/likely.h>
#include <restake/core/result.hpp>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/block_header.hpp>
#include <restake/execution/delegation/asset.hpp>
#include <restake/execution/delegation/constants.hpp>
#include <restake/execution/delegation/multi_asset_delegation.hpp>
#include <restake/execution/state/block_state.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/vault/constants.hpp>
#include <restake/execution/vault/requests.hpp>
#include <restake/execution/vault/vault_config.hpp>
#include <restake/execution/vault/vault_deployment.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

RESTAKE_ANONYMOUS_NAMESPACE_BEGIN

using json = nlohmann::json;

Address parse_address(json const &j)
{
    auto const address = evmc::from_hex<Address>(j.get<std::string>());
    if (RESTAKE_UNLIKELY(!address.has_value())) {
        throw std::invalid_argument{"invalid address " + j.dump()};
    }
    return address.value();
}

delegation::OperatorId parse_operator(json const &j)
{
    auto const id =
        evmc::from_hex<delegation::OperatorId>(j.get<std::string>());
    if (RESTAKE_UNLIKELY(!id.has_value())) {
        throw std::invalid_argument{"invalid operator id " + j.dump()};
    }
    return id.value();
}

// decimal or 0x-prefixed hex string, or an unsigned JSON number
uint256_t parse_amount(json const &j)
{
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>();
    }
    return intx::from_string<uint256_t>(j.get<std::string>());
}

std::string to_hex(Address const &address)
{
    return "0x" + evmc::hex(address);
}

json request_to_json(
    uint256_t const &amount, uint64_t const timestamp, uint8_t const state)
{
    json res = json::object();
    res["amount"] = intx::to_string(amount);
    res["timestamp"] = timestamp;
    res["state"] = state;
    return res;
}

vault::VaultConfig parse_vault_config(json const &j)
{
    auto const op = parse_operator(j.at("operator"));
    auto blueprints = j.at("blueprints").get<std::vector<uint64_t>>();

    Result<vault::VaultConfig> config = [&] {
        auto const &asset = j.at("asset");
        if (asset.is_string() && asset.get<std::string>() == "native") {
            return vault::make_native_vault_config(op, std::move(blueprints));
        }
        return vault::make_erc20_vault_config(
            op, parse_address(asset.at("erc20")), std::move(blueprints));
    }();
    if (RESTAKE_UNLIKELY(config.has_error())) {
        throw std::invalid_argument{
            std::string{"invalid vault config: "} +
            config.assume_error().message().c_str()};
    }
    return std::move(config).assume_value();
}

ScenarioAction parse_action(
    json const &j, vault::VaultConfig const &config, BlockHeader const &header,
    std::vector<Address> &depositors)
{
    using vault::VaultDeployment;

    auto const kind = j.at("op").get<std::string>();
    std::optional<std::string> expect;
    if (j.contains("expect")) {
        expect = j.at("expect").get<std::string>();
    }

    if (kind == "set_operator_active") {
        auto const op = parse_operator(j.at("operator"));
        bool const active = j.at("active").get<bool>();
        return ScenarioAction{
            .description = kind,
            .call = [op, active](State &state) -> Result<void> {
                delegation::MultiAssetDelegation gateway{state};
                return gateway.set_operator_active(op, active);
            },
            .expect = std::move(expect)};
    }

    Address const from = parse_address(j.at("from"));
    if (std::find(depositors.begin(), depositors.end(), from) ==
        depositors.end()) {
        depositors.push_back(from);
    }
    std::string const description = kind + " " + to_hex(from);

    auto with_deployment = [config, header](auto &&f) {
        return [config, header, f](State &state) -> Result<void> {
            VaultDeployment deployment{state, config, header};
            return f(deployment);
        };
    };

    BatchCall call;
    if (kind == "deposit") {
        auto const amount = parse_amount(j.at("amount"));
        call = with_deployment([from, amount](VaultDeployment &d) {
            return d.shares.deposit(from, amount);
        });
    }
    else if (kind == "withdraw") {
        auto const amount = parse_amount(j.at("amount"));
        call = with_deployment([from, amount](VaultDeployment &d) {
            return d.shares.withdraw(from, amount);
        });
    }
    else if (kind == "schedule_unstake") {
        auto const amount = parse_amount(j.at("amount"));
        call = with_deployment([from, amount](VaultDeployment &d) {
            return d.vault.schedule_unstake(from, amount);
        });
    }
    else if (kind == "cancel_unstake") {
        call = with_deployment(
            [from](VaultDeployment &d) { return d.vault.cancel_unstake(from); });
    }
    else if (kind == "execute_unstake") {
        call = with_deployment([from](VaultDeployment &d) {
            return d.execute_matured_unstake(from);
        });
    }
    else if (kind == "schedule_withdraw") {
        auto const amount = parse_amount(j.at("amount"));
        call = with_deployment([from, amount](VaultDeployment &d) {
            return d.vault.schedule_withdraw(from, amount);
        });
    }
    else if (kind == "cancel_withdraw_and_redelegate") {
        call = with_deployment([from](VaultDeployment &d) {
            return d.vault.cancel_withdraw_and_redelegate(from);
        });
    }
    else if (kind == "call") {
        // raw ABI call of the vault entry points
        auto const input = evmc::from_hex(j.at("input").get<std::string>());
        if (RESTAKE_UNLIKELY(!input.has_value())) {
            throw std::invalid_argument{"invalid call input " + j.dump()};
        }
        uint256_t const value =
            j.contains("value") ? parse_amount(j.at("value")) : uint256_t{0};
        call = with_deployment([from, input = byte_string{input.value()},
                                value](VaultDeployment &d) -> Result<void> {
            byte_string_view view{input};
            auto const [func, cost] =
                vault::LiquidDelegationVault::precompile_dispatch(view);
            BOOST_OUTCOME_TRY(
                auto const output,
                (d.vault.*func)(
                    view, from, intx::be::store<evmc_uint256be>(value)));
            LOG_DEBUG(
                "call from {} used {} gas, returned 0x{}",
                to_hex(from),
                cost,
                evmc::hex(output));
            return outcome::success();
        });
    }
    else {
        throw std::invalid_argument{"unknown action " + kind};
    }

    return ScenarioAction{
        .description = description,
        .call = std::move(call),
        .expect = std::move(expect)};
}

RESTAKE_ANONYMOUS_NAMESPACE_END

RESTAKE_NAMESPACE_BEGIN

Scenario load_scenario(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (RESTAKE_UNLIKELY(!in)) {
        throw std::invalid_argument{"cannot open " + path.string()};
    }
    auto const j = nlohmann::json::parse(in);

    Scenario scenario{.config = parse_vault_config(j.at("vault"))};

    for (auto const &op : j.value("operators", json::array())) {
        scenario.operators.push_back(OperatorGenesis{
            .id = parse_operator(op.at("id")),
            .active = op.value("active", true),
            .blueprints = op.at("blueprints").get<std::vector<uint64_t>>()});
    }

    for (auto const &item : j.value("balances", json::object()).items()) {
        Address const address = evmc::from_hex<Address>(item.key()).value();
        scenario.balances.emplace_back(address, parse_amount(item.value()));
        scenario.depositors.push_back(address);
    }

    uint64_t number = 0;
    for (auto const &batch : j.at("batches")) {
        ScenarioBatch parsed{
            .header =
                BlockHeader{
                    .number = ++number,
                    .timestamp = batch.value("timestamp", uint64_t{0})},
            .actions = {}};
        for (auto const &action : batch.at("actions")) {
            parsed.actions.push_back(parse_action(
                action, scenario.config, parsed.header, scenario.depositors));
        }
        scenario.batches.push_back(std::move(parsed));
    }

    return scenario;
}

Result<void> load_genesis(Scenario const &scenario, BlockState &block_state)
{
    for (auto const &[address, balance] : scenario.balances) {
        block_state.create_account(address, balance);
    }

    State state{block_state};
    delegation::MultiAssetDelegation gateway{state};
    for (auto const &op : scenario.operators) {
        BOOST_OUTCOME_TRY(gateway.register_operator(op.id));
        for (auto const blueprint : op.blueprints) {
            BOOST_OUTCOME_TRY(gateway.add_blueprint(op.id, blueprint));
        }
        if (!op.active) {
            BOOST_OUTCOME_TRY(gateway.set_operator_active(op.id, false));
        }
    }
    block_state.merge(state);

    LOG_INFO(
        "genesis: {} funded accounts, {} operators",
        scenario.balances.size(),
        scenario.operators.size());

    return outcome::success();
}

nlohmann::json dump_state(Scenario const &scenario, BlockState &block_state)
{
    State state{block_state};
    BlockHeader const header{};
    vault::VaultDeployment deployment{state, scenario.config, header};
    auto const &config = deployment.vault.config();

    json res = json::object();

    json vault = json::object();
    vault["balance"] = intx::to_string(state.get_balance(vault::VAULT_CA));
    vault["total_supply"] = intx::to_string(deployment.ledger.total_supply());
    res["vault"] = vault;

    auto const delegation = deployment.gateway.get_delegation(
        vault::VAULT_CA, config.op, config.asset);
    json gateway = json::object();
    gateway["balance"] =
        intx::to_string(state.get_balance(delegation::DELEGATION_CA));
    gateway["delegated"] = intx::to_string(delegation.amount.native());
    gateway["unstake_pending"] =
        intx::to_string(delegation.unstake_pending.native());
    gateway["idle"] = intx::to_string(
        deployment.gateway.get_idle(vault::VAULT_CA, config.asset));
    auto const pending =
        deployment.gateway.get_pending_withdraw(vault::VAULT_CA);
    gateway["pending_withdraw"] = intx::to_string(
        pending.has_value() ? pending->amount.native() : uint256_t{0});
    res["gateway"] = gateway;

    json depositors = json::object();
    for (auto const &depositor : scenario.depositors) {
        json entry = json::object();
        entry["balance"] = intx::to_string(state.get_balance(depositor));
        entry["shares"] = intx::to_string(deployment.ledger.shares_of(depositor));
        if (auto const r = deployment.vault.get_unstake_request(depositor)) {
            entry["unstake_request"] = request_to_json(
                r->amount.native(),
                r->timestamp.native(),
                static_cast<uint8_t>(r->state));
        }
        if (auto const r = deployment.vault.get_withdraw_request(depositor)) {
            entry["withdraw_request"] = request_to_json(
                r->amount.native(),
                r->timestamp.native(),
                static_cast<uint8_t>(r->state));
        }
        depositors[to_hex(depositor)] = entry;
    }
    res["depositors"] = depositors;

    return res;
}

RESTAKE_NAMESPACE_END
