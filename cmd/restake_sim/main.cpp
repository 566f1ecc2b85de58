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

#include "log_levels.hpp"
#include "scenario.hpp"

#include <restake/core/restake_exception.hpp>
#include <restake/execution/execute_batch.hpp>
#include <restake/execution/state/block_state.hpp>

#include <CLI/CLI.hpp>

#include <oneapi/tbb/task_arena.h>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace restake;

namespace fs = std::filesystem;

namespace
{
    bool run_scenario(Scenario const &scenario, BlockState &block_state)
    {
        bool ok = true;
        for (auto const &batch : scenario.batches) {
            std::vector<BatchCall> calls;
            calls.reserve(batch.actions.size());
            for (auto const &action : batch.actions) {
                calls.push_back(action.call);
            }

            auto const receipts = execute_batch(block_state, calls);

            for (size_t i = 0; i < receipts.size(); ++i) {
                auto const &action = batch.actions[i];
                auto const &receipt = receipts[i];
                std::string const outcome =
                    receipt.has_error()
                        ? std::string{receipt.assume_error().message().c_str()}
                        : std::string{"success"};
                if (receipt.has_value()) {
                    LOG_INFO(
                        "batch {} action {}: {} -> success, {} logs",
                        batch.header.number,
                        i,
                        action.description,
                        receipt.assume_value().logs.size());
                }
                else {
                    LOG_INFO(
                        "batch {} action {}: {} -> {}",
                        batch.header.number,
                        i,
                        action.description,
                        outcome);
                }
                if (action.expect.has_value() && *action.expect != outcome) {
                    LOG_ERROR(
                        "batch {} action {}: expected '{}', got '{}'",
                        batch.header.number,
                        i,
                        *action.expect,
                        outcome);
                    ok = false;
                }
            }
        }
        return ok;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"restake_sim"};
    cli.option_defaults()->always_capture_default();

    fs::path scenario_path;
    unsigned nthreads = 4;
    bool dump = false;
    auto log_level = quill::LogLevel::Info;

    cli.add_option("--scenario", scenario_path, "scenario file to replay")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(sim_log_levels, CLI::ignore_case));
    cli.add_option("--nthreads", nthreads, "number of threads")
        ->check(CLI::PositiveNumber);
    cli.add_flag("--dump", dump, "print the final vault state as json");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::RequiredError const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    Scenario scenario;
    try {
        scenario = load_scenario(scenario_path);
    }
    catch (std::exception const &e) {
        LOG_ERROR("failed to load {}: {}", scenario_path.string(), e.what());
        return EXIT_FAILURE;
    }

    BlockState block_state;
    if (auto const res = load_genesis(scenario, block_state);
        res.has_error()) {
        LOG_ERROR(
            "genesis failed with: {}", res.assume_error().message().c_str());
        return EXIT_FAILURE;
    }

    bool ok = false;
    try {
        oneapi::tbb::task_arena arena{static_cast<int>(nthreads)};
        arena.execute([&] { ok = run_scenario(scenario, block_state); });
    }
    catch (RestakeException const &e) {
        e.print();
        return EXIT_FAILURE;
    }

    LOG_INFO(
        "replayed {} batches, expectations {}",
        scenario.batches.size(),
        ok ? "met" : "NOT met");

    if (dump) {
        quill::flush();
        std::cout << dump_state(scenario, block_state).dump(2) << std::endl;
    }

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
