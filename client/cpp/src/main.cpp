// LPM Position Keeper CLI
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Checks, rebalances, compounds and closes one concentrated-liquidity position.
// Prints a JSON run report on stdout; logs go to stderr.

#include "lpm/config.hpp"
#include "lpm/errors.hpp"
#include "lpm/keeper.hpp"
#include "lpm/log.hpp"
#include "lpm/price_source.hpp"
#include "lpm/rpc_client.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

struct Options {
    std::string config_path = "lpm.toml";
    std::optional<std::string> rpc_url;
    std::optional<std::string> position;
    std::optional<double> range_pct;
    std::optional<double> threshold;
    std::optional<double> slippage;
    std::optional<std::string> harvest_address;
    double close_pct = 100.0;
    bool dry_run = false;
    bool no_atomic = false;
    bool disable = false;
    bool verbose = false;
    std::string command = "check";
};

void print_usage(const char* prog) {
    std::cout << "LPM Position Keeper\n\n"
              << "Usage: " << prog << " [options] [command]\n\n"
              << "Options:\n"
              << "  -c, --config <path>       TOML configuration (default: lpm.toml)\n"
              << "      --rpc <url>           JSON-RPC endpoint, overrides chain.rpc_url\n"
              << "      --position <id>       Position token id, overrides position.id\n"
              << "      --range-pct <pct>     New range half-width in percent\n"
              << "      --threshold <pct>     Drift threshold in percent\n"
              << "      --slippage <pct>      Slippage tolerance in percent\n"
              << "      --harvest-address <a> Sweep remainders to this address\n"
              << "      --percent <pct>       Share of liquidity to close (default: 100)\n"
              << "      --dry-run             Plan only, submit nothing\n"
              << "      --no-atomic           Always use the sequential path\n"
              << "      --disable             Turn drift monitoring off\n"
              << "  -v, --verbose             Debug logging\n"
              << "  -h, --help                Show this help message\n\n"
              << "Commands:\n"
              << "  check                     Snapshot and drift classification (default)\n"
              << "  run | rebalance           Rebalance when drifting or out of range\n"
              << "  compound                  Collect fees into the same range\n"
              << "  recover                   Mint a new position from wallet balances\n"
              << "  close                     Withdraw liquidity, burning the position at 100%\n\n"
              << "Examples:\n"
              << "  " << prog << " -c base.toml check\n"
              << "  " << prog << " --dry-run --range-pct 15 run\n"
              << "  " << prog << " --percent 50 close\n";
}

namespace {

const char* need_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        std::exit(1);
    }
    return argv[++i];
}

double need_number(int argc, char* argv[], int& i, const std::string& flag) {
    const char* raw = need_value(argc, argv, i, flag);
    try {
        return std::stod(raw);
    } catch (const std::exception&) {
        std::cerr << "Invalid number for " << flag << ": " << raw << "\n";
        std::exit(1);
    }
}

} // namespace

Options parse_args(int argc, char* argv[]) {
    Options opts;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            opts.config_path = need_value(argc, argv, i, arg);
        } else if (arg == "--rpc") {
            opts.rpc_url = need_value(argc, argv, i, arg);
        } else if (arg == "--position") {
            opts.position = need_value(argc, argv, i, arg);
        } else if (arg == "--range-pct") {
            opts.range_pct = need_number(argc, argv, i, arg);
        } else if (arg == "--threshold") {
            opts.threshold = need_number(argc, argv, i, arg);
        } else if (arg == "--slippage") {
            opts.slippage = need_number(argc, argv, i, arg);
        } else if (arg == "--harvest-address") {
            opts.harvest_address = need_value(argc, argv, i, arg);
        } else if (arg == "--percent") {
            opts.close_pct = need_number(argc, argv, i, arg);
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--no-atomic") {
            opts.no_atomic = true;
        } else if (arg == "--disable") {
            opts.disable = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg[0] != '-' && !have_command) {
            opts.command = arg;
            have_command = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }
    return opts;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

lpm::Config load_config(const Options& opts) {
    lpm::Config config = lpm::Config::from_file(opts.config_path);

    if (opts.rpc_url) config.chain.rpc_url = *opts.rpc_url;
    if (opts.position) config.with_position(lpm::parse_u256(*opts.position));
    if (opts.range_pct) config.set_range_pct(*opts.range_pct);
    if (opts.threshold) config.set_drift_threshold(*opts.threshold);
    if (opts.slippage) config.set_slippage(*opts.slippage);
    if (opts.harvest_address) config.set_harvest_address(*opts.harvest_address);
    if (opts.dry_run) config.enable_dry_run();
    if (opts.no_atomic) config.enable_atomic(false);
    if (opts.disable) config.strategy.monitoring_enabled = false;
    if (opts.verbose) config.general.log_level = "debug";

    config.validate();
    if (config.chain.rpc_url.empty()) {
        throw lpm::ConfigError("chain.rpc_url is required");
    }
    return config;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    const std::vector<std::string> commands = {"check", "run", "rebalance", "compound", "recover", "close"};
    bool known = false;
    for (const auto& c : commands) known = known || c == opts.command;
    if (!known) {
        std::cerr << "Unknown command: " << opts.command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        lpm::Config config = load_config(opts);
        lpm::setup_logging(config.general.log_level);

        lpm::JsonRpcChainClient chain(config);
        auto prices = lpm::make_price_source(config);
        lpm::PositionKeeper keeper(config, chain, *prices,
                                   lpm::RetryPolicy(lpm::BackoffPolicy::from_config(config.retry)));

        lpm::RunReport report;
        if (opts.command == "recover") {
            report = keeper.recover();
        } else {
            if (!config.position_id) {
                throw lpm::ConfigError("a position id is required (position.id or --position)");
            }
            const lpm::U256& id = *config.position_id;
            if (opts.command == "check") {
                report = keeper.check(id);
            } else if (opts.command == "compound") {
                report = keeper.compound(id);
            } else if (opts.command == "close") {
                report = keeper.close(id, opts.close_pct);
            } else {
                report = keeper.run(id);
            }
        }

        std::cout << lpm::to_json(report).dump(2) << "\n";
        return report.outcome == lpm::Outcome::Failed ? 1 : 0;
    } catch (const lpm::LpmError& e) {
        std::cerr << "Error [" << lpm::error_code_name(e.code()) << "]: " << e.what() << "\n";
        return 1;
    }
}
