// VOX C++ CLI
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Offline pricing against recorded pool observations: strike/expiry quote and
// implied volatility for the latest observation in a JSON history file.

#include <vox/vox.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Config {
    std::string config_path;
    bool verbose = false;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

vox::PoolKey pool_key_for(const vox::HookConfig& hook_config) {
    vox::PoolKey key{};
    key.fee = hook_config.metadata.base_fee;
    key.tick_spacing = hook_config.metadata.tick_spacing;
    key.hooks = hook_config.hook_address;
    return key;
}

void run_command(const Config& config, const vox::HookConfig& hook_config,
                 const std::vector<vox::Observation>& observations) {
    const auto& args = config.command_args;
    std::string cmd = args[0];
    // Convert to lowercase
    for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    vox::PoolKey key = pool_key_for(hook_config);
    vox::VXOracle oracle(std::max<size_t>(observations.size(), 1));
    for (const auto& obs : observations) {
        int32_t rc = oracle.record(key, obs);
        if (rc != vox::errors::OK) {
            std::cerr << "Rejected observation at " << obs.timestamp << ": "
                      << vox::errors::name(rc) << "\n";
            std::exit(1);
        }
    }
    if (config.verbose) {
        std::cerr << "Recorded " << oracle.observation_count(key) << " observations\n";
    }

    vox::VXTreasury treasury;
    vox::VXHook hook(key, oracle, treasury, hook_config);

    if (cmd == "quote") {
        vox::StrikeQuote quote = hook.current_quote();
        json out = {
            {"sqrt_price_x96", quote.spot_sqrt_price_x96.to_string()},
            {"liquidity", vox::U256(quote.liquidity).to_string()},
            {"strike_price", quote.strike_price.to_string()},
            {"expiry_price", quote.expiry_price.to_string()},
        };
        std::cout << out.dump(2) << "\n";
    } else if (cmd == "volatility") {
        uint64_t tte = hook_config.time_to_expiry;
        if (args.size() > 2) {
            try {
                tte = std::stoull(args[2]);
            } catch (const std::exception& e) {
                std::cerr << "Invalid time to expiry: " << e.what() << "\n";
                std::exit(1);
            }
        }
        json out = {
            {"time_to_expiry", tte},
            {"volatility", hook.implied_volatility(tte).to_string()},
        };
        std::cout << out.dump(2) << "\n";
    } else if (cmd == "volatility24h") {
        json out = {
            {"volatility_24h", hook.implied_volatility_24h().to_string()},
        };
        std::cout << out.dump(2) << "\n";
    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        std::exit(1);
    }
}

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "VOX C++ CLI\n\n"
              << "Usage: " << prog << " [options] <command> <observations.json> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Hook configuration (JSON)\n"
              << "  -v, --verbose        Verbose output\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  quote                Strike and expiry price at the latest observation\n"
              << "  volatility [tte]     Implied volatility, optional time to expiry (s)\n"
              << "  volatility24h        Daily-normalised implied volatility\n\n"
              << "Examples:\n"
              << "  " << prog << " quote history.json\n"
              << "  " << prog << " -c hook.json volatility history.json 43200\n";
}

Config parse_args(int argc, char* argv[]) {
    Config config;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            config.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg[0] != '-') {
            // Command and its arguments
            while (i < argc) {
                config.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (config.command_args.size() < 2) {
        std::cerr << "Missing command or observations file. Use -h for help.\n";
        std::exit(1);
    }

    return config;
}

int main(int argc, char* argv[]) {
    Config config = parse_args(argc, argv);

    try {
        vox::HookConfig hook_config;
        if (!config.config_path.empty()) {
            hook_config = vox::HookConfig::from_file(config.config_path);
            if (config.verbose) {
                std::cerr << "Loaded config from " << config.config_path << "\n";
            }
        }

        auto observations = vox::load_observations(config.command_args[1]);
        if (observations.empty()) {
            std::cerr << "No observations in " << config.command_args[1] << "\n";
            return 1;
        }

        run_command(config, hook_config, observations);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
