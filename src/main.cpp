#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "lua/scenario_loader.hpp"
#include "mechanics/config.hpp"
#include "mechanics/mechanics_engine.hpp"
#include "sim/scripted_battle.hpp"

#include <cstring>
#include <iostream>
#include <spdlog/spdlog.h>

static void print_usage() {
    std::cout << "Tactica v0.1.0\n"
              << "Tier-based battle mechanics for grid tactics\n\n"
              << "Usage:\n"
              << "  tactica --scenario <file> [options]\n\n"
              << "Options:\n"
              << "  --scenario <path>   Lua scenario to replay (required)\n"
              << "  --preset <name>     mvp, tactical or roguelike (default: mvp)\n"
              << "  --config <path>     Lua mechanics config, overrides --preset\n"
              << "  --log <path>        Log file (default: tactica.log, \"\" disables)\n"
              << "  --log-level <lvl>   trace, debug, info, warn, error (default: info)\n"
              << "  --compare-mvp       Run with the mvp preset and with no engine,\n"
              << "                      and report whether the battles match\n"
              << "  --help              Show this help message\n";
}

struct Options {
    tac::fs::path scenario;
    std::string preset;
    tac::fs::path config;
    tac::fs::path log_file = "tactica.log";
    std::string log_level = "info";
    bool compare_mvp = false;
};

static Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--scenario") == 0 && i + 1 < argc) {
            opts.scenario = argv[++i];
        } else if (std::strcmp(argv[i], "--preset") == 0 && i + 1 < argc) {
            opts.preset = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--compare-mvp") == 0) {
            opts.compare_mvp = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n\n";
            print_usage();
            std::exit(1);
        }
    }

    return opts;
}

static void print_outcome(const tac::sim::BattleOutcome& outcome) {
    for (const auto& event : outcome.events) {
        std::cout << event.describe() << "\n";
    }
    if (outcome.winner) {
        std::cout << "Winner: team " << *outcome.winner << " after "
                  << outcome.rounds_played << " rounds\n";
    } else {
        std::cout << "No winner after " << outcome.rounds_played << " rounds\n";
    }
}

static tac::Result<tac::mechanics::MechanicsConfig> load_config(const Options& opts) {
    if (!opts.config.empty()) {
        if (!opts.preset.empty()) {
            spdlog::warn("--preset {} ignored, using {}", opts.preset,
                         opts.config.string());
        }
        tac::lua::LuaState state;
        tac::lua::ConfigLoader loader;
        return loader.load_file(state, opts.config);
    }
    return tac::mechanics::preset_by_name(opts.preset.empty() ? "mvp" : opts.preset);
}

static int run_compare(const tac::sim::Scenario& scenario) {
    auto engine = tac::mechanics::MechanicsEngine::create(
        tac::mechanics::mvp_preset());
    if (!engine) {
        spdlog::error("{}", engine.error().message);
        return 1;
    }

    auto with_mvp = tac::sim::ScriptedBattle(&engine.value()).run(scenario);
    auto without = tac::sim::ScriptedBattle().run(scenario);

    print_outcome(with_mvp);
    if (tac::sim::same_outcome(with_mvp, without)) {
        std::cout << "MVP preset matches the engine-less battle ("
                  << with_mvp.events.size() << " events)\n";
        return 0;
    }
    std::cout << "MVP preset DIFFERS from the engine-less battle\n";
    return 2;
}

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    tac::log::init(opts.log_file, tac::log::level_from_name(opts.log_level));

    if (opts.scenario.empty()) {
        spdlog::error("No scenario given. Use --scenario <path>.");
        print_usage();
        tac::log::shutdown();
        return 1;
    }

    tac::lua::LuaState scenario_state;
    tac::lua::ScenarioLoader scenario_loader;
    auto scenario = scenario_loader.load_file(scenario_state, opts.scenario);
    if (!scenario) {
        spdlog::error("Scenario load failed: {}", scenario.error().message);
        tac::log::shutdown();
        return 1;
    }

    int status = 0;
    if (opts.compare_mvp) {
        status = run_compare(scenario.value());
    } else {
        auto config = load_config(opts);
        if (!config) {
            spdlog::error("Config load failed: {}", config.error().message);
            tac::log::shutdown();
            return 1;
        }

        auto engine = tac::mechanics::MechanicsEngine::create(config.value());
        if (!engine) {
            spdlog::error("{}", engine.error().message);
            tac::log::shutdown();
            return 1;
        }

        auto outcome = tac::sim::ScriptedBattle(&engine.value()).run(scenario.value());
        print_outcome(outcome);
    }

    tac::log::shutdown();
    return status;
}
