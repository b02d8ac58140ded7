#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"

#include <string>

using namespace tac;
using namespace tac::lua;
using namespace tac::mechanics;
using Catch::Matchers::WithinAbs;

namespace {

Result<MechanicsConfig> load(const char* code) {
    LuaState state;
    ConfigLoader loader;
    return loader.load_string(state, code);
}

bool mentions(const Error& e, const std::string& text) {
    return e.message.find(text) != std::string::npos;
}

} // namespace

// ================================================================
// Presets and overrides
// ================================================================

TEST_CASE("Config defaults to the MVP preset", "[config_loader]") {
    auto config = load("Mechanics = {}");
    REQUIRE(config.ok());
    CHECK(config.value().enabled_mechanics().empty());
}

TEST_CASE("Config starts from a named preset", "[config_loader]") {
    auto config = load(R"(Mechanics = { preset = "roguelike" })");
    REQUIRE(config.ok());
    CHECK(config.value().enabled_mechanics().size() == ALL_MECHANICS.size());
}

TEST_CASE("Config tables override tunables and imply enabled", "[config_loader]") {
    auto config = load(R"(
        Mechanics = {
            preset = "tactical",
            charge = { min_charge_distance = 2, momentum_per_cell = 0.25 },
            line_of_sight = { enabled = false, arc_fire_penalty = 0.5 },
        }
    )");
    REQUIRE(config.ok());
    const auto& c = config.value();
    CHECK(c.intercept.enabled);
    CHECK(c.charge.enabled);
    CHECK(c.charge.min_charge_distance == 2);
    CHECK_THAT(c.charge.momentum_per_cell, WithinAbs(0.25, 1e-9));
    CHECK(c.charge.max_momentum == ChargeConfig{}.max_momentum);

    CHECK_FALSE(c.line_of_sight.enabled);
    CHECK_THAT(c.line_of_sight.arc_fire_penalty, WithinAbs(0.5, 1e-9));
}

TEST_CASE("Config booleans toggle mechanics", "[config_loader]") {
    auto config = load(R"(
        Mechanics = { preset = "tactical", phalanx = true, intercept = false }
    )");
    REQUIRE(config.ok());
    CHECK(config.value().phalanx.enabled);
    CHECK_FALSE(config.value().intercept.enabled);
}

TEST_CASE("Config enables missing dependencies", "[config_loader]") {
    auto config = load("Mechanics = { overwatch = { max_shots = 1 } }");
    REQUIRE(config.ok());
    const auto& c = config.value();
    CHECK(c.overwatch.enabled);
    CHECK(c.overwatch.max_shots == 1);
    CHECK(c.intercept.enabled);
    CHECK(c.ammunition.enabled);
    CHECK_FALSE(c.charge.enabled);
}

TEST_CASE("Config ignores unknown keys", "[config_loader]") {
    auto config = load(R"(
        Mechanics = {
            morale = true,
            phalanx = { armor_per_ally = 2, wedge = true },
        }
    )");
    REQUIRE(config.ok());
    CHECK(config.value().phalanx.armor_per_ally == 2);
}

// ================================================================
// Errors
// ================================================================

TEST_CASE("Config reports a missing Mechanics table", "[config_loader]") {
    auto config = load("Settings = {}");
    REQUIRE_FALSE(config.ok());
    CHECK(mentions(config.error(), "Mechanics table not found"));
}

TEST_CASE("Config reports an unknown preset", "[config_loader]") {
    auto config = load(R"(Mechanics = { preset = "heroic" })");
    REQUIRE_FALSE(config.ok());
    CHECK(mentions(config.error(), "Unknown preset: heroic"));
}

TEST_CASE("Config reports every field type error", "[config_loader]") {
    auto config = load(R"(
        Mechanics = {
            charge = { max_momentum = "high", min_charge_distance = 2.5 },
            phalanx = { require_same_facing = 1 },
            overwatch = 3,
        }
    )");
    REQUIRE_FALSE(config.ok());
    const auto& e = config.error();
    CHECK(mentions(e, "charge.max_momentum must be a number"));
    CHECK(mentions(e, "charge.min_charge_distance must be an integer"));
    CHECK(mentions(e, "phalanx.require_same_facing must be a boolean"));
    CHECK(mentions(e, "Mechanics.overwatch must be a table or a boolean"));
}

TEST_CASE("Config rejects out-of-range tunables", "[config_loader]") {
    auto config = load(R"(
        Mechanics = {
            line_of_sight = { arc_fire_penalty = 1.5 },
            ammunition = { quick_cooldown_tick = 0 },
        }
    )");
    REQUIRE_FALSE(config.ok());
    CHECK(mentions(config.error(), "line_of_sight.arc_fire_penalty"));
    CHECK(mentions(config.error(), "ammunition.quick_cooldown_tick"));
}

TEST_CASE("Config reports Lua errors", "[config_loader]") {
    auto config = load("Mechanics = { preset = ");
    REQUIRE_FALSE(config.ok());
}

// ================================================================
// Bundled presets
// ================================================================

TEST_CASE("Bundled presets load", "[config_loader]") {
    const fs::path dir = fs::path(TACTICA_DATA_DIR) / "presets";
    ConfigLoader loader;

    SECTION("mvp") {
        LuaState state;
        auto config = loader.load_file(state, dir / "mvp.lua");
        REQUIRE(config.ok());
        CHECK(config.value().enabled_mechanics().empty());
    }

    SECTION("roguelike") {
        LuaState state;
        auto config = loader.load_file(state, dir / "roguelike.lua");
        REQUIRE(config.ok());
        CHECK(config.value().enabled_mechanics().size() == ALL_MECHANICS.size());
    }

    SECTION("shieldwall") {
        LuaState state;
        auto config = loader.load_file(state, dir / "shieldwall.lua");
        REQUIRE(config.ok());
        const auto& c = config.value();
        CHECK(c.charge.enabled);
        CHECK(c.charge.min_charge_distance == 2);
        CHECK(c.intercept.max_intercepts == 2);
        CHECK(c.phalanx.armor_per_ally == 2);
        CHECK_FALSE(c.phalanx.require_same_facing);
        CHECK_FALSE(c.overwatch.enabled);
    }

    SECTION("missing file") {
        LuaState state;
        auto config = loader.load_file(state, dir / "missing.lua");
        REQUIRE_FALSE(config.ok());
        CHECK(mentions(config.error(), "loading"));
    }
}
