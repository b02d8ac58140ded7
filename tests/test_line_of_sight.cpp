#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "mechanics/ammunition.hpp"
#include "mechanics/line_of_sight.hpp"
#include "test_fixtures.hpp"

using namespace tac;
using namespace tac::battle;
using namespace tac::mechanics;
using Catch::Matchers::WithinAbs;
using tac::testing::attack_ctx;
using tac::testing::make_unit;
using tac::testing::turn_ctx;

namespace {

LineOfSightConfig enabled_config() {
    LineOfSightConfig c;
    c.enabled = true;
    return c;
}

BattleUnit facing(BattleUnit u, Facing f) {
    u.facing = f;
    return u;
}

} // namespace

// ================================================================
// Line tracing
// ================================================================

TEST_CASE("trace_line includes both endpoints", "[los]") {
    auto straight = LineOfSightProcessor::trace_line({0, 0}, {4, 0});
    REQUIRE(straight.size() == 5);
    CHECK(straight.front() == Position{0, 0});
    CHECK(straight.back() == Position{4, 0});

    auto steep = LineOfSightProcessor::trace_line({0, 0}, {1, 3});
    REQUIRE(steep.size() == 4);
    CHECK(steep.back() == Position{1, 3});

    auto diagonal = LineOfSightProcessor::trace_line({3, 3}, {0, 0});
    REQUIRE(diagonal.size() == 4);
    CHECK(diagonal[1] == Position{2, 2});

    auto single = LineOfSightProcessor::trace_line({2, 2}, {2, 2});
    CHECK(single.size() == 1);
}

// ================================================================
// Blocking and arc fire
// ================================================================

TEST_CASE("Units between attacker and target block direct fire", "[los]") {
    LineOfSightProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("archer", 1, {0, 0}, Capability::Ranged),
        make_unit("shield", 1, {2, 0}),
        make_unit("target", 2, {4, 0}),
    }));

    auto blockers = proc.get_blocking_units(*state.find("archer"), *state.find("target"), state);
    REQUIRE(blockers.size() == 1);
    CHECK(blockers[0]->id == "shield");

    auto los = proc.check_los(*state.find("archer"), *state.find("target"), state);
    CHECK_FALSE(los.has_los);
    CHECK(los.recommended_mode == FireMode::Blocked);
    CHECK(*los.block_reason == Reason::BlockedByUnit);
    CHECK_THAT(proc.accuracy_modifier(los), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Arc fire shoots over blockers with a penalty", "[los]") {
    LineOfSightProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("mortar", 1, {0, 0}, Capability::Ranged | Capability::ArcFire),
        make_unit("wall", 2, {2, 0}),
        make_unit("target", 2, {4, 0}),
    }));

    auto los = proc.check_los(*state.find("mortar"), *state.find("target"), state);
    CHECK(los.has_los);
    CHECK_FALSE(los.direct_los);
    CHECK(los.arc_los);
    CHECK(los.recommended_mode == FireMode::Arc);
    REQUIRE(los.obstacles.size() == 1);
    CHECK(los.obstacles[0] == "wall");
    CHECK_THAT(proc.accuracy_modifier(los), WithinAbs(0.8, 1e-9));

    // Clear line prefers direct fire
    auto clear = proc.check_los(*state.find("mortar"), *state.find("wall"), state);
    CHECK(clear.recommended_mode == FireMode::Direct);
    CHECK_THAT(proc.accuracy_modifier(clear), WithinAbs(1.0, 1e-9));
}

TEST_CASE("Transparent and dead units do not block", "[los]") {
    LineOfSightProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("archer", 1, {0, 0}, Capability::Ranged),
        make_unit("wisp", 1, {1, 0}, Capability::LosTransparent),
        make_unit("corpse", 2, {2, 0}),
        make_unit("target", 2, {4, 0}),
    }));
    state = state.with_unit(state.find("corpse")->damaged(100));

    CHECK_FALSE(proc.blocks_los(*state.find("wisp"), state));
    CHECK_FALSE(proc.blocks_los(*state.find("corpse"), state));
    CHECK(proc.check_los(*state.find("archer"), *state.find("target"), state).direct_los);
}

TEST_CASE("Adjacent targets are never blocked", "[los]") {
    LineOfSightProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("archer", 1, {0, 0}, Capability::Ranged),
        make_unit("target", 2, {1, 0}),
    }));
    auto blockers = proc.get_blocking_units(*state.find("archer"), *state.find("target"), state);
    CHECK(blockers.empty());
}

// ================================================================
// Firing arc and targeting
// ================================================================

TEST_CASE("Firing arc is centred on facing", "[los]") {
    LineOfSightProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        facing(make_unit("archer", 1, {5, 5}, Capability::Ranged), Facing::East),
        make_unit("ahead", 2, {8, 5}),
        make_unit("edge", 2, {8, 8}),
        make_unit("beside", 2, {5, 8}),
        make_unit("behind", 2, {2, 5}),
    }));
    const auto& archer = *state.find("archer");

    CHECK(proc.is_in_firing_arc(archer, *state.find("ahead"), state));
    CHECK(proc.is_in_firing_arc(archer, *state.find("edge"), state));   // 45 degrees
    CHECK_FALSE(proc.is_in_firing_arc(archer, *state.find("beside"), state));
    CHECK_FALSE(proc.is_in_firing_arc(archer, *state.find("behind"), state));
}

TEST_CASE("Valid targets respect range, LoS and the enforced arc", "[los]") {
    auto cfg = enabled_config();
    cfg.enforce_firing_arc = true;
    LineOfSightProcessor proc(cfg);

    auto state = proc.initialize(BattleState({
        facing(make_unit("archer", 1, {0, 0}, Capability::Ranged), Facing::East),
        make_unit("near", 2, {3, 0}),
        make_unit("hidden", 2, {5, 0}),     // behind "near"
        make_unit("far", 2, {0, 9}),
        make_unit("south", 2, {0, 2}),      // out of arc
        make_unit("friend", 1, {1, 1}),
    }));

    auto targets = proc.find_valid_targets(*state.find("archer"), state);
    REQUIRE(targets.size() == 1);
    CHECK(targets[0] == "near");

    auto arc = proc.validate_ranged_attack("archer", "south", state);
    CHECK_FALSE(arc.valid);
    CHECK(*arc.reason == Reason::OutOfArc);

    auto range = proc.validate_ranged_attack("archer", "far", state);
    CHECK(*range.reason == Reason::OutOfRange);

    auto blocked = proc.validate_ranged_attack("archer", "hidden", state);
    CHECK(*blocked.reason == Reason::BlockedByUnit);

    auto melee = proc.validate_ranged_attack("friend", "near", state);
    CHECK(*melee.reason == Reason::NotRanged);

    auto ok = proc.validate_ranged_attack("archer", "near", state);
    CHECK(ok.valid);
    CHECK_THAT(ok.accuracy_modifier, WithinAbs(1.0, 1e-9));
}

TEST_CASE("Validation consults the ammunition ledger", "[los][ammunition]") {
    AmmunitionConfig acfg;
    acfg.enabled = true;
    acfg.default_ammo = 1;
    AmmunitionProcessor ammo(acfg);
    LineOfSightProcessor proc(enabled_config(), &ammo);

    auto state = BattleState({
        make_unit("archer", 1, {0, 0}, Capability::Ranged),
        make_unit("target", 2, {3, 0}),
    });
    state = ammo.initialize(state);
    state = proc.initialize(state);

    CHECK(proc.validate_ranged_attack("archer", "target", state).valid);
    state = ammo.consume_ammo("archer", state).state;
    auto empty = proc.validate_ranged_attack("archer", "target", state);
    CHECK_FALSE(empty.valid);
    CHECK(*empty.reason == Reason::NoAmmo);
}

// ================================================================
// Phases
// ================================================================

TEST_CASE("Pre-attack records the fire mode until turn end", "[los]") {
    LineOfSightProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("archer", 1, {0, 0}, Capability::Ranged),
        make_unit("shield", 1, {2, 0}),
        make_unit("target", 2, {4, 0}),
        make_unit("footman", 2, {0, 1}),
    }));

    state = proc.apply(BattlePhase::PreAttack, state, attack_ctx("archer", "target"));
    REQUIRE(state.component<LosComponent>("archer")->fire_mode);
    CHECK(*state.component<LosComponent>("archer")->fire_mode == FireMode::Blocked);

    state = proc.apply(BattlePhase::TurnEnd, state, turn_ctx("archer"));
    CHECK_FALSE(state.component<LosComponent>("archer")->fire_mode);

    // Melee attackers are not checked
    auto melee = proc.apply(BattlePhase::PreAttack, state, attack_ctx("footman", "archer"));
    CHECK(melee == state);
}
