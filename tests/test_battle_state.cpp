#include <catch2/catch_test_macros.hpp>

#include "battle/battle_state.hpp"
#include "battle/phase.hpp"
#include "test_fixtures.hpp"

using namespace tac;
using namespace tac::battle;
using tac::testing::make_unit;

// ================================================================
// Units
// ================================================================

TEST_CASE("BattleState lookups", "[battle]") {
    BattleState state({
        make_unit("a", 1, {0, 0}),
        make_unit("b", 2, {3, 0}),
        make_unit("c", 2, {0, 4}),
    });

    CHECK(state.unit_count() == 3);
    CHECK(state.round() == 1);
    REQUIRE(state.find("b") != nullptr);
    CHECK(state.find("b")->team == 2);
    CHECK(state.find("nobody") == nullptr);
    CHECK(*state.find_index("c") == 2);
    CHECK_FALSE(state.find_index("nobody"));

    CHECK(state.unit_at({3, 0})->id == "b");
    CHECK(state.unit_at({1, 1}) == nullptr);

    auto near = state.units_within({0, 0}, 3);
    REQUIRE(near.size() == 2);
    CHECK(near[0]->id == "a");
    CHECK(near[1]->id == "b");
}

TEST_CASE("with_unit copies on write", "[battle]") {
    BattleState state({make_unit("a", 1, {0, 0}), make_unit("b", 2, {1, 0})});

    auto hurt = state.find("a")->damaged(5);
    auto next = state.with_unit(hurt);

    CHECK(state.find("a")->current_hp == 20);
    CHECK(next.find("a")->current_hp == 15);
    // Untouched records are shared
    CHECK(state.units()[1] == next.units()[1]);
    CHECK(state.units()[0] != next.units()[0]);
    CHECK(next != state);

    // Unknown ids are ignored
    auto ghost = make_unit("ghost", 1, {9, 9});
    CHECK(state.with_unit(ghost) == state);
}

TEST_CASE("Dead units vacate their cell", "[battle]") {
    BattleState state({make_unit("a", 1, {0, 0})});
    auto dead = state.with_unit(state.find("a")->damaged(25));

    const auto* a = dead.find("a");
    CHECK_FALSE(a->alive);
    CHECK(a->current_hp == 0);
    CHECK(dead.unit_at({0, 0}) == nullptr);
    CHECK(dead.units_within({0, 0}, 5).empty());
}

TEST_CASE("with_units replaces several records", "[battle]") {
    BattleState state({make_unit("a", 1, {0, 0}), make_unit("b", 2, {1, 0})});
    auto a = *state.find("a");
    auto b = *state.find("b");
    a.position = {5, 5};
    b.facing = Facing::South;

    auto next = state.with_units({a, b}).with_round(3);
    CHECK(next.find("a")->position == Position{5, 5});
    CHECK(next.find("b")->facing == Facing::South);
    CHECK(next.round() == 3);
    CHECK(state.round() == 1);
}

// ================================================================
// Components
// ================================================================

TEST_CASE("Component tables are per mechanic and immutable", "[battle]") {
    BattleState state({make_unit("a", 1, {0, 0}), make_unit("b", 2, {1, 0})});
    CHECK(state.component<ChargeComponent>("a") == nullptr);

    ChargeComponent charge;
    charge.momentum = 0.4;
    auto next = state.with_component("a", charge);

    REQUIRE(next.component<ChargeComponent>("a") != nullptr);
    CHECK(next.component<ChargeComponent>("a")->momentum == 0.4);
    CHECK(state.component<ChargeComponent>("a") == nullptr);
    CHECK(next.component<PhalanxComponent>("a") == nullptr);
    CHECK(next.components<ChargeComponent>().size() == 1);

    auto removed = next.without_component<ChargeComponent>("a");
    CHECK(removed.component<ChargeComponent>("a") == nullptr);
    CHECK(removed == state);
}

TEST_CASE("Structural equality compares values", "[battle]") {
    BattleState a({make_unit("x", 1, {0, 0})});
    BattleState b({make_unit("x", 1, {0, 0})});
    CHECK(a == b);

    AmmoComponent ammo;
    ammo.resource_type = ResourceType::Ammo;
    ammo.ammo = 3;
    CHECK(a.with_component("x", ammo) == b.with_component("x", ammo));

    ammo.ammo = 2;
    CHECK(a.with_component("x", ammo) != b.with_component("x", AmmoComponent{}));
}

// ================================================================
// Capabilities and names
// ================================================================

TEST_CASE("Capability sets", "[battle]") {
    CapabilitySet caps = Capability::Cavalry | Capability::Charge;
    CHECK(caps.has(Capability::Cavalry));
    CHECK_FALSE(caps.has(Capability::SpearWall));
    CHECK(caps.has_any(Capability::SpearWall | Capability::Charge));

    caps.add(Capability::Stealth);
    caps.remove(Capability::Cavalry);
    auto names = caps.names();
    REQUIRE(names.size() == 2);
    CHECK(names[0] == "charge");
    CHECK(names[1] == "stealth");

    CHECK(capability_from_name("spear_wall") == Capability::SpearWall);
    CHECK(std::string(capability_name(Capability::ZoneOfControl)) == "zone_of_control");
    CHECK_FALSE(capability_from_name("flying"));
}

TEST_CASE("Grid helpers", "[battle]") {
    CHECK(manhattan({0, 0}, {3, 4}) == 7);
    CHECK(chebyshev({0, 0}, {3, 4}) == 4);
    CHECK(orthogonally_adjacent({2, 2}, {2, 3}));
    CHECK_FALSE(orthogonally_adjacent({2, 2}, {3, 3}));

    CHECK(facing_vector(Facing::North) == Position{0, -1});
    CHECK(facing_from_name("west") == Facing::West);
    CHECK(std::string(facing_name(Facing::East)) == "east");
    CHECK(std::string(phase_name(BattlePhase::PreAttack)) == "pre_attack");
}

TEST_CASE("PhaseContext exposes the action payload", "[battle]") {
    auto move = tac::testing::move_ctx("a", {{0, 0}, {0, 1}});
    REQUIRE(move.move_path());
    CHECK(move.move_path()->size() == 2);
    CHECK(move.ability_id() == nullptr);

    auto ability = tac::testing::ability_ctx("a", "overwatch");
    REQUIRE(ability.ability_id());
    CHECK(*ability.ability_id() == "overwatch");
    CHECK(ability.move_path() == nullptr);

    CHECK(tac::testing::turn_ctx("a").move_path() == nullptr);
}
