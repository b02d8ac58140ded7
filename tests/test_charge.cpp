#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "mechanics/charge.hpp"
#include "mechanics/intercept.hpp"
#include "test_fixtures.hpp"

using namespace tac;
using namespace tac::battle;
using namespace tac::mechanics;
using Catch::Matchers::WithinAbs;
using tac::testing::attack_ctx;
using tac::testing::make_unit;
using tac::testing::move_ctx;
using tac::testing::row_path;
using tac::testing::turn_ctx;

namespace {

ChargeConfig enabled_config() {
    ChargeConfig c;
    c.enabled = true;
    return c;
}

BattleState open_field() {
    return BattleState({
        make_unit("knight", 1, {0, 0}, Capability::Cavalry | Capability::Charge),
        make_unit("footman", 2, {5, 0}),
        make_unit("pike", 2, {5, 2}, Capability::SpearWall),
    });
}

} // namespace

// ================================================================
// Momentum
// ================================================================

TEST_CASE("Momentum scales with distance and caps", "[charge]") {
    ChargeProcessor proc(enabled_config());

    CHECK_THAT(proc.calculate_momentum(0), WithinAbs(0.0, 1e-9));
    CHECK_THAT(proc.calculate_momentum(2), WithinAbs(0.0, 1e-9));
    CHECK_THAT(proc.calculate_momentum(3), WithinAbs(0.6, 1e-9));
    CHECK_THAT(proc.calculate_momentum(4), WithinAbs(0.8, 1e-9));
    CHECK_THAT(proc.calculate_momentum(5), WithinAbs(1.0, 1e-9));
    CHECK_THAT(proc.calculate_momentum(9), WithinAbs(1.0, 1e-9));
}

TEST_CASE("Charge bonus floors the scaled damage", "[charge]") {
    CHECK(ChargeProcessor::apply_charge_bonus(10, 0.0) == 10);
    CHECK(ChargeProcessor::apply_charge_bonus(10, 0.5) == 15);
    CHECK(ChargeProcessor::apply_charge_bonus(7, 0.6) == 11);
    CHECK(ChargeProcessor::apply_charge_bonus(20, 0.6) == 32);
    CHECK(ChargeProcessor::apply_charge_bonus(15, 0.8) == 27);
    CHECK(ChargeProcessor::apply_charge_bonus(6, 0.8) == 10);
}

TEST_CASE("Spear wall counter damage is one and a half times attack", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto pike = make_unit("pike", 2, {0, 0}, Capability::SpearWall);

    pike.stats.atk = 10;
    CHECK(proc.calculate_counter_damage(pike) == 15);
    pike.stats.atk = 20;
    CHECK(proc.calculate_counter_damage(pike) == 30);
    pike.stats.atk = 15;
    CHECK(proc.calculate_counter_damage(pike) == 22);
    pike.stats.atk = 25;
    CHECK(proc.calculate_counter_damage(pike) == 37);
}

TEST_CASE("Movement builds momentum for charge-capable units", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());

    state = proc.apply(BattlePhase::Movement, state, move_ctx("knight", row_path(0, 4, 0)));
    CHECK_THAT(proc.get_momentum("knight", state), WithinAbs(0.8, 1e-9));
    CHECK(proc.is_charging("knight", state));
    CHECK(state.component<ChargeComponent>("knight")->charge_distance == 4);
    CHECK(proc.can_charge(*state.find("knight"), state).can_charge);

    // Footmen have no charge record and gain nothing
    auto moved = proc.apply(BattlePhase::Movement, state,
                            move_ctx("footman", {{5, 0}, {5, 1}, {6, 1}, {7, 1}}));
    CHECK(moved == state);
    CHECK_THAT(proc.get_momentum("footman", moved), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Short moves do not charge", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());

    state = proc.apply(BattlePhase::Movement, state, move_ctx("knight", row_path(0, 2, 0)));
    CHECK_FALSE(proc.is_charging("knight", state));
    auto eligibility = proc.can_charge(*state.find("knight"), state);
    CHECK_FALSE(eligibility.can_charge);
    CHECK(*eligibility.reason == Reason::InsufficientDistance);

    auto footman = proc.can_charge(*state.find("footman"), state);
    CHECK(*footman.reason == Reason::NoChargeAbility);
}

// ================================================================
// Attacks
// ================================================================

TEST_CASE("Charging attack scales the resolved base damage and adds shock", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());
    state = proc.apply(BattlePhase::Movement, state, move_ctx("knight", row_path(0, 4, 0)));

    auto ctx = attack_ctx("knight", "footman");
    state = proc.apply(BattlePhase::PreAttack, state, ctx);

    // The simulator resolves damage with the charge bonus, then runs attack
    i32 damage = proc.charge_damage("knight", *state.find("footman"), 10, state);
    CHECK(damage == 18);
    state = state.with_unit(state.find("footman")->damaged(damage));
    state = proc.apply(BattlePhase::Attack, state, ctx);

    const auto* footman = state.find("footman");
    CHECK(footman->current_hp == 2);
    CHECK(footman->resolve == 90);
    CHECK_FALSE(proc.is_charging("knight", state));
    CHECK_THAT(proc.get_momentum("knight", state), WithinAbs(0.0, 1e-9));

    // Momentum is spent; a second hit is plain
    CHECK(proc.charge_damage("knight", *footman, 10, state) == 10);
}

TEST_CASE("Charge bonus applies after armor", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto field = open_field();
    auto armored = *field.find("footman");
    armored.stats.armor = 4;
    auto state = proc.initialize(field.with_unit(armored));
    state = proc.track_movement("knight", row_path(0, 4, 0), state);

    // atk 10 against armor 4 leaves a base of 6; floor(6 * 1.8) = 10
    const auto* footman = state.find("footman");
    CHECK(proc.charge_damage("knight", *footman, 6, state) == 10);

    auto hit = proc.execute_charge("knight", "footman", 6, state);
    REQUIRE(hit.success);
    CHECK(hit.damage == 10);
    CHECK(hit.state.find("footman")->current_hp == 10);
    CHECK(hit.state.find("footman")->resolve == 90);
}

TEST_CASE("Units without momentum deal their base damage", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());

    CHECK(proc.charge_damage("knight", *state.find("footman"), 7, state) == 7);
    CHECK(proc.charge_damage("footman", *state.find("knight"), 7, state) == 7);
}

TEST_CASE("Spear wall counters a charge in pre-attack", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());
    state = proc.apply(BattlePhase::Movement, state,
                       move_ctx("knight", {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}, {4, 1}, {4, 2}}));
    REQUIRE(proc.is_charging("knight", state));

    auto ctx = attack_ctx("knight", "pike");
    state = proc.apply(BattlePhase::PreAttack, state, ctx);

    CHECK(state.find("knight")->current_hp == 5); // 20 - floor(10 * 1.5)
    const auto* c = state.component<ChargeComponent>("knight");
    CHECK(c->charge_countered);
    CHECK_THAT(c->momentum, WithinAbs(0.0, 1e-9));
    CHECK(*proc.can_charge(*state.find("knight"), state).reason == Reason::Countered);

    // No momentum bonus lands afterwards
    CHECK(proc.charge_damage("knight", *state.find("pike"), 10, state) == 10);
    auto before_attack = state;
    state = proc.apply(BattlePhase::Attack, state, ctx);
    CHECK(state.find("pike")->current_hp == before_attack.find("pike")->current_hp);
    CHECK(state.find("pike")->resolve == before_attack.find("pike")->resolve);
}

TEST_CASE("A counter that exhausts the charger's hp kills it", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto field = open_field();
    auto knight = *field.find("knight");
    knight.stats.hp = 15;
    knight.current_hp = 15;
    auto state = proc.initialize(field.with_unit(knight));
    state = proc.track_movement("knight", row_path(0, 4, 0), state);

    SECTION("in pre-attack") {
        auto after = proc.apply(BattlePhase::PreAttack, state, attack_ctx("knight", "pike"));
        const auto* k = after.find("knight");
        CHECK(k->current_hp == 0);
        CHECK_FALSE(k->alive);
        CHECK(after.component<ChargeComponent>("knight")->charge_countered);
    }

    SECTION("through execute_charge") {
        auto countered = proc.execute_charge("knight", "pike", 10, state);
        CHECK_FALSE(countered.success);
        REQUIRE(countered.counter);
        CHECK(countered.counter->damage == 15);
        CHECK(countered.counter->charger_new_hp == 0);
        CHECK(countered.counter->charger_killed);
        CHECK(countered.state.find("knight")->current_hp == 0);
        CHECK_FALSE(countered.state.find("knight")->alive);
    }
}

TEST_CASE("Stationary attacks against spear walls are not countered", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());

    auto ctx = attack_ctx("knight", "pike");
    auto after = proc.apply(BattlePhase::PreAttack, state, ctx);
    CHECK(after.find("knight")->current_hp == 20);
}

TEST_CASE("execute_charge resolves a charge directly", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());
    state = proc.track_movement("knight", row_path(0, 5, 0), state);

    auto hit = proc.execute_charge("knight", "footman", 10, state);
    REQUIRE(hit.success);
    CHECK(hit.damage == 20);
    CHECK(hit.resolve_damage == 10);
    CHECK_THAT(hit.momentum_used, WithinAbs(1.0, 1e-9));
    CHECK_FALSE(hit.state.find("footman")->alive);

    auto countered = proc.execute_charge("knight", "pike", 10, state);
    CHECK_FALSE(countered.success);
    CHECK(*countered.reason == Reason::Countered);
    REQUIRE(countered.counter);
    CHECK(countered.counter->damage == 15);
    CHECK(countered.counter->spearman_id == "pike");
}

TEST_CASE("Charge state resets at turn boundaries", "[charge]") {
    ChargeProcessor proc(enabled_config());
    auto state = proc.initialize(open_field());
    state = proc.apply(BattlePhase::Movement, state, move_ctx("knight", row_path(0, 4, 0)));

    state = proc.apply(BattlePhase::TurnEnd, state, turn_ctx("knight"));
    const auto* c = state.component<ChargeComponent>("knight");
    CHECK_THAT(c->momentum, WithinAbs(0.0, 1e-9));
    CHECK(c->charge_distance == 0);
    CHECK_FALSE(c->charge_countered);

    auto moved = *state.find("knight");
    moved.position = {4, 0};
    state = state.with_unit(moved);
    state = proc.apply(BattlePhase::TurnStart, state, turn_ctx("knight"));
    CHECK(*state.component<ChargeComponent>("knight")->charge_start == Position{4, 0});
}

// ================================================================
// Composition with interception
// ================================================================

TEST_CASE("A hard intercept cancels the charge", "[charge][intercept]") {
    InterceptConfig icfg;
    icfg.enabled = true;
    InterceptProcessor intercept(icfg);
    ChargeProcessor proc(enabled_config(), &intercept);

    auto state = BattleState({
        make_unit("knight", 1, {0, 1}, Capability::Cavalry | Capability::Charge),
        make_unit("pike", 2, {5, 0}, Capability::SpearWall),
    });
    state = intercept.initialize(state);
    state = proc.initialize(state);

    auto ctx = move_ctx("knight", row_path(0, 7, 1));
    state = intercept.apply(BattlePhase::Movement, state, ctx);
    state = proc.apply(BattlePhase::Movement, state, ctx);

    const auto* c = state.component<ChargeComponent>("knight");
    CHECK(c->charge_countered);
    CHECK(c->charge_distance == 5);
    CHECK_FALSE(proc.is_charging("knight", state));
    CHECK(state.find("knight")->position == Position{5, 1});
}

TEST_CASE("A disengage truncation keeps the shortened charge", "[charge][intercept]") {
    InterceptConfig icfg;
    icfg.enabled = true;
    icfg.disengage_cost = 1;
    InterceptProcessor intercept(icfg);
    ChargeProcessor proc(enabled_config(), &intercept);

    auto state = BattleState({
        make_unit("knight", 1, {1, 1}, Capability::Cavalry | Capability::Charge),
        make_unit("warden", 2, {1, 0}, Capability::ZoneOfControl),
    });
    state = intercept.initialize(state);
    state = proc.initialize(state);
    state = intercept.execute_soft_intercept("warden", "knight", state).state;

    // Speed 4 minus disengage cost 1 leaves three cells
    auto ctx = move_ctx("knight", {{1, 1}, {1, 2}, {1, 3}, {1, 4}, {1, 5}, {1, 6}});
    state = intercept.apply(BattlePhase::Movement, state, ctx);
    state = proc.apply(BattlePhase::Movement, state, ctx);

    CHECK(state.find("knight")->position == Position{1, 4});
    const auto* c = state.component<ChargeComponent>("knight");
    CHECK(c->charge_distance == 3);
    CHECK_FALSE(c->charge_countered);
    CHECK_THAT(c->momentum, WithinAbs(0.6, 1e-9));
}
