#include <catch2/catch_test_macros.hpp>

#include "mechanics/intercept.hpp"
#include "test_fixtures.hpp"

using namespace tac;
using namespace tac::battle;
using namespace tac::mechanics;
using tac::testing::make_unit;
using tac::testing::move_ctx;
using tac::testing::row_path;
using tac::testing::turn_ctx;

namespace {

InterceptConfig enabled_config() {
    InterceptConfig c;
    c.enabled = true;
    return c;
}

} // namespace

// ================================================================
// Hard intercept
// ================================================================

TEST_CASE("Spear wall halts cavalry at the first adjacent cell", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("knight", 1, {0, 1}, Capability::Cavalry | Capability::Charge),
        make_unit("pike", 2, {5, 0}, Capability::SpearWall),
    }));

    auto path = row_path(0, 7, 1);
    auto check = proc.check_intercept(*state.find("knight"), path, state);
    REQUIRE(check.has_intercept);
    CHECK(check.movement_blocked);
    REQUIRE(check.blocked_at);
    CHECK(*check.blocked_at == Position{5, 1});
    CHECK(check.first_intercept->type == InterceptType::Hard);
    CHECK(check.first_intercept->interceptor_id == "pike");
    CHECK(check.first_intercept->path_index == 5);

    state = proc.apply(BattlePhase::Movement, state, move_ctx("knight", path));

    const auto* knight = state.find("knight");
    CHECK(knight->position == Position{5, 1});
    CHECK(knight->current_hp == 5); // 20 - floor(10 * 1.5)
    REQUIRE(proc.movement_halted_at("knight", state));
    CHECK(*proc.movement_halted_at("knight", state) == Position{5, 1});
    CHECK(proc.was_hard_intercepted("knight", state));

    const auto* pike = state.component<InterceptComponent>("pike");
    CHECK(pike->intercepts_remaining == 0);
    CHECK(pike->is_intercepting);
}

TEST_CASE("Infantry walks past a spear wall", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("footman", 1, {0, 1}),
        make_unit("pike", 2, {5, 0}, Capability::SpearWall),
    }));

    auto path = row_path(0, 7, 1);
    auto check = proc.check_intercept(*state.find("footman"), path, state);
    CHECK_FALSE(check.has_intercept);

    auto after = proc.apply(BattlePhase::Movement, state, move_ctx("footman", path));
    CHECK(after.find("footman")->current_hp == 20);
    CHECK_FALSE(proc.movement_halted_at("footman", after));
}

TEST_CASE("Intercept charges run out and reset on the interceptor's turn", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("knight_a", 1, {0, 1}, Capability::Cavalry),
        make_unit("knight_b", 1, {0, 2}, Capability::Cavalry),
        make_unit("pike", 2, {5, 0}, Capability::SpearWall),
    }));

    state = proc.apply(BattlePhase::Movement, state, move_ctx("knight_a", row_path(0, 7, 1)));
    REQUIRE(proc.was_hard_intercepted("knight_a", state));

    // Second rider passes the exhausted pike on row 1 via a detour
    std::vector<Position> path = {{0, 2}, {1, 2}, {2, 2}, {3, 2}, {4, 2}, {4, 1}};
    auto check = proc.check_intercept(*state.find("knight_b"), path, state);
    REQUIRE(check.opportunities.size() == 0); // (4,1) is not adjacent to (5,0)

    std::vector<Position> close = {{0, 2}, {1, 2}, {2, 2}, {3, 2}, {4, 2}, {4, 1}, {4, 0}};
    check = proc.check_intercept(*state.find("knight_b"), close, state);
    REQUIRE(check.opportunities.size() == 1);
    CHECK_FALSE(check.opportunities[0].can_intercept);
    CHECK_FALSE(check.movement_blocked);

    state = proc.apply(BattlePhase::TurnStart, state, turn_ctx("pike"));
    CHECK(state.component<InterceptComponent>("pike")->intercepts_remaining == 1);
    CHECK_FALSE(state.component<InterceptComponent>("pike")->is_intercepting);

    check = proc.check_intercept(*state.find("knight_b"), close, state);
    CHECK(check.movement_blocked);
}

TEST_CASE("Allies and dead spear walls do not intercept", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("knight", 1, {0, 1}, Capability::Cavalry),
        make_unit("friendly_pike", 1, {2, 0}, Capability::SpearWall),
        make_unit("fallen_pike", 2, {4, 0}, Capability::SpearWall),
    }));
    state = state.with_unit(state.find("fallen_pike")->damaged(100));

    auto check = proc.check_intercept(*state.find("knight"), row_path(0, 6, 1), state);
    CHECK_FALSE(check.has_intercept);
    CHECK(check.opportunities.empty());
    CHECK_FALSE(proc.is_spear_wall(*state.find("fallen_pike")));
    CHECK(proc.is_spear_wall(*state.find("friendly_pike")));
}

TEST_CASE("Hard intercept outranks soft on the same cell", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("knight", 1, {0, 1}, Capability::Cavalry),
        make_unit("pike", 2, {5, 0}, Capability::SpearWall),
        make_unit("warden", 2, {5, 2}, Capability::ZoneOfControl),
    }));

    auto check = proc.check_intercept(*state.find("knight"), row_path(0, 7, 1), state);
    REQUIRE(check.first_intercept);
    CHECK(check.first_intercept->type == InterceptType::Hard);
    CHECK(check.opportunities.size() == 2);
}

// ================================================================
// Soft intercept and disengage
// ================================================================

TEST_CASE("Zone of control engages without damage or halt", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("footman", 1, {0, 1}),
        make_unit("warden", 2, {3, 0}, Capability::ZoneOfControl),
    }));

    auto path = row_path(0, 6, 1);
    state = proc.apply(BattlePhase::Movement, state, move_ctx("footman", path));

    CHECK(state.find("footman")->current_hp == 20);
    CHECK_FALSE(proc.movement_halted_at("footman", state));
    REQUIRE(state.component<InterceptComponent>("footman"));
    CHECK(state.component<InterceptComponent>("footman")->engaged);
    CHECK(proc.get_disengage_cost("footman", state) == 2);
    CHECK(state.component<InterceptComponent>("warden")->intercepts_remaining == 0);
}

TEST_CASE("Ranged units and disabled soft intercept never engage", "[intercept]") {
    SECTION("ranged zone of control") {
        InterceptProcessor proc(enabled_config());
        auto state = proc.initialize(BattleState({
            make_unit("footman", 1, {0, 1}),
            make_unit("sniper", 2, {3, 0}, Capability::ZoneOfControl | Capability::Ranged),
        }));
        auto check = proc.check_intercept(*state.find("footman"), row_path(0, 6, 1), state);
        CHECK_FALSE(check.has_intercept);
    }
    SECTION("soft intercept off") {
        auto cfg = enabled_config();
        cfg.soft_intercept = false;
        InterceptProcessor proc(cfg);
        auto state = proc.initialize(BattleState({
            make_unit("footman", 1, {0, 1}),
            make_unit("warden", 2, {3, 0}, Capability::ZoneOfControl),
        }));
        auto check = proc.check_intercept(*state.find("footman"), row_path(0, 6, 1), state);
        CHECK_FALSE(check.has_intercept);
    }
}

TEST_CASE("Engaged units pay to disengage", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("footman", 1, {1, 1}),
        make_unit("warden", 2, {1, 0}, Capability::ZoneOfControl),
    }));
    state = proc.execute_soft_intercept("warden", "footman", state).state;
    REQUIRE(state.component<InterceptComponent>("footman")->engaged);

    // Still adjacent: the engagement holds through turn start
    state = proc.apply(BattlePhase::TurnStart, state, turn_ctx("footman"));
    REQUIRE(state.component<InterceptComponent>("footman")->engaged);

    SECTION("enough speed truncates the path") {
        std::vector<Position> path = {{1, 1}, {1, 2}, {1, 3}, {1, 4}, {1, 5}};
        state = proc.apply(BattlePhase::Movement, state, move_ctx("footman", path));

        CHECK_FALSE(state.component<InterceptComponent>("footman")->engaged);
        REQUIRE(proc.movement_halted_at("footman", state));
        CHECK(*proc.movement_halted_at("footman", state) == Position{1, 3});
        CHECK(state.find("footman")->position == Position{1, 3});
        CHECK_FALSE(proc.was_hard_intercepted("footman", state));
    }

    SECTION("too slow to disengage") {
        auto slow = *state.find("footman");
        slow.stats.speed = 1;
        state = state.with_unit(slow);

        auto result = proc.attempt_disengage("footman", state);
        CHECK_FALSE(result.success);
        CHECK(*result.reason == Reason::InsufficientMovement);

        std::vector<Position> path = {{1, 1}, {1, 2}};
        state = proc.apply(BattlePhase::Movement, state, move_ctx("footman", path));
        CHECK(*proc.movement_halted_at("footman", state) == Position{1, 1});
        CHECK(state.component<InterceptComponent>("footman")->engaged);
    }
}

TEST_CASE("Engagement lapses when the pinning unit is gone", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("footman", 1, {1, 1}),
        make_unit("warden", 2, {1, 0}, Capability::ZoneOfControl),
    }));
    state = proc.execute_soft_intercept("warden", "footman", state).state;
    state = state.with_unit(state.find("warden")->damaged(100));

    state = proc.apply(BattlePhase::TurnStart, state, turn_ctx("footman"));
    CHECK_FALSE(state.component<InterceptComponent>("footman")->engaged);
    CHECK(proc.get_disengage_cost("footman", state) == 0);

    auto free = proc.attempt_disengage("footman", state);
    CHECK(free.success);
    CHECK(free.cost == 0);
    CHECK(free.remaining_movement == 4);
}

TEST_CASE("Intercept ignores phases without movement", "[intercept]") {
    InterceptProcessor proc(enabled_config());
    auto state = proc.initialize(BattleState({
        make_unit("knight", 1, {4, 0}, Capability::Cavalry),
        make_unit("pike", 2, {5, 0}, Capability::SpearWall),
    }));

    auto ctx = tac::testing::attack_ctx("knight", "pike");
    CHECK(proc.apply(BattlePhase::PreAttack, state, ctx) == state);
    CHECK(proc.apply(BattlePhase::Attack, state, ctx) == state);
    CHECK(proc.apply(BattlePhase::PostAttack, state, ctx) == state);
}
