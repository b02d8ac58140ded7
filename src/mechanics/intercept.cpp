#include "mechanics/intercept.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace tac::mechanics {

using battle::BattlePhase;
using battle::BattleState;
using battle::BattleUnit;
using battle::Capability;
using battle::InterceptComponent;
using battle::Position;
using battle::UnitId;

const char* intercept_type_name(InterceptType type) {
    return type == InterceptType::Hard ? "hard" : "soft";
}

InterceptProcessor::InterceptProcessor(InterceptConfig config)
    : config_(std::move(config)) {}

BattleState InterceptProcessor::initialize(const BattleState& state) const {
    BattleState s = state;
    state.for_each([&](const BattleUnit& u) {
        bool hard = u.has(Capability::SpearWall);
        bool zoc = u.has(Capability::ZoneOfControl);
        if (!hard && !zoc) return;
        InterceptComponent c;
        c.max_intercepts = config_.max_intercepts;
        c.intercepts_remaining = config_.max_intercepts;
        c.can_hard_intercept = hard;
        c.has_zone_of_control = zoc;
        s = s.with_component(u.id, std::move(c));
    });
    return s;
}

InterceptComponent InterceptProcessor::component_or_default(
    const UnitId& unit, const BattleState& state) const {
    if (const auto* c = state.component<InterceptComponent>(unit)) return *c;
    return InterceptComponent{};
}

bool InterceptProcessor::is_spear_wall(const BattleUnit& unit) const {
    return unit.alive && unit.current_hp > 0 && unit.has(Capability::SpearWall);
}

std::optional<Position> InterceptProcessor::movement_halted_at(
    const UnitId& mover, const BattleState& state) const {
    const auto* c = state.component<InterceptComponent>(mover);
    return c ? c->halted_at : std::nullopt;
}

bool InterceptProcessor::was_hard_intercepted(const UnitId& mover,
                                              const BattleState& state) const {
    const auto* c = state.component<InterceptComponent>(mover);
    return c && c->halted_at && c->hard_intercepted;
}

bool InterceptProcessor::can_hard_intercept(const BattleUnit& interceptor,
                                            const BattleUnit& mover,
                                            const BattleState& state) const {
    if (!is_spear_wall(interceptor) || !interceptor.is_enemy_of(mover))
        return false;
    if (!mover.alive) return false;
    if (!mover.has(Capability::Cavalry) && !mover.has(Capability::Charge))
        return false;
    const auto* c = state.component<InterceptComponent>(interceptor.id);
    return c && c->intercepts_remaining > 0;
}

bool InterceptProcessor::can_soft_intercept(const BattleUnit& interceptor,
                                            const BattleUnit& mover,
                                            const BattleState& state) const {
    if (!config_.soft_intercept) return false;
    if (!interceptor.alive || interceptor.current_hp <= 0) return false;
    if (!interceptor.has(Capability::ZoneOfControl) ||
        interceptor.has(Capability::Ranged))
        return false;
    if (!interceptor.is_enemy_of(mover) || !mover.alive) return false;
    const auto* c = state.component<InterceptComponent>(interceptor.id);
    return c && c->intercepts_remaining > 0;
}

InterceptCheck InterceptProcessor::check_intercept(
    const BattleUnit& mover, const std::vector<Position>& path,
    const BattleState& state) const {
    InterceptCheck check;
    std::set<UnitId> seen;
    bool mover_is_cavalry = mover.has(Capability::Cavalry) ||
                            mover.has(Capability::Charge);

    for (size_t i = 1; i < path.size(); ++i) {
        const Position cell = path[i];
        std::optional<InterceptOpportunity> hard_here;
        std::optional<InterceptOpportunity> soft_here;

        state.for_each([&](const BattleUnit& u) {
            if (!u.alive || u.id == mover.id || !u.is_enemy_of(mover)) return;
            if (!battle::orthogonally_adjacent(u.position, cell)) return;
            if (seen.count(u.id)) return;
            const auto* c = state.component<InterceptComponent>(u.id);
            if (!c) return;

            InterceptOpportunity opp;
            opp.interceptor_id = u.id;
            opp.position = cell;
            opp.path_index = i;
            if (c->can_hard_intercept && mover_is_cavalry) {
                opp.type = InterceptType::Hard;
                opp.can_intercept = can_hard_intercept(u, mover, state);
            } else if (c->has_zone_of_control && !u.has(Capability::Ranged)) {
                opp.type = InterceptType::Soft;
                opp.can_intercept = can_soft_intercept(u, mover, state);
            } else {
                return;
            }

            seen.insert(u.id);
            check.opportunities.push_back(opp);
            if (!opp.can_intercept) return;
            if (opp.type == InterceptType::Hard && !hard_here) hard_here = opp;
            if (opp.type == InterceptType::Soft && !soft_here) soft_here = opp;
        });

        if (!check.first_intercept) {
            // Hard takes priority over soft on the same cell
            check.first_intercept = hard_here ? hard_here : soft_here;
        }
        if (hard_here) {
            check.movement_blocked = true;
            check.blocked_at = cell;
            break;
        }
    }

    check.has_intercept = check.first_intercept.has_value();
    return check;
}

i32 InterceptProcessor::calculate_intercept_damage(const BattleUnit& interceptor) const {
    return floor_to_int(interceptor.stats.atk * config_.hard_intercept_multiplier);
}

HardInterceptResult InterceptProcessor::execute_hard_intercept(
    const UnitId& interceptor_id, const UnitId& mover_id,
    const BattleState& state, std::optional<Position> stop_at,
    u64 /*seed*/) const {
    HardInterceptResult result;
    result.state = state;

    const auto* interceptor = state.find(interceptor_id);
    const auto* mover = state.find(mover_id);
    if (!interceptor || !mover || !mover->alive) return result;

    result.damage = calculate_intercept_damage(*interceptor);
    BattleUnit hit = mover->damaged(result.damage);
    if (stop_at) hit.position = *stop_at;

    InterceptComponent ic = component_or_default(interceptor_id, state);
    ic.intercepts_remaining = std::max(0, ic.intercepts_remaining - 1);
    ic.is_intercepting = true;

    InterceptComponent mc = component_or_default(mover_id, state);
    mc.halted_at = hit.position;
    mc.hard_intercepted = true;

    result.success = true;
    result.movement_stopped = true;
    result.stopped_at = hit.position;
    result.target_new_hp = hit.current_hp;
    result.target_killed = !hit.alive;
    result.interceptor_intercepts_remaining = ic.intercepts_remaining;
    result.state = state.with_unit(hit)
                       .with_component(interceptor_id, std::move(ic))
                       .with_component(mover_id, std::move(mc));

    spdlog::debug("intercept: {} stops {} at ({}, {}) for {} damage",
                  interceptor_id, mover_id, hit.position.x, hit.position.y,
                  result.damage);
    return result;
}

SoftInterceptResult InterceptProcessor::execute_soft_intercept(
    const UnitId& interceptor_id, const UnitId& mover_id,
    const BattleState& state) const {
    SoftInterceptResult result;
    result.state = state;

    const auto* interceptor = state.find(interceptor_id);
    const auto* mover = state.find(mover_id);
    if (!interceptor || !mover || !mover->alive) return result;

    InterceptComponent ic = component_or_default(interceptor_id, state);
    ic.intercepts_remaining = std::max(0, ic.intercepts_remaining - 1);
    ic.is_intercepting = true;

    InterceptComponent mc = component_or_default(mover_id, state);
    mc.engaged = true;

    result.success = true;
    result.engaged = true;
    result.interceptor_intercepts_remaining = ic.intercepts_remaining;
    result.state = state.with_component(interceptor_id, std::move(ic))
                       .with_component(mover_id, std::move(mc));

    spdlog::debug("intercept: {} engages {}", interceptor_id, mover_id);
    return result;
}

i32 InterceptProcessor::get_disengage_cost(const UnitId& unit,
                                           const BattleState& state) const {
    const auto* c = state.component<InterceptComponent>(unit);
    return (c && c->engaged) ? config_.disengage_cost : 0;
}

DisengageResult InterceptProcessor::attempt_disengage(const UnitId& unit_id,
                                                      const BattleState& state) const {
    DisengageResult result;
    result.state = state;

    const auto* unit = state.find(unit_id);
    if (!unit) {
        result.reason = Reason::UnitNotFound;
        return result;
    }

    result.cost = get_disengage_cost(unit_id, state);
    if (result.cost == 0) {
        result.success = true;
        result.remaining_movement = unit->stats.speed;
        return result;
    }
    if (unit->stats.speed < result.cost) {
        result.remaining_movement = unit->stats.speed;
        result.reason = Reason::InsufficientMovement;
        return result;
    }

    InterceptComponent c = component_or_default(unit_id, state);
    c.engaged = false;
    result.success = true;
    result.remaining_movement = unit->stats.speed - result.cost;
    result.triggered_attack_of_opportunity = true;
    result.state = state.with_component(unit_id, std::move(c));
    return result;
}

BattleState InterceptProcessor::reset_intercept_charges(const UnitId& unit,
                                                        const BattleState& state) const {
    const auto* c = state.component<InterceptComponent>(unit);
    if (!c) return state;
    InterceptComponent next = *c;
    next.intercepts_remaining = next.max_intercepts;
    next.is_intercepting = false;
    if (next == *c) return state;
    return state.with_component(unit, std::move(next));
}

BattleState InterceptProcessor::on_turn_start(const BattleUnit& unit,
                                              const BattleState& state) const {
    BattleState s = reset_intercept_charges(unit.id, state);
    const auto* c = s.component<InterceptComponent>(unit.id);
    if (!c) return s;

    InterceptComponent next = *c;
    next.halted_at.reset();
    next.hard_intercepted = false;
    if (next.engaged) {
        // Engagement lapses once no pinning enemy is adjacent any more
        bool pinned = false;
        s.for_each([&](const BattleUnit& u) {
            if (u.alive && u.is_enemy_of(unit) &&
                u.has(Capability::ZoneOfControl) &&
                !u.has(Capability::Ranged) &&
                battle::orthogonally_adjacent(u.position, unit.position))
                pinned = true;
        });
        next.engaged = pinned;
    }
    if (next == *c) return s;
    return s.with_component(unit.id, std::move(next));
}

BattleState InterceptProcessor::on_movement(const BattleUnit& mover,
                                            const std::vector<Position>& path,
                                            const BattleState& state,
                                            u64 seed) const {
    BattleState s = state;
    if (const auto* c = s.component<InterceptComponent>(mover.id)) {
        if (c->halted_at) {
            InterceptComponent next = *c;
            next.halted_at.reset();
            next.hard_intercepted = false;
            s = s.with_component(mover.id, std::move(next));
        }
    }

    std::vector<Position> effective = path;
    if (get_disengage_cost(mover.id, s) > 0) {
        auto d = attempt_disengage(mover.id, s);
        if (!d.success) {
            InterceptComponent mc = component_or_default(mover.id, s);
            mc.halted_at = mover.position;
            spdlog::debug("intercept: {} cannot disengage (speed {}, cost {})",
                          mover.id, mover.stats.speed, d.cost);
            return s.with_component(mover.id, std::move(mc));
        }
        s = d.state;
        size_t reachable = static_cast<size_t>(d.remaining_movement) + 1;
        if (effective.size() > reachable) {
            effective.resize(reachable);
            BattleUnit moved = *s.find(mover.id);
            moved.position = effective.back();
            InterceptComponent mc = component_or_default(mover.id, s);
            mc.halted_at = effective.back();
            s = s.with_unit(moved).with_component(mover.id, std::move(mc));
        }
    }

    const auto* current = s.find(mover.id);
    auto check = check_intercept(*current, effective, s);
    if (!check.has_intercept) return s;

    for (const auto& opp : check.opportunities) {
        if (opp.type != InterceptType::Soft || !opp.can_intercept) continue;
        const auto* mc = s.component<InterceptComponent>(mover.id);
        if (!mc || !mc->engaged) {
            s = execute_soft_intercept(opp.interceptor_id, mover.id, s).state;
        }
        break;
    }

    if (check.movement_blocked) {
        for (const auto& opp : check.opportunities) {
            if (opp.type == InterceptType::Hard && opp.can_intercept) {
                s = execute_hard_intercept(opp.interceptor_id, mover.id, s,
                                           check.blocked_at, seed)
                        .state;
                break;
            }
        }
    }
    return s;
}

BattleState InterceptProcessor::apply(BattlePhase phase, const BattleState& state,
                                      const battle::PhaseContext& ctx) const {
    const auto* unit = state.find(ctx.active_unit_id);
    if (!unit || !unit->alive) return state;

    switch (phase) {
    case BattlePhase::TurnStart:
        return on_turn_start(*unit, state);
    case BattlePhase::Movement:
        if (const auto* path = ctx.move_path()) {
            return on_movement(*unit, *path, state, ctx.seed);
        }
        return state;
    default:
        return state;
    }
}

} // namespace tac::mechanics
