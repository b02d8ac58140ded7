#include "mechanics/line_of_sight.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace tac::mechanics {

using battle::BattlePhase;
using battle::BattleState;
using battle::BattleUnit;
using battle::Capability;
using battle::FireMode;
using battle::LosComponent;
using battle::Position;
using battle::UnitId;

namespace {
constexpr f64 PI = 3.14159265358979323846;
}

const char* fire_mode_name(FireMode mode) {
    switch (mode) {
    case FireMode::Direct:  return "direct";
    case FireMode::Arc:     return "arc";
    case FireMode::Blocked: return "blocked";
    }
    return "blocked";
}

LineOfSightProcessor::LineOfSightProcessor(LineOfSightConfig config,
                                           const AmmoLedger* ammo)
    : config_(std::move(config)), ammo_(ammo) {}

BattleState LineOfSightProcessor::initialize(const BattleState& state) const {
    BattleState s = state;
    state.for_each([&](const BattleUnit& u) {
        if (!u.has(Capability::Ranged) && !u.has(Capability::ArcFire) &&
            !u.has(Capability::LosTransparent))
            return;
        LosComponent c;
        c.blocks_los = !u.has(Capability::LosTransparent);
        c.firing_arc = config_.default_firing_arc;
        c.can_arc_fire = u.has(Capability::ArcFire);
        s = s.with_component(u.id, std::move(c));
    });
    return s;
}

std::vector<Position> LineOfSightProcessor::trace_line(Position from, Position to) {
    std::vector<Position> cells;

    i32 dx = to.x - from.x;
    i32 dy = to.y - from.y;
    i32 sx = dx > 0 ? 1 : (dx < 0 ? -1 : 0);
    i32 sy = dy > 0 ? 1 : (dy < 0 ? -1 : 0);
    dx = std::abs(dx);
    dy = std::abs(dy);

    i32 x = from.x;
    i32 y = from.y;

    if (dx >= dy) {
        i32 err = dx / 2;
        for (i32 i = 0; i <= dx; ++i) {
            cells.push_back({x, y});
            err -= dy;
            if (err < 0) {
                y += sy;
                err += dx;
            }
            x += sx;
        }
    } else {
        i32 err = dy / 2;
        for (i32 i = 0; i <= dy; ++i) {
            cells.push_back({x, y});
            err -= dx;
            if (err < 0) {
                x += sx;
                err += dy;
            }
            y += sy;
        }
    }
    return cells;
}

bool LineOfSightProcessor::blocks_los(const BattleUnit& unit,
                                      const BattleState& state) const {
    if (!unit.alive || unit.has(Capability::LosTransparent)) return false;
    const auto* c = state.component<LosComponent>(unit.id);
    return c ? c->blocks_los : true;
}

bool LineOfSightProcessor::can_arc_fire(const BattleUnit& unit,
                                        const BattleState& state) const {
    const auto* c = state.component<LosComponent>(unit.id);
    return c ? c->can_arc_fire : unit.has(Capability::ArcFire);
}

std::vector<const BattleUnit*> LineOfSightProcessor::get_blocking_units(
    const BattleUnit& attacker, const BattleUnit& target,
    const BattleState& state) const {
    std::vector<const BattleUnit*> blockers;
    auto cells = trace_line(attacker.position, target.position);
    if (cells.size() <= 2) return blockers;

    // Endpoints excluded; allies block exactly like enemies
    for (size_t i = 1; i + 1 < cells.size(); ++i) {
        const auto* u = state.unit_at(cells[i]);
        if (!u || u->id == attacker.id || u->id == target.id) continue;
        if (blocks_los(*u, state)) blockers.push_back(u);
    }
    return blockers;
}

LosCheck LineOfSightProcessor::check_los(const BattleUnit& attacker,
                                         const BattleUnit& target,
                                         const BattleState& state) const {
    LosCheck check;
    auto blockers = get_blocking_units(attacker, target, state);
    for (const auto* b : blockers) check.obstacles.push_back(b->id);

    bool arc = can_arc_fire(attacker, state);
    if (blockers.empty()) {
        check.has_los = true;
        check.direct_los = true;
        check.arc_los = arc;
        check.recommended_mode = FireMode::Direct;
    } else if (arc) {
        check.has_los = true;
        check.arc_los = true;
        check.recommended_mode = FireMode::Arc;
    } else {
        check.recommended_mode = FireMode::Blocked;
        check.block_reason = Reason::BlockedByUnit;
    }
    return check;
}

f64 LineOfSightProcessor::accuracy_modifier(const LosCheck& los) const {
    switch (los.recommended_mode) {
    case FireMode::Direct:  return 1.0;
    case FireMode::Arc:     return 1.0 - config_.arc_fire_penalty;
    case FireMode::Blocked: return 0.0;
    }
    return 0.0;
}

bool LineOfSightProcessor::is_in_firing_arc(const BattleUnit& attacker,
                                            const BattleUnit& target,
                                            const BattleState& state) const {
    const auto* c = state.component<LosComponent>(attacker.id);
    i32 arc = c ? c->firing_arc : config_.default_firing_arc;
    if (arc >= 360) return true;

    f64 dx = target.position.x - attacker.position.x;
    f64 dy = target.position.y - attacker.position.y;
    f64 len = std::sqrt(dx * dx + dy * dy);
    if (len == 0.0) return true;

    Position f = battle::facing_vector(attacker.facing);
    f64 cos_angle = (dx * f.x + dy * f.y) / len;
    f64 angle = std::acos(std::clamp(cos_angle, -1.0, 1.0)) * 180.0 / PI;
    return angle <= arc / 2.0 + 1e-9;
}

std::vector<UnitId> LineOfSightProcessor::find_valid_targets(
    const BattleUnit& attacker, const BattleState& state) const {
    std::vector<UnitId> targets;
    if (!attacker.alive) return targets;
    state.for_each([&](const BattleUnit& u) {
        if (!u.alive || !u.is_enemy_of(attacker)) return;
        if (battle::manhattan(u.position, attacker.position) > attacker.range)
            return;
        if (config_.enforce_firing_arc && !is_in_firing_arc(attacker, u, state))
            return;
        if (check_los(attacker, u, state).has_los) targets.push_back(u.id);
    });
    return targets;
}

RangedAttackValidation LineOfSightProcessor::validate_ranged_attack(
    const UnitId& attacker_id, const UnitId& target_id,
    const BattleState& state) const {
    RangedAttackValidation v;
    const auto* attacker = state.find(attacker_id);
    const auto* target = state.find(target_id);
    if (!attacker || !target) {
        v.reason = Reason::UnitNotFound;
        return v;
    }
    if (!attacker->alive || !target->alive) {
        v.reason = Reason::UnitDead;
        return v;
    }
    if (!attacker->has(Capability::Ranged)) {
        v.reason = Reason::NotRanged;
        return v;
    }
    if (battle::manhattan(attacker->position, target->position) > attacker->range) {
        v.reason = Reason::OutOfRange;
        return v;
    }
    if (config_.enforce_firing_arc && !is_in_firing_arc(*attacker, *target, state)) {
        v.reason = Reason::OutOfArc;
        return v;
    }
    if (ammo_) {
        auto ammo = ammo_->check_ammo(attacker_id, state);
        if (!ammo.can_attack) {
            v.reason = ammo.reason;
            return v;
        }
    }

    v.los = check_los(*attacker, *target, state);
    v.accuracy_modifier = accuracy_modifier(v.los);
    if (!v.los.has_los) {
        v.reason = v.los.block_reason;
        return v;
    }
    v.valid = true;
    return v;
}

BattleState LineOfSightProcessor::apply(BattlePhase phase, const BattleState& state,
                                        const battle::PhaseContext& ctx) const {
    const auto* attacker = state.find(ctx.active_unit_id);
    if (!attacker) return state;

    switch (phase) {
    case BattlePhase::PreAttack: {
        if (!ctx.target_id || !attacker->alive ||
            !attacker->has(Capability::Ranged))
            return state;
        const auto* target = state.find(*ctx.target_id);
        if (!target) return state;

        auto los = check_los(*attacker, *target, state);
        LosComponent c;
        if (const auto* existing = state.component<LosComponent>(attacker->id)) {
            c = *existing;
        } else {
            c.firing_arc = config_.default_firing_arc;
            c.can_arc_fire = attacker->has(Capability::ArcFire);
        }
        c.fire_mode = los.recommended_mode;
        if (los.recommended_mode != FireMode::Direct) {
            spdlog::debug("line_of_sight: {} -> {} {} ({} obstacles)",
                          attacker->id, target->id,
                          fire_mode_name(los.recommended_mode),
                          los.obstacles.size());
        }
        return state.with_component(attacker->id, std::move(c));
    }
    case BattlePhase::TurnEnd: {
        const auto* c = state.component<LosComponent>(attacker->id);
        if (!c || !c->fire_mode) return state;
        LosComponent next = *c;
        next.fire_mode.reset();
        return state.with_component(attacker->id, std::move(next));
    }
    default:
        return state;
    }
}

} // namespace tac::mechanics
