#include "mechanics/charge.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tac::mechanics {

using battle::BattlePhase;
using battle::BattleState;
using battle::BattleUnit;
using battle::Capability;
using battle::ChargeComponent;
using battle::Position;
using battle::UnitId;

namespace {

bool carries_momentum(const ChargeComponent* c) {
    return c && c->momentum > 0 && !c->charge_countered;
}

} // namespace

ChargeProcessor::ChargeProcessor(ChargeConfig config,
                                 const InterceptQuery* intercept)
    : config_(std::move(config)), intercept_(intercept) {}

BattleState ChargeProcessor::initialize(const BattleState& state) const {
    BattleState s = state;
    state.for_each([&](const BattleUnit& u) {
        bool charger = u.has(Capability::Charge);
        bool spear = u.has(Capability::SpearWall);
        if (!charger && !spear) return;
        ChargeComponent c;
        c.can_charge = charger;
        c.has_spear_wall = spear;
        c.charge_start = u.position;
        s = s.with_component(u.id, std::move(c));
    });
    return s;
}

f64 ChargeProcessor::calculate_momentum(i32 distance) const {
    if (distance < config_.min_charge_distance) return 0.0;
    f64 momentum = distance * config_.momentum_per_cell;
    return std::clamp(momentum, 0.0, config_.max_momentum);
}

i32 ChargeProcessor::apply_charge_bonus(i32 base_damage, f64 momentum) {
    return floor_to_int(base_damage * (1.0 + momentum));
}

bool ChargeProcessor::is_countered_by_spear_wall(const BattleUnit& target) const {
    if (intercept_) return intercept_->is_spear_wall(target);
    return target.alive && target.has(Capability::SpearWall);
}

i32 ChargeProcessor::calculate_counter_damage(const BattleUnit& spearman) const {
    return floor_to_int(spearman.stats.atk * config_.counter_multiplier);
}

ChargeEligibility ChargeProcessor::can_charge(const BattleUnit& unit,
                                              const BattleState& state) const {
    ChargeEligibility e;
    if (!unit.has(Capability::Charge)) {
        e.reason = Reason::NoChargeAbility;
        return e;
    }
    const auto* c = state.component<ChargeComponent>(unit.id);
    if (c && c->charge_countered) {
        e.reason = Reason::Countered;
        return e;
    }
    i32 distance = c ? c->charge_distance : 0;
    if (distance < config_.min_charge_distance) {
        e.reason = Reason::InsufficientDistance;
        return e;
    }
    e.can_charge = true;
    return e;
}

f64 ChargeProcessor::get_momentum(const UnitId& unit, const BattleState& state) const {
    const auto* c = state.component<ChargeComponent>(unit);
    return c ? c->momentum : 0.0;
}

bool ChargeProcessor::is_charging(const UnitId& unit, const BattleState& state) const {
    const auto* c = state.component<ChargeComponent>(unit);
    return c && c->is_charging;
}

BattleState ChargeProcessor::apply_counter(const BattleUnit& charger,
                                           const BattleUnit& spearman,
                                           const BattleState& state,
                                           CounterResult& out) const {
    out.spearman_id = spearman.id;
    out.damage = calculate_counter_damage(spearman);
    BattleUnit hit = charger.damaged(out.damage);
    out.charger_new_hp = hit.current_hp;
    out.charger_killed = !hit.alive;

    ChargeComponent c;
    if (const auto* existing = state.component<ChargeComponent>(charger.id))
        c = *existing;
    c.momentum = 0.0;
    c.is_charging = false;
    c.charge_countered = true;

    spdlog::debug("charge: {} countered by {} ({} damage{})", charger.id,
                  spearman.id, out.damage, out.charger_killed ? ", fatal" : "");
    return state.with_unit(hit).with_component(charger.id, std::move(c));
}

i32 ChargeProcessor::charge_damage(const UnitId& charger,
                                   const BattleUnit& target, i32 base_damage,
                                   const BattleState& state) const {
    const auto* c = state.component<ChargeComponent>(charger);
    if (!carries_momentum(c) || !target.alive) return base_damage;
    return apply_charge_bonus(base_damage, c->momentum);
}

ChargeExecution ChargeProcessor::execute_charge(const UnitId& charger_id,
                                                const UnitId& target_id,
                                                i32 base_damage,
                                                const BattleState& state,
                                                u64 /*seed*/) const {
    ChargeExecution result;
    result.state = state;

    const auto* charger = state.find(charger_id);
    const auto* target = state.find(target_id);
    if (!charger || !target) {
        result.reason = Reason::UnitNotFound;
        return result;
    }

    ChargeComponent c;
    if (const auto* existing = state.component<ChargeComponent>(charger_id))
        c = *existing;
    result.momentum_used = c.momentum;

    if (c.momentum > 0 && is_countered_by_spear_wall(*target)) {
        CounterResult counter;
        result.state = apply_counter(*charger, *target, state, counter);
        result.counter = counter;
        result.reason = Reason::Countered;
        return result;
    }

    result.damage = apply_charge_bonus(base_damage, c.momentum);
    BattleUnit hit = target->damaged(result.damage);
    if (c.momentum > 0) {
        result.resolve_damage = std::min(hit.resolve, config_.shock_resolve_damage);
        hit.resolve = std::max(0, hit.resolve - config_.shock_resolve_damage);
    }

    c.momentum = 0.0;
    c.is_charging = false;
    result.success = true;
    result.state = state.with_unit(hit).with_component(charger_id, std::move(c));
    return result;
}

BattleState ChargeProcessor::track_movement(const UnitId& unit_id,
                                            const std::vector<Position>& path,
                                            const BattleState& state) const {
    const auto* unit = state.find(unit_id);
    if (!unit || path.empty()) return state;

    ChargeComponent c;
    if (const auto* existing = state.component<ChargeComponent>(unit_id)) {
        c = *existing;
    } else {
        c.can_charge = unit->has(Capability::Charge);
        c.has_spear_wall = unit->has(Capability::SpearWall);
    }

    c.charge_start = path.front();
    c.charge_distance = static_cast<i32>(path.size()) - 1;
    c.momentum = (c.can_charge && !c.charge_countered)
                     ? calculate_momentum(c.charge_distance)
                     : 0.0;
    c.is_charging = c.momentum > 0;
    return state.with_component(unit_id, std::move(c));
}

BattleState ChargeProcessor::reset_charge(const UnitId& unit,
                                          const BattleState& state) const {
    const auto* c = state.component<ChargeComponent>(unit);
    if (!c) return state;
    ChargeComponent next = *c;
    next.momentum = 0.0;
    next.is_charging = false;
    next.charge_distance = 0;
    next.charge_countered = false;
    if (next == *c) return state;
    return state.with_component(unit, std::move(next));
}

BattleState ChargeProcessor::on_turn_start(const BattleUnit& unit,
                                           const BattleState& state) const {
    BattleState s = reset_charge(unit.id, state);
    const auto* c = s.component<ChargeComponent>(unit.id);
    if (!c || c->charge_start == unit.position) return s;
    ChargeComponent next = *c;
    next.charge_start = unit.position;
    return s.with_component(unit.id, std::move(next));
}

BattleState ChargeProcessor::on_movement(const BattleUnit& unit,
                                         const std::vector<Position>& path,
                                         const BattleState& state) const {
    const auto* c = state.component<ChargeComponent>(unit.id);
    if (!c || !c->can_charge) return state;

    std::vector<Position> travelled = path;
    auto halted = intercept_ ? intercept_->movement_halted_at(unit.id, state)
                             : std::nullopt;
    if (halted) {
        auto it = std::find(path.begin(), path.end(), *halted);
        if (it != path.end()) travelled.assign(path.begin(), it + 1);
    }

    if (halted && intercept_->was_hard_intercepted(unit.id, state)) {
        ChargeComponent next = *c;
        next.charge_start = path.front();
        next.charge_distance = static_cast<i32>(travelled.size()) - 1;
        next.momentum = 0.0;
        next.is_charging = false;
        next.charge_countered = true;
        spdlog::debug("charge: {} intercepted after {} cells", unit.id,
                      next.charge_distance);
        return state.with_component(unit.id, std::move(next));
    }
    return track_movement(unit.id, travelled, state);
}

BattleState ChargeProcessor::on_attack(const BattleUnit& charger,
                                       const BattleUnit& target,
                                       const BattleState& state) const {
    const auto* c = state.component<ChargeComponent>(charger.id);
    if (!c) return state;

    BattleState s = state;
    if (carries_momentum(c) && target.alive) {
        // The simulator already dealt charge_damage(); only shock remains.
        BattleUnit shocked = target;
        shocked.resolve = std::max(0, target.resolve - config_.shock_resolve_damage);
        s = s.with_unit(shocked);
        spdlog::debug("charge: {} hits {} with momentum {:.2f} (-{} resolve)",
                      charger.id, target.id, c->momentum,
                      config_.shock_resolve_damage);
    }

    ChargeComponent next = *c;
    next.momentum = 0.0;
    next.is_charging = false;
    if (next == *c) return s;
    return s.with_component(charger.id, std::move(next));
}

BattleState ChargeProcessor::apply(BattlePhase phase, const BattleState& state,
                                   const battle::PhaseContext& ctx) const {
    const auto* unit = state.find(ctx.active_unit_id);
    if (!unit) return state;
    const BattleUnit* target = ctx.target_id ? state.find(*ctx.target_id) : nullptr;

    switch (phase) {
    case BattlePhase::TurnStart:
        return unit->alive ? on_turn_start(*unit, state) : state;
    case BattlePhase::Movement:
        if (const auto* path = ctx.move_path(); path && unit->alive)
            return on_movement(*unit, *path, state);
        return state;
    case BattlePhase::PreAttack: {
        if (!target || !unit->alive || !unit->is_enemy_of(*target)) return state;
        const auto* c = state.component<ChargeComponent>(unit->id);
        if (!c || c->momentum <= 0 || c->charge_countered) return state;
        if (!is_countered_by_spear_wall(*target)) return state;
        CounterResult counter;
        return apply_counter(*unit, *target, state, counter);
    }
    case BattlePhase::Attack:
        if (!target || !unit->alive) return state;
        return on_attack(*unit, *target, state);
    case BattlePhase::TurnEnd:
        return reset_charge(unit->id, state);
    default:
        return state;
    }
}

} // namespace tac::mechanics
