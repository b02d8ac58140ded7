#include "mechanics/phalanx.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <set>

namespace tac::mechanics {

using battle::BattlePhase;
using battle::BattleState;
using battle::BattleUnit;
using battle::Capability;
using battle::FormationState;
using battle::PhalanxComponent;
using battle::Position;
using battle::UnitId;

namespace {

constexpr std::array<Position, 4> ORTHOGONAL = {{{0, -1}, {1, 0}, {0, 1}, {-1, 0}}};

Position offset(Position p, Position d) {
    return {p.x + d.x, p.y + d.y};
}

} // namespace

const char* formation_state_name(FormationState s) {
    switch (s) {
    case FormationState::None:    return "none";
    case FormationState::Partial: return "partial";
    case FormationState::Full:    return "full";
    }
    return "none";
}

PhalanxProcessor::PhalanxProcessor(PhalanxConfig config)
    : config_(std::move(config)) {}

bool PhalanxProcessor::can_join_phalanx(const BattleUnit& unit) const {
    return unit.alive && unit.has(Capability::Phalanx) &&
           !unit.has(Capability::PhalanxImmune);
}

FormationDetection PhalanxProcessor::detect_formation(const BattleUnit& unit,
                                                      const BattleState& state) const {
    FormationDetection d;
    if (!unit.alive) return d;

    for (const auto& dir : ORTHOGONAL) {
        const auto* n = state.unit_at(offset(unit.position, dir));
        if (!n || n->id == unit.id || n->team != unit.team) continue;
        d.total_adjacent++;
        if (!can_join_phalanx(*n)) continue;
        if (config_.require_same_facing && n->facing != unit.facing) continue;
        d.adjacent_allies.push_back(n->id);
    }
    d.aligned_count = static_cast<i32>(d.adjacent_allies.size());
    d.can_form_phalanx = can_join_phalanx(unit) && d.aligned_count > 0;
    return d;
}

PhalanxBonuses PhalanxProcessor::calculate_bonuses(i32 aligned_count) const {
    PhalanxBonuses b;
    i32 count = std::max(0, aligned_count);
    b.raw_armor_bonus = count * config_.armor_per_ally;
    b.raw_resolve_bonus = count * config_.resolve_per_ally;
    b.armor_bonus = std::min(config_.max_armor_bonus, b.raw_armor_bonus);
    b.resolve_bonus = std::min(config_.max_resolve_bonus, b.raw_resolve_bonus);
    b.capped_armor = b.raw_armor_bonus > config_.max_armor_bonus;
    b.capped_resolve = b.raw_resolve_bonus > config_.max_resolve_bonus;
    if (count >= 4) {
        b.formation_state = FormationState::Full;
    } else if (count >= 1) {
        b.formation_state = FormationState::Partial;
    }
    return b;
}

i32 PhalanxProcessor::get_effective_armor(const BattleUnit& unit,
                                          const BattleState& state) const {
    const auto* c = state.component<PhalanxComponent>(unit.id);
    return unit.stats.armor + (c ? c->armor_bonus : 0);
}

i32 PhalanxProcessor::get_effective_resolve(const BattleUnit& unit,
                                            const BattleState& state) const {
    const auto* c = state.component<PhalanxComponent>(unit.id);
    return unit.resolve + (c ? c->resolve_bonus : 0);
}

bool PhalanxProcessor::is_in_phalanx(const UnitId& unit, const BattleState& state) const {
    const auto* c = state.component<PhalanxComponent>(unit);
    return c && c->in_phalanx;
}

FormationState PhalanxProcessor::get_formation_state(const UnitId& unit,
                                                     const BattleState& state) const {
    const auto* c = state.component<PhalanxComponent>(unit);
    return c ? c->state : FormationState::None;
}

BattleState PhalanxProcessor::clear_phalanx(const UnitId& unit,
                                            const BattleState& state) const {
    const auto* c = state.component<PhalanxComponent>(unit);
    if (!c || *c == PhalanxComponent{}) return state;
    return state.with_component(unit, PhalanxComponent{});
}

void PhalanxProcessor::refresh_unit(const BattleUnit& unit,
                                    RecalcResult& result) const {
    const auto* current = result.state.component<PhalanxComponent>(unit.id);
    PhalanxComponent before = current ? *current : PhalanxComponent{};

    PhalanxComponent after;
    if (can_join_phalanx(unit)) {
        auto formation = detect_formation(unit, result.state);
        auto bonuses = calculate_bonuses(formation.aligned_count);
        after.in_phalanx = formation.aligned_count > 0;
        after.adjacent_allies_count = formation.aligned_count;
        after.armor_bonus = bonuses.armor_bonus;
        after.resolve_bonus = bonuses.resolve_bonus;
        after.state = bonuses.formation_state;
    }

    if (after == before) return;
    // Units that never took part get no record
    if (!current && after == PhalanxComponent{}) return;

    result.formations_changed++;
    result.total_armor_bonus_change += after.armor_bonus - before.armor_bonus;
    result.total_resolve_bonus_change += after.resolve_bonus - before.resolve_bonus;
    result.state = result.state.with_component(unit.id, std::move(after));
}

RecalcResult PhalanxProcessor::recalculate(const BattleState& state,
                                           RecalcTrigger trigger,
                                           const std::vector<UnitId>& dead) const {
    RecalcResult result;
    result.state = state;

    if (trigger == RecalcTrigger::TurnStart) {
        state.for_each([&](const BattleUnit& u) { refresh_unit(u, result); });
    } else {
        std::vector<const BattleUnit*> fallen;
        if (dead.empty()) {
            state.for_each([&](const BattleUnit& u) {
                if (!u.alive) fallen.push_back(&u);
            });
        } else {
            for (const auto& id : dead) {
                const auto* u = state.find(id);
                if (u && !u->alive) fallen.push_back(u);
            }
        }

        std::set<UnitId> affected;
        std::vector<const BattleUnit*> order;
        auto touch = [&](const BattleUnit* u) {
            if (u && affected.insert(u->id).second) order.push_back(u);
        };
        for (const auto* f : fallen) {
            touch(f);
            for (const auto& dir : ORTHOGONAL) {
                touch(state.unit_at(offset(f->position, dir)));
            }
        }
        for (const auto* u : order) refresh_unit(*u, result);
    }

    if (result.formations_changed > 0) {
        spdlog::debug("phalanx: {} formations changed (armor {:+}, resolve {:+})",
                      result.formations_changed, result.total_armor_bonus_change,
                      result.total_resolve_bonus_change);
    }
    return result;
}

BattleState PhalanxProcessor::initialize(const BattleState& state) const {
    BattleState s = state;
    state.for_each([&](const BattleUnit& u) {
        if (can_join_phalanx(u)) s = s.with_component(u.id, PhalanxComponent{});
    });
    return recalculate(s, RecalcTrigger::TurnStart).state;
}

BattleState PhalanxProcessor::apply(BattlePhase phase, const BattleState& state,
                                    const battle::PhaseContext& ctx) const {
    switch (phase) {
    case BattlePhase::TurnStart:
        return recalculate(state, RecalcTrigger::TurnStart).state;
    case BattlePhase::PostAttack: {
        std::vector<UnitId> dead;
        const auto* attacker = state.find(ctx.active_unit_id);
        if (attacker && !attacker->alive) dead.push_back(attacker->id);
        if (ctx.target_id) {
            const auto* target = state.find(*ctx.target_id);
            if (target && !target->alive) dead.push_back(target->id);
        }
        if (dead.empty()) return state;
        return recalculate(state, RecalcTrigger::PostAttack, dead).state;
    }
    default:
        return state;
    }
}

} // namespace tac::mechanics
