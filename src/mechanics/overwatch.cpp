#include "mechanics/overwatch.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>

namespace tac::mechanics {

using battle::BattlePhase;
using battle::BattleState;
using battle::BattleUnit;
using battle::Capability;
using battle::OverwatchComponent;
using battle::Position;
using battle::UnitId;
using battle::Vigilance;

OverwatchProcessor::OverwatchProcessor(OverwatchConfig config,
                                       const AmmoLedger* ammo,
                                       const InterceptQuery* intercept)
    : config_(std::move(config)), ammo_(ammo), intercept_(intercept) {}

i32 OverwatchProcessor::watch_range(const BattleUnit& unit) const {
    return unit.range > 1 ? unit.range : config_.default_range;
}

OverwatchComponent OverwatchProcessor::component_for(const BattleUnit& unit,
                                                     const BattleState& state) const {
    if (const auto* c = state.component<OverwatchComponent>(unit.id)) return *c;
    OverwatchComponent c;
    c.max_shots = config_.max_shots;
    c.shots_remaining = config_.max_shots;
    c.range = watch_range(unit);
    return c;
}

BattleState OverwatchProcessor::initialize(const BattleState& state) const {
    BattleState s = state;
    state.for_each([&](const BattleUnit& u) {
        if (u.has(Capability::Ranged)) s = s.with_component(u.id, component_for(u, s));
    });
    return s;
}

bool OverwatchProcessor::is_vigilant(const UnitId& unit, const BattleState& state) const {
    const auto* c = state.component<OverwatchComponent>(unit);
    return c && c->vigilance == Vigilance::Active;
}

std::optional<Reason> OverwatchProcessor::can_enter_vigilance(
    const UnitId& unit_id, const BattleState& state) const {
    const auto* unit = state.find(unit_id);
    if (!unit) return Reason::UnitNotFound;
    if (!unit->alive) return Reason::UnitDead;
    if (!unit->has(Capability::Ranged)) return Reason::NotRanged;
    if (is_vigilant(unit_id, state)) return Reason::AlreadyVigilant;
    if (ammo_) {
        auto ammo = ammo_->check_ammo(unit_id, state);
        if (!ammo.can_attack) return ammo.reason.value_or(Reason::NoAmmo);
    }
    return std::nullopt;
}

VigilanceResult OverwatchProcessor::enter_vigilance(const UnitId& unit_id,
                                                    const BattleState& state) const {
    VigilanceResult result;
    result.state = state;
    result.reason = can_enter_vigilance(unit_id, state);
    if (result.reason) return result;

    const auto* unit = state.find(unit_id);
    OverwatchComponent c = component_for(*unit, state);
    c.vigilance = Vigilance::Active;
    c.max_shots = config_.max_shots;
    c.shots_remaining = config_.max_shots;
    c.engaged_targets.clear();
    c.entered_this_turn = true;

    result.success = true;
    result.state = state.with_component(unit_id, std::move(c));
    spdlog::debug("overwatch: {} enters vigilance (range {})", unit_id,
                  result.state.component<OverwatchComponent>(unit_id)->range);
    return result;
}

VigilanceResult OverwatchProcessor::exit_vigilance(const UnitId& unit_id,
                                                   const BattleState& state) const {
    VigilanceResult result;
    result.state = state;
    if (!is_vigilant(unit_id, state)) {
        result.reason = Reason::NotInVigilance;
        return result;
    }
    OverwatchComponent c = *state.component<OverwatchComponent>(unit_id);
    c.vigilance = Vigilance::Inactive;
    c.entered_this_turn = false;
    result.success = true;
    result.state = state.with_component(unit_id, std::move(c));
    return result;
}

BattleState OverwatchProcessor::reset_vigilance(const UnitId& unit_id,
                                                const BattleState& state) const {
    const auto* c = state.component<OverwatchComponent>(unit_id);
    if (!c) return state;
    OverwatchComponent next = *c;
    next.vigilance = Vigilance::Inactive;
    next.shots_remaining = next.max_shots;
    next.engaged_targets.clear();
    next.entered_this_turn = false;
    if (next == *c) return state;
    return state.with_component(unit_id, std::move(next));
}

OverwatchCheck OverwatchProcessor::check_overwatch(const BattleUnit& mover,
                                                   const std::vector<Position>& path,
                                                   const BattleState& state) const {
    OverwatchCheck check;
    if (!mover.alive || mover.has(Capability::Stealth) || path.size() < 2)
        return check;

    struct Budget {
        i32 shots = 0;
        i32 ammo = 0;
        bool unlimited = false;
        std::optional<Reason> ammo_reason;
    };
    std::map<UnitId, Budget> budgets;
    std::set<UnitId> triggered;

    for (size_t i = 1; i < path.size(); ++i) {
        const Position cell = path[i];
        state.for_each([&](const BattleUnit& w) {
            if (!w.alive || w.id == mover.id || !w.is_enemy_of(mover)) return;
            const auto* c = state.component<OverwatchComponent>(w.id);
            if (!c || c->vigilance != Vigilance::Active) return;
            if (c->engaged_targets.count(mover.id) || triggered.count(w.id)) return;
            i32 distance = battle::manhattan(w.position, cell);
            if (distance > c->range) return;

            auto it = budgets.find(w.id);
            if (it == budgets.end()) {
                Budget b;
                b.shots = c->shots_remaining;
                if (ammo_) {
                    auto ammo = ammo_->check_ammo(w.id, state);
                    b.unlimited = ammo.ammo_remaining == battle::UNLIMITED_AMMO;
                    b.ammo = ammo.can_attack ? ammo.ammo_remaining : 0;
                    b.ammo_reason = ammo.reason;
                } else {
                    b.unlimited = true;
                }
                it = budgets.emplace(w.id, b).first;
            }
            Budget& b = it->second;
            if (b.shots <= 0) return;

            OverwatchOpportunity opp;
            opp.watcher_id = w.id;
            opp.target_id = mover.id;
            opp.trigger_position = cell;
            opp.path_index = i;
            opp.distance = distance;
            triggered.insert(w.id);

            if (!b.unlimited && b.ammo <= 0) {
                // Ammunition gates firing independently of the shot budget
                opp.reason = b.ammo_reason.value_or(Reason::NoAmmo);
            } else {
                opp.can_fire = true;
                b.shots--;
                if (!b.unlimited) b.ammo--;
            }
            check.opportunities.push_back(opp);
        });
    }

    check.has_overwatch = std::any_of(
        check.opportunities.begin(), check.opportunities.end(),
        [](const OverwatchOpportunity& o) { return o.can_fire; });
    return check;
}

i32 OverwatchProcessor::calculate_overwatch_damage(const BattleUnit& watcher) const {
    return floor_to_int(watcher.stats.atk * config_.damage_multiplier);
}

OverwatchShot OverwatchProcessor::execute_overwatch_shot(const UnitId& watcher_id,
                                                         const UnitId& target_id,
                                                         const BattleState& state,
                                                         u64 /*seed*/) const {
    OverwatchShot shot;
    shot.state = state;

    const auto* watcher = state.find(watcher_id);
    const auto* target = state.find(target_id);
    if (!watcher || !target) {
        shot.reason = Reason::UnitNotFound;
        return shot;
    }
    if (!watcher->alive || !target->alive) {
        shot.reason = Reason::UnitDead;
        return shot;
    }
    const auto* c = state.component<OverwatchComponent>(watcher_id);
    if (!c || c->vigilance != Vigilance::Active) {
        shot.reason = Reason::NotInVigilance;
        return shot;
    }
    if (c->shots_remaining <= 0) {
        shot.reason = Reason::NoShotsRemaining;
        return shot;
    }

    BattleState s = state;
    shot.watcher_ammo_remaining = battle::UNLIMITED_AMMO;
    if (ammo_) {
        auto consumed = ammo_->consume_ammo(watcher_id, s, 1);
        if (!consumed.success) {
            shot.reason = consumed.reason;
            return shot;
        }
        s = consumed.state;
        shot.ammo_consumed = consumed.ammo_consumed;
        shot.watcher_ammo_remaining = consumed.ammo_remaining;
    }

    shot.damage = calculate_overwatch_damage(*watcher);
    BattleUnit hit = target->damaged(shot.damage);
    shot.target_new_hp = hit.current_hp;
    shot.target_killed = !hit.alive;

    OverwatchComponent next = *c;
    next.shots_remaining--;
    next.engaged_targets.insert(target_id);
    shot.watcher_shots_remaining = next.shots_remaining;

    shot.success = true;
    shot.state = s.with_unit(hit).with_component(watcher_id, std::move(next));
    spdlog::debug("overwatch: {} fires on {} for {} damage ({} shots left)",
                  watcher_id, target_id, shot.damage, shot.watcher_shots_remaining);
    return shot;
}

BattleState OverwatchProcessor::on_movement(const BattleUnit& mover,
                                            const std::vector<Position>& path,
                                            const BattleState& state,
                                            u64 seed) const {
    std::vector<Position> travelled = path;
    if (intercept_) {
        if (auto halted = intercept_->movement_halted_at(mover.id, state)) {
            auto it = std::find(path.begin(), path.end(), *halted);
            if (it != path.end()) travelled.assign(path.begin(), it + 1);
        }
    }

    auto check = check_overwatch(mover, travelled, state);
    if (!check.has_overwatch) return state;

    BattleState s = state;
    for (const auto& opp : check.opportunities) {
        if (!opp.can_fire) continue;
        const auto* target = s.find(mover.id);
        if (!target || !target->alive) break;
        auto shot = execute_overwatch_shot(opp.watcher_id, mover.id, s, seed);
        if (shot.success) s = shot.state;
    }
    return s;
}

BattleState OverwatchProcessor::apply(BattlePhase phase, const BattleState& state,
                                      const battle::PhaseContext& ctx) const {
    const auto* unit = state.find(ctx.active_unit_id);
    if (!unit || !unit->alive) return state;

    switch (phase) {
    case BattlePhase::TurnStart:
        return reset_vigilance(unit->id, state);
    case BattlePhase::Movement:
        if (const auto* path = ctx.move_path())
            return on_movement(*unit, *path, state, ctx.seed);
        return state;
    case BattlePhase::TurnEnd: {
        const auto* ability = ctx.ability_id();
        if (!ability || *ability != OVERWATCH_ABILITY_ID) return state;
        auto result = enter_vigilance(unit->id, state);
        if (!result.success) {
            spdlog::debug("overwatch: {} cannot enter vigilance ({})", unit->id,
                          reason_name(*result.reason));
        }
        return result.state;
    }
    default:
        return state;
    }
}

} // namespace tac::mechanics
