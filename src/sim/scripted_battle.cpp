#include "sim/scripted_battle.hpp"
#include "mechanics/intercept.hpp"
#include "mechanics/mechanic_processor.hpp"
#include "mechanics/mechanics_engine.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace tac::sim {

using battle::ActionType;
using battle::BattleAction;
using battle::BattlePhase;
using battle::BattleState;
using battle::BattleUnit;
using battle::PhaseContext;
using battle::Position;

const char* event_type_name(EventType type) {
    switch (type) {
    case EventType::Move:          return "move";
    case EventType::MoveHalted:    return "move_halted";
    case EventType::Attack:        return "attack";
    case EventType::AttackBlocked: return "attack_blocked";
    case EventType::Damage:        return "damage";
    case EventType::Death:         return "death";
    case EventType::Ability:       return "ability";
    case EventType::BattleEnd:     return "battle_end";
    }
    return "unknown";
}

std::string BattleEvent::describe() const {
    std::string s = fmt::format("[round {}] {} {}", round, event_type_name(type), actor);
    if (target) s += fmt::format(" -> {}", *target);
    if (position) s += fmt::format(" at ({}, {})", position->x, position->y);
    if (value != 0) s += fmt::format(" ({})", value);
    return s;
}

struct ScriptedBattle::Run {
    BattleState state;
    std::vector<BattleEvent> events;
    u32 round = 0;
    u64 seed = 0;
};

namespace {

/// The single team with living units, if exactly one remains.
std::optional<i32> last_team_standing(const BattleState& state) {
    std::set<i32> teams;
    state.for_each([&](const BattleUnit& u) {
        if (u.alive) teams.insert(u.team);
    });
    if (teams.size() == 1) return *teams.begin();
    return std::nullopt;
}

} // namespace

ScriptedBattle::ScriptedBattle(const mechanics::MechanicsEngine* engine)
    : engine_(engine) {}

BattleOutcome ScriptedBattle::run(const Scenario& scenario) const {
    Run run;
    run.state = BattleState(scenario.units);
    run.seed = scenario.seed;
    if (engine_) run.state = engine_->initialize_battle(run.state);

    spdlog::info("Battle '{}': {} units, {} scripted rounds", scenario.name,
                 scenario.units.size(), scenario.rounds.size());

    std::optional<i32> winner = last_team_standing(run.state);
    for (size_t r = 0; r < scenario.rounds.size() && !winner; ++r) {
        run.round = static_cast<u32>(r + 1);
        run.state = run.state.with_round(run.round);

        for (const auto& turn : scenario.rounds[r]) {
            const BattleUnit* actor = run.state.find(turn.actor);
            if (!actor) {
                spdlog::warn("Battle: round {} scripts unknown unit '{}'",
                             run.round, turn.actor);
                continue;
            }
            if (!actor->alive) continue;

            run_turn(run, turn);

            winner = last_team_standing(run.state);
            if (winner) break;
        }
    }

    BattleEvent end;
    end.type = EventType::BattleEnd;
    end.round = run.round;
    end.value = winner ? *winner : -1;
    run.events.push_back(end);

    if (winner) {
        spdlog::info("Battle '{}': team {} wins after {} rounds", scenario.name,
                     *winner, run.round);
    } else {
        spdlog::info("Battle '{}': undecided after {} rounds", scenario.name,
                     run.round);
    }

    BattleOutcome outcome;
    outcome.winner = winner;
    outcome.rounds_played = run.round;
    outcome.events = std::move(run.events);
    outcome.final_state = std::move(run.state);
    return outcome;
}

void ScriptedBattle::run_turn(Run& run, const ScriptedTurn& turn) const {
    PhaseContext start;
    start.active_unit_id = turn.actor;
    run_phase(run, BattlePhase::TurnStart, start);

    if (turn.path.size() >= 2) resolve_move(run, turn);
    if (turn.attack_target) resolve_attack(run, turn);

    const BattleUnit* actor = run.state.find(turn.actor);
    PhaseContext end;
    end.active_unit_id = turn.actor;
    if (turn.ability_id && actor && actor->alive) {
        BattleEvent ev;
        ev.type = EventType::Ability;
        ev.round = run.round;
        ev.actor = turn.actor;
        run.events.push_back(ev);

        BattleAction action;
        action.type = ActionType::Ability;
        action.ability_id = turn.ability_id;
        end.action = std::move(action);
    }
    run_phase(run, BattlePhase::TurnEnd, end);
}

void ScriptedBattle::run_phase(Run& run, BattlePhase phase, PhaseContext ctx) const {
    if (!engine_) return;

    ctx.seed = run.seed++;
    BattleState next = engine_->apply(phase, run.state, ctx);

    // Mechanic damage shows up as hp differences between snapshots.
    for (const auto& after : next.units()) {
        const BattleUnit* before = run.state.find(after->id);
        if (!before) continue;
        if (after->current_hp < before->current_hp) {
            BattleEvent ev;
            ev.type = EventType::Damage;
            ev.round = run.round;
            ev.actor = ctx.active_unit_id;
            ev.target = after->id;
            ev.value = before->current_hp - after->current_hp;
            run.events.push_back(ev);
        }
        if (before->alive && !after->alive) {
            BattleEvent ev;
            ev.type = EventType::Death;
            ev.round = run.round;
            ev.actor = after->id;
            run.events.push_back(ev);
        }
    }
    run.state = std::move(next);
}

void ScriptedBattle::resolve_move(Run& run, const ScriptedTurn& turn) const {
    BattleAction action;
    action.type = ActionType::Move;
    action.path = turn.path;

    PhaseContext ctx;
    ctx.active_unit_id = turn.actor;
    ctx.action = std::move(action);
    run_phase(run, BattlePhase::Movement, ctx);

    const BattleUnit* mover = run.state.find(turn.actor);
    if (!mover || !mover->alive) return;

    std::optional<Position> halted;
    if (engine_ && engine_->intercept())
        halted = engine_->intercept()->movement_halted_at(turn.actor, run.state);

    BattleEvent ev;
    ev.round = run.round;
    ev.actor = turn.actor;
    if (halted) {
        ev.type = EventType::MoveHalted;
        ev.position = *halted;
    } else {
        BattleUnit moved = *mover;
        moved.position = turn.path.back();
        run.state = run.state.with_unit(moved);
        ev.type = EventType::Move;
        ev.position = moved.position;
        ev.value = static_cast<i32>(turn.path.size() - 1);
    }
    run.events.push_back(ev);
}

void ScriptedBattle::resolve_attack(Run& run, const ScriptedTurn& turn) const {
    const auto& target_id = *turn.attack_target;
    {
        const BattleUnit* attacker = run.state.find(turn.actor);
        const BattleUnit* target = run.state.find(target_id);
        if (!attacker || !attacker->alive || !target || !target->alive) return;
    }

    BattleAction action;
    action.type = ActionType::Attack;
    action.target_id = target_id;

    PhaseContext ctx;
    ctx.active_unit_id = turn.actor;
    ctx.target_id = target_id;
    ctx.action = std::move(action);

    run_phase(run, BattlePhase::PreAttack, ctx);

    const BattleUnit* attacker = run.state.find(turn.actor);
    const BattleUnit* target = run.state.find(target_id);
    if (!attacker || !attacker->alive || !target || !target->alive) return;

    if (engine_ && !engine_->attack_permitted(run.state, turn.actor, target_id)) {
        BattleEvent ev;
        ev.type = EventType::AttackBlocked;
        ev.round = run.round;
        ev.actor = turn.actor;
        ev.target = target_id;
        run.events.push_back(ev);
        run_phase(run, BattlePhase::PostAttack, ctx);
        return;
    }

    i32 armor = engine_ ? engine_->effective_armor(run.state, *target)
                        : target->stats.armor;
    i32 damage = std::max(1, attacker->stats.atk - armor);
    if (engine_) {
        f64 accuracy = engine_->accuracy_modifier(run.state, turn.actor);
        if (accuracy != 1.0)
            damage = std::max(1, mechanics::floor_to_int(damage * accuracy));
        damage = engine_->attack_damage(run.state, turn.actor, *target, damage);
    }

    BattleEvent hit;
    hit.type = EventType::Attack;
    hit.round = run.round;
    hit.actor = turn.actor;
    hit.target = target_id;
    hit.value = damage;
    run.events.push_back(hit);

    BattleUnit struck = target->damaged(damage);
    BattleEvent dmg = hit;
    dmg.type = EventType::Damage;
    run.events.push_back(dmg);
    if (!struck.alive) {
        BattleEvent death;
        death.type = EventType::Death;
        death.round = run.round;
        death.actor = target_id;
        run.events.push_back(death);
    }
    run.state = run.state.with_unit(struck);

    run_phase(run, BattlePhase::Attack, ctx);
    run_phase(run, BattlePhase::PostAttack, ctx);
}

bool same_outcome(const BattleOutcome& a, const BattleOutcome& b) {
    return a.winner == b.winner && a.rounds_played == b.rounds_played &&
           a.events == b.events;
}

} // namespace tac::sim
