#pragma once

#include "battle/battle_state.hpp"
#include "battle/phase.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tac::mechanics {
class MechanicsEngine;
}

namespace tac::sim {

enum class EventType : u8 {
    Move,
    MoveHalted,
    Attack,
    AttackBlocked,
    Damage,
    Death,
    Ability,
    BattleEnd,
};

const char* event_type_name(EventType type);

/// One entry of the battle log handed to presentation.
struct BattleEvent {
    EventType type = EventType::Move;
    u32 round = 0;
    battle::UnitId actor;
    std::optional<battle::UnitId> target;
    i32 value = 0;
    std::optional<battle::Position> position;

    bool operator==(const BattleEvent& o) const {
        return type == o.type && round == o.round && actor == o.actor &&
               target == o.target && value == o.value && position == o.position;
    }
    bool operator!=(const BattleEvent& o) const { return !(*this == o); }

    std::string describe() const;
};

/// A unit's scripted action for one turn.
struct ScriptedTurn {
    battle::UnitId actor;
    std::vector<battle::Position> path; // starting cell first; empty = stay
    std::optional<battle::UnitId> attack_target;
    std::optional<std::string> ability_id;
};

struct Scenario {
    std::string name;
    u64 seed = 0;
    std::vector<battle::BattleUnit> units;
    std::vector<std::vector<ScriptedTurn>> rounds;
};

struct BattleOutcome {
    std::optional<i32> winner; // team, if exactly one is left standing
    u32 rounds_played = 0;
    std::vector<BattleEvent> events;
    battle::BattleState final_state;
};

/// Replays a scripted scenario, raising the phase sequence for every turn.
/// Base damage is max(1, atk - armor). Without an engine no mechanic
/// phases run at all.
class ScriptedBattle {
public:
    explicit ScriptedBattle(const mechanics::MechanicsEngine* engine = nullptr);

    BattleOutcome run(const Scenario& scenario) const;

private:
    struct Run;

    void run_turn(Run& run, const ScriptedTurn& turn) const;
    void run_phase(Run& run, battle::BattlePhase phase,
                   battle::PhaseContext ctx) const;
    void resolve_move(Run& run, const ScriptedTurn& turn) const;
    void resolve_attack(Run& run, const ScriptedTurn& turn) const;

    const mechanics::MechanicsEngine* engine_;
};

/// Winner, round count and every event (type, actor, target, round,
/// value, position) match.
bool same_outcome(const BattleOutcome& a, const BattleOutcome& b);

} // namespace tac::sim
