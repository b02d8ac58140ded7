#pragma once

#include "battle/battle_unit.hpp"
#include "battle/position.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tac::battle {

/// Fixed per-turn phase sequence driven by the simulator.
enum class BattlePhase : u8 {
    TurnStart,
    Movement,
    PreAttack,
    Attack,
    PostAttack,
    TurnEnd,
};

const char* phase_name(BattlePhase phase);

enum class ActionType : u8 { Move, Attack, Ability };

const char* action_type_name(ActionType type);

struct BattleAction {
    ActionType type = ActionType::Move;
    std::vector<Position> path; // includes the starting cell
    std::optional<UnitId> target_id;
    std::optional<std::string> ability_id;
};

/// One phase event.
struct PhaseContext {
    UnitId active_unit_id;
    std::optional<UnitId> target_id;
    std::optional<BattleAction> action;
    u64 seed = 0;

    /// Movement path of a Move action, or nullptr.
    const std::vector<Position>* move_path() const {
        if (action && action->type == ActionType::Move && !action->path.empty())
            return &action->path;
        return nullptr;
    }

    /// Ability id of an Ability action, or nullptr.
    const std::string* ability_id() const {
        if (action && action->type == ActionType::Ability && action->ability_id)
            return &*action->ability_id;
        return nullptr;
    }
};

} // namespace tac::battle
