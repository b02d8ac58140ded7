#include "battle/phase.hpp"

namespace tac::battle {

const char* phase_name(BattlePhase phase) {
    switch (phase) {
    case BattlePhase::TurnStart:  return "turn_start";
    case BattlePhase::Movement:   return "movement";
    case BattlePhase::PreAttack:  return "pre_attack";
    case BattlePhase::Attack:     return "attack";
    case BattlePhase::PostAttack: return "post_attack";
    case BattlePhase::TurnEnd:    return "turn_end";
    }
    return "unknown";
}

const char* action_type_name(ActionType type) {
    switch (type) {
    case ActionType::Move:    return "move";
    case ActionType::Attack:  return "attack";
    case ActionType::Ability: return "ability";
    }
    return "unknown";
}

} // namespace tac::battle
