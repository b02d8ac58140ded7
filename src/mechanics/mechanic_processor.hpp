#pragma once

#include "battle/battle_state.hpp"
#include "battle/phase.hpp"

#include <cmath>

namespace tac::mechanics {

/// A single tactical rule. Processors hold only their immutable config;
/// all battle data flows through the snapshots passed to them.
class MechanicProcessor {
public:
    virtual ~MechanicProcessor() = default;

    virtual const char* name() const = 0;

    /// Attach this mechanic's components to participating units.
    virtual battle::BattleState initialize(const battle::BattleState& state) const {
        return state;
    }

    /// React to one phase event. Returns the input unchanged when the
    /// phase is irrelevant to this mechanic.
    virtual battle::BattleState apply(battle::BattlePhase phase,
                                      const battle::BattleState& state,
                                      const battle::PhaseContext& ctx) const = 0;
};

/// Floor with a small tolerance so products such as 20 * 1.6 do not land
/// one below the intended integer.
inline i32 floor_to_int(f64 value) {
    return static_cast<i32>(std::floor(value + 1e-9));
}

} // namespace tac::mechanics
