#pragma once

#include "battle/battle_state.hpp"
#include "mechanics/config.hpp"
#include "mechanics/mechanic_processor.hpp"

#include <vector>

namespace tac::mechanics {

const char* formation_state_name(battle::FormationState s);

struct FormationDetection {
    bool can_form_phalanx = false;
    std::vector<battle::UnitId> adjacent_allies; // aligned allies only
    i32 aligned_count = 0;
    i32 total_adjacent = 0; // alive same-team neighbours, any facing
};

struct PhalanxBonuses {
    i32 armor_bonus = 0;
    i32 resolve_bonus = 0;
    i32 raw_armor_bonus = 0;
    i32 raw_resolve_bonus = 0;
    bool capped_armor = false;
    bool capped_resolve = false;
    battle::FormationState formation_state = battle::FormationState::None;
};

enum class RecalcTrigger : u8 { TurnStart, UnitDeath, PostAttack };

struct RecalcResult {
    battle::BattleState state;
    i32 formations_changed = 0;
    i32 total_armor_bonus_change = 0;
    i32 total_resolve_bonus_change = 0;
};

/// Shield-wall formation bonuses from orthogonally adjacent allies facing
/// the same way.
class PhalanxProcessor : public MechanicProcessor {
public:
    explicit PhalanxProcessor(PhalanxConfig config);

    const char* name() const override { return "phalanx"; }
    battle::BattleState initialize(const battle::BattleState& state) const override;
    battle::BattleState apply(battle::BattlePhase phase,
                              const battle::BattleState& state,
                              const battle::PhaseContext& ctx) const override;

    bool can_join_phalanx(const battle::BattleUnit& unit) const;

    FormationDetection detect_formation(const battle::BattleUnit& unit,
                                        const battle::BattleState& state) const;

    PhalanxBonuses calculate_bonuses(i32 aligned_count) const;

    i32 get_effective_armor(const battle::BattleUnit& unit,
                            const battle::BattleState& state) const;
    i32 get_effective_resolve(const battle::BattleUnit& unit,
                              const battle::BattleState& state) const;

    bool is_in_phalanx(const battle::UnitId& unit,
                       const battle::BattleState& state) const;
    battle::FormationState get_formation_state(const battle::UnitId& unit,
                                               const battle::BattleState& state) const;

    /// Zero the unit's bonuses and formation state.
    battle::BattleState clear_phalanx(const battle::UnitId& unit,
                                      const battle::BattleState& state) const;

    /// TurnStart rescans every unit. UnitDeath and PostAttack only rescan
    /// the neighbourhoods of `dead` (all dead units if empty).
    RecalcResult recalculate(const battle::BattleState& state,
                             RecalcTrigger trigger,
                             const std::vector<battle::UnitId>& dead = {}) const;

    const PhalanxConfig& config() const { return config_; }

private:
    /// Recompute one unit and fold the change into `result`.
    void refresh_unit(const battle::BattleUnit& unit, RecalcResult& result) const;

    PhalanxConfig config_;
};

} // namespace tac::mechanics
