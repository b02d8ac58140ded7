#pragma once

#include "battle/battle_state.hpp"
#include "mechanics/ammunition.hpp"
#include "mechanics/config.hpp"
#include "mechanics/mechanic_processor.hpp"
#include "mechanics/reason.hpp"

#include <optional>
#include <vector>

namespace tac::mechanics {

const char* fire_mode_name(battle::FireMode mode);

struct LosCheck {
    bool has_los = false;
    bool direct_los = false;
    bool arc_los = false;
    std::vector<battle::UnitId> obstacles; // in path order
    std::optional<Reason> block_reason;
    battle::FireMode recommended_mode = battle::FireMode::Blocked;
};

struct RangedAttackValidation {
    bool valid = false;
    std::optional<Reason> reason;
    LosCheck los;
    f64 accuracy_modifier = 0.0;
};

/// Unit-blocked line of sight with an arc-fire fallback.
class LineOfSightProcessor : public MechanicProcessor {
public:
    /// `ammo` is optional and only consulted by validate_ranged_attack.
    explicit LineOfSightProcessor(LineOfSightConfig config,
                                  const AmmoLedger* ammo = nullptr);

    const char* name() const override { return "line_of_sight"; }
    battle::BattleState initialize(const battle::BattleState& state) const override;
    battle::BattleState apply(battle::BattlePhase phase,
                              const battle::BattleState& state,
                              const battle::PhaseContext& ctx) const override;

    /// Grid cells from `from` to `to` inclusive (Bresenham).
    static std::vector<battle::Position> trace_line(battle::Position from,
                                                    battle::Position to);

    bool blocks_los(const battle::BattleUnit& unit,
                    const battle::BattleState& state) const;
    bool can_arc_fire(const battle::BattleUnit& unit,
                      const battle::BattleState& state) const;

    /// Units strictly between attacker and target that block the line.
    std::vector<const battle::BattleUnit*> get_blocking_units(
        const battle::BattleUnit& attacker, const battle::BattleUnit& target,
        const battle::BattleState& state) const;

    LosCheck check_los(const battle::BattleUnit& attacker,
                       const battle::BattleUnit& target,
                       const battle::BattleState& state) const;

    /// 1 for direct fire, 1 - arc_fire_penalty for arc fire, 0 if blocked.
    f64 accuracy_modifier(const LosCheck& los) const;

    bool is_in_firing_arc(const battle::BattleUnit& attacker,
                          const battle::BattleUnit& target,
                          const battle::BattleState& state) const;

    /// Alive enemies within range that can be hit directly or by arc fire.
    std::vector<battle::UnitId> find_valid_targets(const battle::BattleUnit& attacker,
                                                   const battle::BattleState& state) const;

    RangedAttackValidation validate_ranged_attack(const battle::UnitId& attacker,
                                                  const battle::UnitId& target,
                                                  const battle::BattleState& state) const;

    const LineOfSightConfig& config() const { return config_; }

private:
    LineOfSightConfig config_;
    const AmmoLedger* ammo_;
};

} // namespace tac::mechanics
