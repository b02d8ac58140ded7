#pragma once

#include "battle/battle_state.hpp"
#include "mechanics/config.hpp"
#include "mechanics/intercept.hpp"
#include "mechanics/mechanic_processor.hpp"
#include "mechanics/reason.hpp"

#include <optional>
#include <vector>

namespace tac::mechanics {

struct ChargeEligibility {
    bool can_charge = false;
    std::optional<Reason> reason;
};

struct CounterResult {
    battle::UnitId spearman_id;
    i32 damage = 0;
    i32 charger_new_hp = 0;
    bool charger_killed = false;
};

struct ChargeExecution {
    bool success = false;
    i32 damage = 0;
    i32 resolve_damage = 0;
    f64 momentum_used = 0.0;
    std::optional<CounterResult> counter;
    std::optional<Reason> reason;
    battle::BattleState state;
};

/// Cavalry momentum. Distance moved during a turn scales the next attack
/// and adds shock damage to resolve; spear walls counter it.
class ChargeProcessor : public MechanicProcessor {
public:
    /// `intercept` may be null, in which case movement is never halted and
    /// spear walls are recognised by capability alone.
    explicit ChargeProcessor(ChargeConfig config,
                             const InterceptQuery* intercept = nullptr);

    const char* name() const override { return "charge"; }
    battle::BattleState initialize(const battle::BattleState& state) const override;
    battle::BattleState apply(battle::BattlePhase phase,
                              const battle::BattleState& state,
                              const battle::PhaseContext& ctx) const override;

    /// 0 below the minimum distance, else min(max, distance * per_cell).
    f64 calculate_momentum(i32 distance) const;

    /// floor(base * (1 + momentum)).
    static i32 apply_charge_bonus(i32 base_damage, f64 momentum);

    bool is_countered_by_spear_wall(const battle::BattleUnit& target) const;
    i32 calculate_counter_damage(const battle::BattleUnit& spearman) const;

    ChargeEligibility can_charge(const battle::BattleUnit& unit,
                                 const battle::BattleState& state) const;

    /// Damage a charger's attack deals once `base_damage` (after armor and
    /// accuracy) has been resolved. Unchanged unless the charger carries
    /// uncountered momentum into a living target.
    i32 charge_damage(const battle::UnitId& charger,
                      const battle::BattleUnit& target, i32 base_damage,
                      const battle::BattleState& state) const;

    /// Resolve a charge attack directly: counter if the target is a spear
    /// wall, otherwise floor(base_damage * (1 + momentum)) plus shock.
    ChargeExecution execute_charge(const battle::UnitId& charger,
                                   const battle::UnitId& target,
                                   i32 base_damage,
                                   const battle::BattleState& state,
                                   u64 seed = 0) const;

    /// Record a movement path (starting cell included).
    battle::BattleState track_movement(const battle::UnitId& unit,
                                       const std::vector<battle::Position>& path,
                                       const battle::BattleState& state) const;

    battle::BattleState reset_charge(const battle::UnitId& unit,
                                     const battle::BattleState& state) const;

    f64 get_momentum(const battle::UnitId& unit,
                     const battle::BattleState& state) const;
    bool is_charging(const battle::UnitId& unit,
                     const battle::BattleState& state) const;

    const ChargeConfig& config() const { return config_; }

private:
    battle::BattleState apply_counter(const battle::BattleUnit& charger,
                                      const battle::BattleUnit& spearman,
                                      const battle::BattleState& state,
                                      CounterResult& out) const;
    battle::BattleState on_turn_start(const battle::BattleUnit& unit,
                                      const battle::BattleState& state) const;
    battle::BattleState on_movement(const battle::BattleUnit& unit,
                                    const std::vector<battle::Position>& path,
                                    const battle::BattleState& state) const;
    battle::BattleState on_attack(const battle::BattleUnit& charger,
                                  const battle::BattleUnit& target,
                                  const battle::BattleState& state) const;

    ChargeConfig config_;
    const InterceptQuery* intercept_;
};

} // namespace tac::mechanics
