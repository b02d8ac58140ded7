#pragma once

#include "battle/battle_state.hpp"
#include "mechanics/ammunition.hpp"
#include "mechanics/config.hpp"
#include "mechanics/intercept.hpp"
#include "mechanics/mechanic_processor.hpp"
#include "mechanics/reason.hpp"

#include <optional>
#include <vector>

namespace tac::mechanics {

/// Ability id that puts a unit into vigilance at the end of its turn.
constexpr const char* OVERWATCH_ABILITY_ID = "overwatch";

struct VigilanceResult {
    bool success = false;
    std::optional<Reason> reason;
    battle::BattleState state;
};

struct OverwatchOpportunity {
    battle::UnitId watcher_id;
    battle::UnitId target_id;
    battle::Position trigger_position;
    size_t path_index = 0;
    i32 distance = 0;
    bool can_fire = false;
    std::optional<Reason> reason;
};

struct OverwatchCheck {
    bool has_overwatch = false;
    std::vector<OverwatchOpportunity> opportunities;
};

struct OverwatchShot {
    bool success = false;
    std::optional<Reason> reason;
    i32 damage = 0;
    i32 ammo_consumed = 0;
    i32 watcher_ammo_remaining = 0;
    i32 watcher_shots_remaining = 0;
    i32 target_new_hp = 0;
    bool target_killed = false;
    battle::BattleState state;
};

/// Reaction fire: vigilant ranged units shoot enemies that move into
/// their watch range.
class OverwatchProcessor : public MechanicProcessor {
public:
    /// Without an ammo ledger shots are never gated by ammunition; without
    /// an intercept query paths are never cut short.
    OverwatchProcessor(OverwatchConfig config, const AmmoLedger* ammo = nullptr,
                       const InterceptQuery* intercept = nullptr);

    const char* name() const override { return "overwatch"; }
    battle::BattleState initialize(const battle::BattleState& state) const override;
    battle::BattleState apply(battle::BattlePhase phase,
                              const battle::BattleState& state,
                              const battle::PhaseContext& ctx) const override;

    bool is_vigilant(const battle::UnitId& unit,
                     const battle::BattleState& state) const;

    /// Why enter_vigilance would fail, or nullopt if it would succeed.
    std::optional<Reason> can_enter_vigilance(const battle::UnitId& unit,
                                              const battle::BattleState& state) const;

    VigilanceResult enter_vigilance(const battle::UnitId& unit,
                                    const battle::BattleState& state) const;
    VigilanceResult exit_vigilance(const battle::UnitId& unit,
                                   const battle::BattleState& state) const;

    /// Opportunities triggered by `mover` walking `path`. Ammunition and
    /// shot budgets are simulated along the path without changing state.
    OverwatchCheck check_overwatch(const battle::BattleUnit& mover,
                                   const std::vector<battle::Position>& path,
                                   const battle::BattleState& state) const;

    OverwatchShot execute_overwatch_shot(const battle::UnitId& watcher,
                                         const battle::UnitId& target,
                                         const battle::BattleState& state,
                                         u64 seed = 0) const;

    i32 calculate_overwatch_damage(const battle::BattleUnit& watcher) const;

    /// Back to inactive with a full shot budget.
    battle::BattleState reset_vigilance(const battle::UnitId& unit,
                                        const battle::BattleState& state) const;

    const OverwatchConfig& config() const { return config_; }

private:
    i32 watch_range(const battle::BattleUnit& unit) const;
    battle::OverwatchComponent component_for(const battle::BattleUnit& unit,
                                             const battle::BattleState& state) const;
    battle::BattleState on_movement(const battle::BattleUnit& mover,
                                    const std::vector<battle::Position>& path,
                                    const battle::BattleState& state,
                                    u64 seed) const;

    OverwatchConfig config_;
    const AmmoLedger* ammo_;
    const InterceptQuery* intercept_;
};

} // namespace tac::mechanics
