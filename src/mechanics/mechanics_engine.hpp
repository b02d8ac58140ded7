#pragma once

#include "battle/battle_state.hpp"
#include "battle/phase.hpp"
#include "core/result.hpp"
#include "mechanics/config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tac::mechanics {

class MechanicProcessor;
class AmmunitionProcessor;
class InterceptProcessor;
class ChargeProcessor;
class PhalanxProcessor;
class LineOfSightProcessor;
class OverwatchProcessor;

/// Owns the enabled processors, wires their cross-mechanic queries and
/// threads each phase event through them in a fixed order:
/// ammunition, intercept, charge, phalanx, line_of_sight, overwatch.
class MechanicsEngine {
public:
    /// Resolve dependencies, validate, then build. Fails with every
    /// validation message joined.
    static Result<MechanicsEngine> create(const MechanicsConfig& config);

    /// Build from a config assumed valid.
    explicit MechanicsEngine(const MechanicsConfig& config);
    ~MechanicsEngine();

    MechanicsEngine(const MechanicsEngine&) = delete;
    MechanicsEngine& operator=(const MechanicsEngine&) = delete;
    MechanicsEngine(MechanicsEngine&&) noexcept;
    MechanicsEngine& operator=(MechanicsEngine&&) noexcept;

    const MechanicsConfig& config() const { return config_; }
    bool is_enabled(MechanicId id) const { return config_.is_enabled(id); }
    size_t processor_count() const { return pipeline_.size(); }
    std::vector<std::string> processor_names() const;

    /// Attach mechanic components for every participating unit.
    battle::BattleState initialize_battle(const battle::BattleState& state) const;

    /// Run one phase event through every enabled processor.
    battle::BattleState apply(battle::BattlePhase phase,
                              const battle::BattleState& state,
                              const battle::PhaseContext& ctx) const;

    /// Whether the simulator may resolve `attacker`'s attack on `target`.
    /// Consults ammunition and line of sight when enabled.
    bool attack_permitted(const battle::BattleState& state,
                          const battle::UnitId& attacker,
                          const battle::UnitId& target) const;

    /// Damage multiplier from the fire mode chosen during pre_attack.
    f64 accuracy_modifier(const battle::BattleState& state,
                          const battle::UnitId& attacker) const;

    /// Final damage of `attacker`'s hit on `target` once the simulator has
    /// resolved `base_damage`. Charge momentum scales it when enabled.
    i32 attack_damage(const battle::BattleState& state,
                      const battle::UnitId& attacker,
                      const battle::BattleUnit& target, i32 base_damage) const;

    /// Base armor plus any formation bonus.
    i32 effective_armor(const battle::BattleState& state,
                        const battle::BattleUnit& unit) const;

    // Direct access for callers that need named operations.
    // Null when the mechanic is disabled.
    const AmmunitionProcessor* ammunition() const { return ammunition_.get(); }
    const InterceptProcessor* intercept() const { return intercept_.get(); }
    const ChargeProcessor* charge() const { return charge_.get(); }
    const PhalanxProcessor* phalanx() const { return phalanx_.get(); }
    const LineOfSightProcessor* line_of_sight() const { return line_of_sight_.get(); }
    const OverwatchProcessor* overwatch() const { return overwatch_.get(); }

private:
    MechanicsConfig config_;
    std::unique_ptr<AmmunitionProcessor> ammunition_;
    std::unique_ptr<InterceptProcessor> intercept_;
    std::unique_ptr<ChargeProcessor> charge_;
    std::unique_ptr<PhalanxProcessor> phalanx_;
    std::unique_ptr<LineOfSightProcessor> line_of_sight_;
    std::unique_ptr<OverwatchProcessor> overwatch_;
    std::vector<const MechanicProcessor*> pipeline_;
};

} // namespace tac::mechanics
