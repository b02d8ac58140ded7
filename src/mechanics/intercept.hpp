#pragma once

#include "battle/battle_state.hpp"
#include "mechanics/config.hpp"
#include "mechanics/mechanic_processor.hpp"
#include "mechanics/reason.hpp"

#include <optional>
#include <vector>

namespace tac::mechanics {

/// Read-only view of interception state for mechanics that react to it.
class InterceptQuery {
public:
    virtual ~InterceptQuery() = default;

    /// True if `unit` currently counters charges (alive spear wall).
    virtual bool is_spear_wall(const battle::BattleUnit& unit) const = 0;

    /// Where the mover's last movement was cut short, if it was.
    virtual std::optional<battle::Position> movement_halted_at(
        const battle::UnitId& mover, const battle::BattleState& state) const = 0;

    /// True if the mover's last movement was stopped by a spear wall.
    virtual bool was_hard_intercepted(const battle::UnitId& mover,
                                      const battle::BattleState& state) const = 0;
};

enum class InterceptType : u8 { Hard, Soft };

const char* intercept_type_name(InterceptType type);

struct InterceptOpportunity {
    battle::UnitId interceptor_id;
    InterceptType type = InterceptType::Hard;
    battle::Position position; // path cell adjacent to the interceptor
    size_t path_index = 0;
    bool can_intercept = false;
};

struct InterceptCheck {
    bool has_intercept = false;
    bool movement_blocked = false;
    std::optional<InterceptOpportunity> first_intercept;
    std::optional<battle::Position> blocked_at;
    std::vector<InterceptOpportunity> opportunities;
};

struct HardInterceptResult {
    bool success = false;
    bool movement_stopped = false;
    i32 damage = 0;
    i32 target_new_hp = 0;
    bool target_killed = false;
    i32 interceptor_intercepts_remaining = 0;
    std::optional<battle::Position> stopped_at;
    battle::BattleState state;
};

struct SoftInterceptResult {
    bool success = false;
    bool engaged = false;
    i32 interceptor_intercepts_remaining = 0;
    battle::BattleState state;
};

struct DisengageResult {
    bool success = false;
    i32 cost = 0;
    i32 remaining_movement = 0;
    bool triggered_attack_of_opportunity = false;
    std::optional<Reason> reason;
    battle::BattleState state;
};

/// Spear walls halting cavalry (hard intercept) and zone-of-control units
/// pinning movers (soft intercept).
class InterceptProcessor : public MechanicProcessor, public InterceptQuery {
public:
    explicit InterceptProcessor(InterceptConfig config);

    const char* name() const override { return "intercept"; }
    battle::BattleState initialize(const battle::BattleState& state) const override;
    battle::BattleState apply(battle::BattlePhase phase,
                              const battle::BattleState& state,
                              const battle::PhaseContext& ctx) const override;

    bool is_spear_wall(const battle::BattleUnit& unit) const override;
    std::optional<battle::Position> movement_halted_at(
        const battle::UnitId& mover,
        const battle::BattleState& state) const override;
    bool was_hard_intercepted(const battle::UnitId& mover,
                              const battle::BattleState& state) const override;

    bool can_hard_intercept(const battle::BattleUnit& interceptor,
                            const battle::BattleUnit& mover,
                            const battle::BattleState& state) const;
    bool can_soft_intercept(const battle::BattleUnit& interceptor,
                            const battle::BattleUnit& mover,
                            const battle::BattleState& state) const;

    /// Scan `path` (starting cell first) for interceptors adjacent to the
    /// cells the mover enters. Scanning stops at the first hard intercept.
    InterceptCheck check_intercept(const battle::BattleUnit& mover,
                                   const std::vector<battle::Position>& path,
                                   const battle::BattleState& state) const;

    /// Counter damage to the mover and halt at `stop_at`.
    HardInterceptResult execute_hard_intercept(
        const battle::UnitId& interceptor, const battle::UnitId& mover,
        const battle::BattleState& state,
        std::optional<battle::Position> stop_at = std::nullopt,
        u64 seed = 0) const;

    SoftInterceptResult execute_soft_intercept(const battle::UnitId& interceptor,
                                               const battle::UnitId& mover,
                                               const battle::BattleState& state) const;

    i32 calculate_intercept_damage(const battle::BattleUnit& interceptor) const;

    /// Movement points an engaged unit must spend before moving freely.
    i32 get_disengage_cost(const battle::UnitId& unit,
                           const battle::BattleState& state) const;
    DisengageResult attempt_disengage(const battle::UnitId& unit,
                                      const battle::BattleState& state) const;

    battle::BattleState reset_intercept_charges(const battle::UnitId& unit,
                                                const battle::BattleState& state) const;

    const InterceptConfig& config() const { return config_; }

private:
    battle::BattleState on_turn_start(const battle::BattleUnit& unit,
                                      const battle::BattleState& state) const;
    battle::BattleState on_movement(const battle::BattleUnit& mover,
                                    const std::vector<battle::Position>& path,
                                    const battle::BattleState& state,
                                    u64 seed) const;
    battle::InterceptComponent component_or_default(
        const battle::UnitId& unit, const battle::BattleState& state) const;

    InterceptConfig config_;
};

} // namespace tac::mechanics
