#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tac::mechanics {

/// Mechanics in composition order.
enum class MechanicId : u8 {
    Ammunition,
    Intercept,
    Charge,
    Phalanx,
    LineOfSight,
    Overwatch,
};

constexpr std::array<MechanicId, 6> ALL_MECHANICS = {
    MechanicId::Ammunition, MechanicId::Intercept, MechanicId::Charge,
    MechanicId::Phalanx, MechanicId::LineOfSight, MechanicId::Overwatch,
};

/// Config-file key, e.g. "line_of_sight".
const char* mechanic_name(MechanicId id);
std::optional<MechanicId> mechanic_from_name(std::string_view name);

struct ChargeConfig {
    bool enabled = false;
    f64 momentum_per_cell = 0.2;
    f64 max_momentum = 1.0;
    i32 shock_resolve_damage = 10;
    i32 min_charge_distance = 3;
    f64 counter_multiplier = 1.5;
};

struct InterceptConfig {
    bool enabled = false;
    f64 hard_intercept_multiplier = 1.5;
    i32 max_intercepts = 1;
    i32 disengage_cost = 2;
    bool soft_intercept = true;
};

struct PhalanxConfig {
    bool enabled = false;
    i32 armor_per_ally = 1;
    i32 resolve_per_ally = 5;
    i32 max_armor_bonus = 5;
    i32 max_resolve_bonus = 25;
    bool require_same_facing = true;
};

struct LineOfSightConfig {
    bool enabled = false;
    f64 arc_fire_penalty = 0.2;
    i32 default_firing_arc = 90;
    bool enforce_firing_arc = false;
};

struct OverwatchConfig {
    bool enabled = false;
    i32 max_shots = 2;
    i32 default_range = 3;
    f64 damage_multiplier = 0.75;
};

struct AmmunitionConfig {
    bool enabled = false;
    i32 default_ammo = 6;
    i32 default_cooldown = 3;
    i32 reload_amount = 0;    // 0 = refill to max
    i32 reload_duration = 0;  // turns; 0 = instant
    bool mage_cooldowns = true;
    i32 quick_cooldown_tick = 2;
};

/// Complete mechanics configuration. Default-constructed, every mechanic
/// is disabled.
struct MechanicsConfig {
    AmmunitionConfig ammunition;
    InterceptConfig intercept;
    ChargeConfig charge;
    PhalanxConfig phalanx;
    LineOfSightConfig line_of_sight;
    OverwatchConfig overwatch;

    bool is_enabled(MechanicId id) const;
    void set_enabled(MechanicId id, bool enabled);
    /// Reset one mechanic to its default tunables, keeping `enabled`.
    void reset_to_defaults(MechanicId id, bool enabled);

    std::vector<MechanicId> enabled_mechanics() const;
};

/// Mechanics that must be enabled for `id` to work.
std::vector<MechanicId> dependencies_of(MechanicId id);

/// Enable every missing dependency (transitively) with default tunables.
MechanicsConfig resolve_dependencies(const MechanicsConfig& config);

struct ConfigError {
    MechanicId mechanic;
    std::string field;
    std::string message;
};

/// Check tunable ranges and dependency consistency. Empty means valid.
std::vector<ConfigError> validate(const MechanicsConfig& config);

/// Every mechanic disabled. Equivalent to running without an engine.
MechanicsConfig mvp_preset();
/// Interception only.
MechanicsConfig tactical_preset();
/// Every mechanic enabled with defaults.
MechanicsConfig roguelike_preset();

/// "mvp", "tactical" or "roguelike".
Result<MechanicsConfig> preset_by_name(std::string_view name);

} // namespace tac::mechanics
