#include "mechanics/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tac::mechanics {

const char* mechanic_name(MechanicId id) {
    switch (id) {
    case MechanicId::Ammunition:  return "ammunition";
    case MechanicId::Intercept:   return "intercept";
    case MechanicId::Charge:      return "charge";
    case MechanicId::Phalanx:     return "phalanx";
    case MechanicId::LineOfSight: return "line_of_sight";
    case MechanicId::Overwatch:   return "overwatch";
    }
    return "unknown";
}

std::optional<MechanicId> mechanic_from_name(std::string_view name) {
    for (auto id : ALL_MECHANICS) {
        if (name == mechanic_name(id)) return id;
    }
    return std::nullopt;
}

bool MechanicsConfig::is_enabled(MechanicId id) const {
    switch (id) {
    case MechanicId::Ammunition:  return ammunition.enabled;
    case MechanicId::Intercept:   return intercept.enabled;
    case MechanicId::Charge:      return charge.enabled;
    case MechanicId::Phalanx:     return phalanx.enabled;
    case MechanicId::LineOfSight: return line_of_sight.enabled;
    case MechanicId::Overwatch:   return overwatch.enabled;
    }
    return false;
}

void MechanicsConfig::set_enabled(MechanicId id, bool enabled) {
    switch (id) {
    case MechanicId::Ammunition:  ammunition.enabled = enabled; break;
    case MechanicId::Intercept:   intercept.enabled = enabled; break;
    case MechanicId::Charge:      charge.enabled = enabled; break;
    case MechanicId::Phalanx:     phalanx.enabled = enabled; break;
    case MechanicId::LineOfSight: line_of_sight.enabled = enabled; break;
    case MechanicId::Overwatch:   overwatch.enabled = enabled; break;
    }
}

void MechanicsConfig::reset_to_defaults(MechanicId id, bool enabled) {
    switch (id) {
    case MechanicId::Ammunition:  ammunition = AmmunitionConfig{}; break;
    case MechanicId::Intercept:   intercept = InterceptConfig{}; break;
    case MechanicId::Charge:      charge = ChargeConfig{}; break;
    case MechanicId::Phalanx:     phalanx = PhalanxConfig{}; break;
    case MechanicId::LineOfSight: line_of_sight = LineOfSightConfig{}; break;
    case MechanicId::Overwatch:   overwatch = OverwatchConfig{}; break;
    }
    set_enabled(id, enabled);
}

std::vector<MechanicId> MechanicsConfig::enabled_mechanics() const {
    std::vector<MechanicId> out;
    for (auto id : ALL_MECHANICS) {
        if (is_enabled(id)) out.push_back(id);
    }
    return out;
}

std::vector<MechanicId> dependencies_of(MechanicId id) {
    switch (id) {
    case MechanicId::Charge:
        return {MechanicId::Intercept};
    case MechanicId::Overwatch:
        return {MechanicId::Intercept, MechanicId::Ammunition};
    default:
        return {};
    }
}

MechanicsConfig resolve_dependencies(const MechanicsConfig& config) {
    MechanicsConfig out = config;
    // Dependencies always sit earlier in composition order, so walking the
    // order backwards reaches every transitive dependency.
    for (auto it = ALL_MECHANICS.rbegin(); it != ALL_MECHANICS.rend(); ++it) {
        if (!out.is_enabled(*it)) continue;
        for (auto dep : dependencies_of(*it)) {
            if (!out.is_enabled(dep)) {
                spdlog::info("Enabling '{}' (required by '{}')",
                             mechanic_name(dep), mechanic_name(*it));
                out.reset_to_defaults(dep, true);
            }
        }
    }
    return out;
}

namespace {

void require_non_negative(std::vector<ConfigError>& errors, MechanicId id,
                          const char* field, f64 value) {
    if (value < 0) {
        errors.push_back({id, field,
                          fmt::format("{}.{} must be non-negative, got {}",
                                      mechanic_name(id), field, value)});
    }
}

void require_positive(std::vector<ConfigError>& errors, MechanicId id,
                      const char* field, f64 value) {
    if (value <= 0) {
        errors.push_back({id, field,
                          fmt::format("{}.{} must be positive, got {}",
                                      mechanic_name(id), field, value)});
    }
}

} // namespace

std::vector<ConfigError> validate(const MechanicsConfig& config) {
    std::vector<ConfigError> errors;

    const auto& c = config.charge;
    require_non_negative(errors, MechanicId::Charge, "momentum_per_cell",
                         c.momentum_per_cell);
    require_non_negative(errors, MechanicId::Charge, "max_momentum",
                         c.max_momentum);
    require_non_negative(errors, MechanicId::Charge, "shock_resolve_damage",
                         c.shock_resolve_damage);
    require_non_negative(errors, MechanicId::Charge, "min_charge_distance",
                         c.min_charge_distance);
    require_non_negative(errors, MechanicId::Charge, "counter_multiplier",
                         c.counter_multiplier);

    const auto& i = config.intercept;
    require_non_negative(errors, MechanicId::Intercept,
                         "hard_intercept_multiplier",
                         i.hard_intercept_multiplier);
    require_non_negative(errors, MechanicId::Intercept, "max_intercepts",
                         i.max_intercepts);
    require_non_negative(errors, MechanicId::Intercept, "disengage_cost",
                         i.disengage_cost);

    const auto& p = config.phalanx;
    require_non_negative(errors, MechanicId::Phalanx, "armor_per_ally",
                         p.armor_per_ally);
    require_non_negative(errors, MechanicId::Phalanx, "resolve_per_ally",
                         p.resolve_per_ally);
    require_non_negative(errors, MechanicId::Phalanx, "max_armor_bonus",
                         p.max_armor_bonus);
    require_non_negative(errors, MechanicId::Phalanx, "max_resolve_bonus",
                         p.max_resolve_bonus);

    const auto& l = config.line_of_sight;
    if (l.arc_fire_penalty < 0 || l.arc_fire_penalty > 1) {
        errors.push_back({MechanicId::LineOfSight, "arc_fire_penalty",
                          fmt::format("line_of_sight.arc_fire_penalty must be "
                                      "between 0 and 1, got {}",
                                      l.arc_fire_penalty)});
    }
    if (l.default_firing_arc <= 0 || l.default_firing_arc > 360) {
        errors.push_back({MechanicId::LineOfSight, "default_firing_arc",
                          fmt::format("line_of_sight.default_firing_arc must "
                                      "be in (0, 360], got {}",
                                      l.default_firing_arc)});
    }

    const auto& o = config.overwatch;
    require_non_negative(errors, MechanicId::Overwatch, "max_shots",
                         o.max_shots);
    require_positive(errors, MechanicId::Overwatch, "default_range",
                     o.default_range);
    require_non_negative(errors, MechanicId::Overwatch, "damage_multiplier",
                         o.damage_multiplier);

    const auto& a = config.ammunition;
    require_non_negative(errors, MechanicId::Ammunition, "default_ammo",
                         a.default_ammo);
    require_non_negative(errors, MechanicId::Ammunition, "default_cooldown",
                         a.default_cooldown);
    require_non_negative(errors, MechanicId::Ammunition, "reload_amount",
                         a.reload_amount);
    require_non_negative(errors, MechanicId::Ammunition, "reload_duration",
                         a.reload_duration);
    require_positive(errors, MechanicId::Ammunition, "quick_cooldown_tick",
                     a.quick_cooldown_tick);

    for (auto id : ALL_MECHANICS) {
        if (!config.is_enabled(id)) continue;
        for (auto dep : dependencies_of(id)) {
            if (!config.is_enabled(dep)) {
                errors.push_back(
                    {id, "enabled",
                     fmt::format("Mechanic '{}' requires '{}' to be enabled, "
                                 "but it is disabled",
                                 mechanic_name(id), mechanic_name(dep))});
            }
        }
    }

    return errors;
}

MechanicsConfig mvp_preset() {
    return MechanicsConfig{};
}

MechanicsConfig tactical_preset() {
    MechanicsConfig config;
    config.intercept.enabled = true;
    return config;
}

MechanicsConfig roguelike_preset() {
    MechanicsConfig config;
    for (auto id : ALL_MECHANICS) {
        config.set_enabled(id, true);
    }
    return config;
}

Result<MechanicsConfig> preset_by_name(std::string_view name) {
    if (name == "mvp") return mvp_preset();
    if (name == "tactical") return tactical_preset();
    if (name == "roguelike") return roguelike_preset();
    return Error("Unknown preset: " + std::string(name));
}

} // namespace tac::mechanics
