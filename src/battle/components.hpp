#pragma once

#include "battle/position.hpp"
#include "core/types.hpp"

#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>

namespace tac::battle {

// Per-mechanic side records. A unit only has a record in a mechanic's
// table if it participates in that mechanic. Each record is written only by
// its owning processor.

struct ChargeComponent {
    f64 momentum = 0.0;
    bool is_charging = false;
    i32 charge_distance = 0;
    std::optional<Position> charge_start;
    bool charge_countered = false;
    bool can_charge = false;
    bool has_spear_wall = false;

    bool operator==(const ChargeComponent& o) const {
        return std::tie(momentum, is_charging, charge_distance, charge_start,
                        charge_countered, can_charge, has_spear_wall) ==
               std::tie(o.momentum, o.is_charging, o.charge_distance,
                        o.charge_start, o.charge_countered, o.can_charge,
                        o.has_spear_wall);
    }
};

struct InterceptComponent {
    i32 intercepts_remaining = 0;
    i32 max_intercepts = 0;
    bool can_hard_intercept = false;
    bool has_zone_of_control = false;
    bool is_intercepting = false;
    /// Mover side: pinned by a soft intercept until it disengages.
    bool engaged = false;
    /// Mover side: where the last movement ended early, if it did.
    std::optional<Position> halted_at;
    /// Mover side: the halt was a hard intercept.
    bool hard_intercepted = false;

    bool operator==(const InterceptComponent& o) const {
        return std::tie(intercepts_remaining, max_intercepts,
                        can_hard_intercept, has_zone_of_control,
                        is_intercepting, engaged, halted_at,
                        hard_intercepted) ==
               std::tie(o.intercepts_remaining, o.max_intercepts,
                        o.can_hard_intercept, o.has_zone_of_control,
                        o.is_intercepting, o.engaged, o.halted_at,
                        o.hard_intercepted);
    }
};

enum class FormationState : u8 { None, Partial, Full };

struct PhalanxComponent {
    bool in_phalanx = false;
    i32 adjacent_allies_count = 0;
    i32 armor_bonus = 0;
    i32 resolve_bonus = 0;
    FormationState state = FormationState::None;

    bool operator==(const PhalanxComponent& o) const {
        return std::tie(in_phalanx, adjacent_allies_count, armor_bonus,
                        resolve_bonus, state) ==
               std::tie(o.in_phalanx, o.adjacent_allies_count, o.armor_bonus,
                        o.resolve_bonus, o.state);
    }
};

enum class FireMode : u8 { Direct, Arc, Blocked };

struct LosComponent {
    bool blocks_los = true;
    i32 firing_arc = 90; // degrees, centred on facing
    bool can_arc_fire = false;
    /// Mode chosen for the attack currently being resolved.
    std::optional<FireMode> fire_mode;

    bool operator==(const LosComponent& o) const {
        return std::tie(blocks_los, firing_arc, can_arc_fire, fire_mode) ==
               std::tie(o.blocks_los, o.firing_arc, o.can_arc_fire,
                        o.fire_mode);
    }
};

enum class Vigilance : u8 { Inactive, Active };

struct OverwatchComponent {
    Vigilance vigilance = Vigilance::Inactive;
    i32 shots_remaining = 0;
    i32 max_shots = 0;
    i32 range = 0;
    /// Movers already fired on in the current reaction window.
    std::set<std::string> engaged_targets;
    bool entered_this_turn = false;

    bool operator==(const OverwatchComponent& o) const {
        return std::tie(vigilance, shots_remaining, max_shots, range,
                        engaged_targets, entered_this_turn) ==
               std::tie(o.vigilance, o.shots_remaining, o.max_shots, o.range,
                        o.engaged_targets, o.entered_this_turn);
    }
};

enum class ResourceType : u8 { None, Ammo, Cooldown };

/// Reported ammo for units that never run out. Never decremented.
constexpr i32 UNLIMITED_AMMO = std::numeric_limits<i32>::max();

struct AmmoComponent {
    ResourceType resource_type = ResourceType::None;
    i32 ammo = 0;
    i32 max_ammo = 0;
    bool is_reloading = false;
    i32 reload_turns_remaining = 0;
    std::map<std::string, i32> cooldowns; // ability id -> turns remaining
    bool has_unlimited_ammo = false;
    bool has_quick_cooldown = false;

    bool operator==(const AmmoComponent& o) const {
        return std::tie(resource_type, ammo, max_ammo, is_reloading,
                        reload_turns_remaining, cooldowns, has_unlimited_ammo,
                        has_quick_cooldown) ==
               std::tie(o.resource_type, o.ammo, o.max_ammo, o.is_reloading,
                        o.reload_turns_remaining, o.cooldowns,
                        o.has_unlimited_ammo, o.has_quick_cooldown);
    }
};

} // namespace tac::battle
