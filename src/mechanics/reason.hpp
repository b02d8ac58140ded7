#pragma once

#include "core/types.hpp"

namespace tac::mechanics {

/// Why a mechanic operation was refused. These are expected outcomes the
/// simulator branches on, not errors.
enum class Reason : u8 {
    NoAmmo,
    Reloading,
    AlreadyFull,
    AlreadyReloading,
    NotRanged,
    Countered,
    InsufficientDistance,
    NoChargeAbility,
    BlockedByUnit,
    NoCooldownResource,
    OnCooldown,
    NotInVigilance,
    AlreadyVigilant,
    NoShotsRemaining,
    InsufficientMovement,
    OutOfArc,
    OutOfRange,
    UnitDead,
    UnitNotFound,
};

/// Snake-case name ("no_ammo", "blocked_by_unit", ...).
const char* reason_name(Reason reason);

} // namespace tac::mechanics
