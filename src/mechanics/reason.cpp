#include "mechanics/reason.hpp"

namespace tac::mechanics {

const char* reason_name(Reason reason) {
    switch (reason) {
    case Reason::NoAmmo:               return "no_ammo";
    case Reason::Reloading:            return "reloading";
    case Reason::AlreadyFull:          return "already_full";
    case Reason::AlreadyReloading:     return "already_reloading";
    case Reason::NotRanged:            return "not_ranged";
    case Reason::Countered:            return "countered";
    case Reason::InsufficientDistance: return "insufficient_distance";
    case Reason::NoChargeAbility:      return "no_charge_ability";
    case Reason::BlockedByUnit:        return "blocked_by_unit";
    case Reason::NoCooldownResource:   return "no_cooldown_resource";
    case Reason::OnCooldown:           return "on_cooldown";
    case Reason::NotInVigilance:       return "not_in_vigilance";
    case Reason::AlreadyVigilant:      return "already_vigilant";
    case Reason::NoShotsRemaining:     return "no_shots_remaining";
    case Reason::InsufficientMovement: return "insufficient_movement";
    case Reason::OutOfArc:             return "out_of_arc";
    case Reason::OutOfRange:           return "out_of_range";
    case Reason::UnitDead:             return "unit_dead";
    case Reason::UnitNotFound:         return "unit_not_found";
    }
    return "unknown";
}

} // namespace tac::mechanics
