#pragma once

#include "battle/capability.hpp"
#include "battle/position.hpp"
#include "core/types.hpp"

#include <string>

namespace tac::battle {

using UnitId = std::string;

/// Template stats supplied by unit data. Never modified during battle.
struct UnitStats {
    i32 hp = 1;
    i32 atk = 0;
    i32 atk_count = 1;
    i32 armor = 0;
    i32 speed = 0;
    i32 initiative = 0;
    i32 dodge = 0;

    bool operator==(const UnitStats& o) const {
        return hp == o.hp && atk == o.atk && atk_count == o.atk_count &&
               armor == o.armor && speed == o.speed &&
               initiative == o.initiative && dodge == o.dodge;
    }
    bool operator!=(const UnitStats& o) const { return !(*this == o); }
};

/// Core unit record. Per-mechanic data lives in BattleState component
/// tables, keyed by id.
struct BattleUnit {
    UnitId id;
    i32 team = 0;
    Position position;
    Facing facing = Facing::North;
    UnitStats stats;
    i32 current_hp = 1;
    bool alive = true;
    i32 range = 1;
    CapabilitySet capabilities;
    i32 resolve = 100;

    bool has(Capability c) const { return capabilities.has(c); }
    bool is_enemy_of(const BattleUnit& other) const { return team != other.team; }

    /// Copy with hp reduced by `amount`, clamped at 0. A unit reaching 0 dies.
    BattleUnit damaged(i32 amount) const {
        BattleUnit u = *this;
        u.current_hp = current_hp - amount;
        if (u.current_hp <= 0) {
            u.current_hp = 0;
            u.alive = false;
        }
        return u;
    }

    bool operator==(const BattleUnit& o) const {
        return id == o.id && team == o.team && position == o.position &&
               facing == o.facing && stats == o.stats &&
               current_hp == o.current_hp && alive == o.alive &&
               range == o.range && capabilities == o.capabilities &&
               resolve == o.resolve;
    }
    bool operator!=(const BattleUnit& o) const { return !(*this == o); }
};

} // namespace tac::battle
