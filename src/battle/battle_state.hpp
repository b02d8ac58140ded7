#pragma once

#include "battle/battle_unit.hpp"
#include "battle/component_table.hpp"
#include "battle/components.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <tuple>
#include <vector>

namespace tac::battle {

/// Immutable battle snapshot: the unit roster plus one component table per
/// mechanic. Every modifier returns a new snapshot; unchanged unit records
/// and component records are shared with the source.
class BattleState {
public:
    BattleState() = default;
    explicit BattleState(const std::vector<BattleUnit>& units, u32 round = 1);

    u32 round() const { return round_; }
    BattleState with_round(u32 round) const;

    size_t unit_count() const { return units_.size(); }
    const std::vector<std::shared_ptr<const BattleUnit>>& units() const {
        return units_;
    }

    /// Look up a unit by id. Returns nullptr if not found.
    const BattleUnit* find(const UnitId& id) const;

    /// Roster index of a unit.
    std::optional<size_t> find_index(const UnitId& id) const;

    /// The alive unit standing on `pos`, or nullptr.
    const BattleUnit* unit_at(Position pos) const;

    /// Alive units within Manhattan `range` of `center`, in roster order.
    std::vector<const BattleUnit*> units_within(Position center,
                                                i32 range) const;

    /// Replace the unit with the same id. Unknown ids leave the state as is.
    BattleState with_unit(const BattleUnit& unit) const;
    BattleState with_units(const std::vector<BattleUnit>& units) const;

    /// Iterate all units (dead included) in roster order.
    template <typename F>
    void for_each(F&& fn) const {
        for (const auto& u : units_)
            fn(*u);
    }

    template <typename T>
    const ComponentTable<T>& components() const {
        return std::get<ComponentTable<T>>(components_);
    }

    template <typename T>
    const T* component(const UnitId& id) const {
        return components<T>().find(id);
    }

    template <typename T>
    BattleState with_component(const UnitId& id, T value) const {
        BattleState s = *this;
        auto& table = std::get<ComponentTable<T>>(s.components_);
        table = table.with(id, std::move(value));
        return s;
    }

    template <typename T>
    BattleState without_component(const UnitId& id) const {
        BattleState s = *this;
        auto& table = std::get<ComponentTable<T>>(s.components_);
        table = table.without(id);
        return s;
    }

    /// Structural equality over units, components and round.
    bool operator==(const BattleState& o) const;
    bool operator!=(const BattleState& o) const { return !(*this == o); }

private:
    std::vector<std::shared_ptr<const BattleUnit>> units_;
    u32 round_ = 1;
    std::tuple<ComponentTable<ChargeComponent>,
               ComponentTable<InterceptComponent>,
               ComponentTable<PhalanxComponent>,
               ComponentTable<LosComponent>,
               ComponentTable<OverwatchComponent>,
               ComponentTable<AmmoComponent>>
        components_;
};

} // namespace tac::battle
