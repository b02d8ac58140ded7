#include "battle/battle_state.hpp"

#include <spdlog/spdlog.h>

namespace tac::battle {

BattleState::BattleState(const std::vector<BattleUnit>& units, u32 round)
    : round_(round) {
    units_.reserve(units.size());
    for (const auto& u : units) {
        units_.push_back(std::make_shared<const BattleUnit>(u));
    }
}

BattleState BattleState::with_round(u32 round) const {
    BattleState s = *this;
    s.round_ = round;
    return s;
}

const BattleUnit* BattleState::find(const UnitId& id) const {
    for (const auto& u : units_) {
        if (u->id == id) return u.get();
    }
    return nullptr;
}

std::optional<size_t> BattleState::find_index(const UnitId& id) const {
    for (size_t i = 0; i < units_.size(); ++i) {
        if (units_[i]->id == id) return i;
    }
    return std::nullopt;
}

const BattleUnit* BattleState::unit_at(Position pos) const {
    for (const auto& u : units_) {
        if (u->alive && u->position == pos) return u.get();
    }
    return nullptr;
}

std::vector<const BattleUnit*> BattleState::units_within(Position center,
                                                         i32 range) const {
    std::vector<const BattleUnit*> result;
    for (const auto& u : units_) {
        if (u->alive && manhattan(u->position, center) <= range) {
            result.push_back(u.get());
        }
    }
    return result;
}

BattleState BattleState::with_unit(const BattleUnit& unit) const {
    BattleState s = *this;
    for (auto& u : s.units_) {
        if (u->id == unit.id) {
            u = std::make_shared<const BattleUnit>(unit);
            return s;
        }
    }
    spdlog::warn("with_unit: unknown unit '{}'", unit.id);
    return s;
}

BattleState BattleState::with_units(const std::vector<BattleUnit>& units) const {
    BattleState s = *this;
    for (const auto& unit : units) {
        s = s.with_unit(unit);
    }
    return s;
}

bool BattleState::operator==(const BattleState& o) const {
    if (round_ != o.round_ || units_.size() != o.units_.size()) return false;
    for (size_t i = 0; i < units_.size(); i++) {
        if (units_[i] != o.units_[i] && *units_[i] != *o.units_[i])
            return false;
    }
    return components_ == o.components_;
}

} // namespace tac::battle
