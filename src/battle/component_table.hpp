#pragma once

#include "battle/battle_unit.hpp"

#include <map>
#include <memory>

namespace tac::battle {

/// Immutable per-mechanic side table keyed by unit id.
/// Copies share the records; `with`/`without` return a new table that
/// replaces a single entry.
template <typename T>
class ComponentTable {
public:
    /// Look up a record. Returns nullptr if the unit has none.
    const T* find(const UnitId& id) const {
        auto it = entries_.find(id);
        return it == entries_.end() ? nullptr : it->second.get();
    }

    bool contains(const UnitId& id) const { return entries_.count(id) != 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    ComponentTable with(const UnitId& id, T value) const {
        ComponentTable t = *this;
        t.entries_[id] = std::make_shared<const T>(std::move(value));
        return t;
    }

    ComponentTable without(const UnitId& id) const {
        ComponentTable t = *this;
        t.entries_.erase(id);
        return t;
    }

    /// Iterate in unit id order.
    template <typename F>
    void for_each(F&& fn) const {
        for (const auto& [id, rec] : entries_)
            fn(id, *rec);
    }

    bool operator==(const ComponentTable& o) const {
        if (entries_.size() != o.entries_.size()) return false;
        auto a = entries_.begin();
        auto b = o.entries_.begin();
        for (; a != entries_.end(); ++a, ++b) {
            if (a->first != b->first) return false;
            if (a->second != b->second && !(*a->second == *b->second))
                return false;
        }
        return true;
    }
    bool operator!=(const ComponentTable& o) const { return !(*this == o); }

private:
    std::map<UnitId, std::shared_ptr<const T>> entries_;
};

} // namespace tac::battle
