#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_fields.hpp"

#include <cmath>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace tac::lua {

using mechanics::MechanicId;
using mechanics::MechanicsConfig;

namespace {

/// Reads the tunables of one mechanic table, collecting type errors and
/// remembering which keys it understood.
class SectionReader {
public:
    SectionReader(lua_State* L, int idx, const char* section)
        : L_(L), idx_(idx), section_(section) {}

    void read(const char* key, f64& out) {
        known_.insert(key);
        lua_pushstring(L_, key);
        lua_gettable(L_, idx_);
        if (lua_type(L_, -1) == LUA_TNUMBER) {
            out = lua_tonumber(L_, -1);
        } else if (!lua_isnil(L_, -1)) {
            errors_.push_back(fmt::format("{}.{} must be a number", section_, key));
        }
        lua_pop(L_, 1);
    }

    void read(const char* key, i32& out) {
        known_.insert(key);
        lua_pushstring(L_, key);
        lua_gettable(L_, idx_);
        if (lua_type(L_, -1) == LUA_TNUMBER) {
            f64 v = lua_tonumber(L_, -1);
            if (v != std::floor(v)) {
                errors_.push_back(
                    fmt::format("{}.{} must be an integer", section_, key));
            } else {
                out = static_cast<i32>(v);
            }
        } else if (!lua_isnil(L_, -1)) {
            errors_.push_back(fmt::format("{}.{} must be a number", section_, key));
        }
        lua_pop(L_, 1);
    }

    void read(const char* key, bool& out) {
        known_.insert(key);
        lua_pushstring(L_, key);
        lua_gettable(L_, idx_);
        if (lua_isboolean(L_, -1)) {
            out = lua_toboolean(L_, -1) != 0;
        } else if (!lua_isnil(L_, -1)) {
            errors_.push_back(fmt::format("{}.{} must be a boolean", section_, key));
        }
        lua_pop(L_, 1);
    }

    /// Warn about keys nobody read. Returns the collected type errors.
    std::vector<std::string> finish() {
        lua_pushnil(L_);
        while (lua_next(L_, idx_) != 0) {
            lua_pop(L_, 1); // value
            if (lua_type(L_, -1) != LUA_TSTRING) {
                spdlog::warn("Mechanics.{}: ignoring non-string key", section_);
                continue;
            }
            std::string key = lua_tostring(L_, -1);
            if (known_.count(key) == 0) {
                spdlog::warn("Mechanics.{}: unknown field '{}'", section_, key);
            }
        }
        return std::move(errors_);
    }

private:
    lua_State* L_;
    int idx_;
    const char* section_;
    std::set<std::string> known_;
    std::vector<std::string> errors_;
};

void read_section(SectionReader& r, mechanics::ChargeConfig& c) {
    r.read("enabled", c.enabled);
    r.read("momentum_per_cell", c.momentum_per_cell);
    r.read("max_momentum", c.max_momentum);
    r.read("shock_resolve_damage", c.shock_resolve_damage);
    r.read("min_charge_distance", c.min_charge_distance);
    r.read("counter_multiplier", c.counter_multiplier);
}

void read_section(SectionReader& r, mechanics::InterceptConfig& c) {
    r.read("enabled", c.enabled);
    r.read("hard_intercept_multiplier", c.hard_intercept_multiplier);
    r.read("max_intercepts", c.max_intercepts);
    r.read("disengage_cost", c.disengage_cost);
    r.read("soft_intercept", c.soft_intercept);
}

void read_section(SectionReader& r, mechanics::PhalanxConfig& c) {
    r.read("enabled", c.enabled);
    r.read("armor_per_ally", c.armor_per_ally);
    r.read("resolve_per_ally", c.resolve_per_ally);
    r.read("max_armor_bonus", c.max_armor_bonus);
    r.read("max_resolve_bonus", c.max_resolve_bonus);
    r.read("require_same_facing", c.require_same_facing);
}

void read_section(SectionReader& r, mechanics::LineOfSightConfig& c) {
    r.read("enabled", c.enabled);
    r.read("arc_fire_penalty", c.arc_fire_penalty);
    r.read("default_firing_arc", c.default_firing_arc);
    r.read("enforce_firing_arc", c.enforce_firing_arc);
}

void read_section(SectionReader& r, mechanics::OverwatchConfig& c) {
    r.read("enabled", c.enabled);
    r.read("max_shots", c.max_shots);
    r.read("default_range", c.default_range);
    r.read("damage_multiplier", c.damage_multiplier);
}

void read_section(SectionReader& r, mechanics::AmmunitionConfig& c) {
    r.read("enabled", c.enabled);
    r.read("default_ammo", c.default_ammo);
    r.read("default_cooldown", c.default_cooldown);
    r.read("reload_amount", c.reload_amount);
    r.read("reload_duration", c.reload_duration);
    r.read("mage_cooldowns", c.mage_cooldowns);
    r.read("quick_cooldown_tick", c.quick_cooldown_tick);
}

/// A table section is enabled unless it says otherwise.
template <typename C>
std::vector<std::string> read_mechanic(lua_State* L, int idx, const char* name,
                                       C& config) {
    config.enabled = true;
    SectionReader reader(L, idx, name);
    read_section(reader, config);
    return reader.finish();
}

std::vector<std::string> read_mechanic(lua_State* L, int idx, MechanicId id,
                                       MechanicsConfig& config) {
    const char* name = mechanics::mechanic_name(id);
    switch (id) {
    case MechanicId::Ammunition:  return read_mechanic(L, idx, name, config.ammunition);
    case MechanicId::Intercept:   return read_mechanic(L, idx, name, config.intercept);
    case MechanicId::Charge:      return read_mechanic(L, idx, name, config.charge);
    case MechanicId::Phalanx:     return read_mechanic(L, idx, name, config.phalanx);
    case MechanicId::LineOfSight: return read_mechanic(L, idx, name, config.line_of_sight);
    case MechanicId::Overwatch:   return read_mechanic(L, idx, name, config.overwatch);
    }
    return {};
}

} // namespace

Result<MechanicsConfig> ConfigLoader::load_file(LuaState& state,
                                                const fs::path& path) {
    auto result = state.do_file(path);
    if (!result) {
        return result.error().wrap("loading " + path.string());
    }
    auto config = read_config(state);
    if (!config) {
        return config.error().wrap(path.string());
    }
    spdlog::info("Loaded mechanics config from {}", path.string());
    return config;
}

Result<MechanicsConfig> ConfigLoader::load_string(LuaState& state,
                                                  std::string_view code) {
    auto result = state.do_string(code);
    if (!result) return result.error();
    return read_config(state);
}

Result<MechanicsConfig> ConfigLoader::read_config(LuaState& state) {
    lua_State* L = state.raw();

    lua_getglobal(L, "Mechanics");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("Mechanics table not found");
    }
    int root = lua_gettop(L);

    MechanicsConfig config;
    if (auto preset = read_string_field(L, root, "preset")) {
        auto base = mechanics::preset_by_name(*preset);
        if (!base) {
            lua_pop(L, 1);
            return base.error();
        }
        config = base.take();
    }

    std::vector<std::string> errors;
    lua_pushnil(L);
    while (lua_next(L, root) != 0) {
        // key at -2, value at -1
        if (lua_type(L, -2) != LUA_TSTRING) {
            spdlog::warn("Mechanics: ignoring non-string key");
            lua_pop(L, 1);
            continue;
        }
        std::string key = lua_tostring(L, -2);
        if (key == "preset") {
            lua_pop(L, 1);
            continue;
        }

        auto id = mechanics::mechanic_from_name(key);
        if (!id) {
            spdlog::warn("Mechanics: unknown mechanic '{}'", key);
        } else if (lua_isboolean(L, -1)) {
            config.set_enabled(*id, lua_toboolean(L, -1) != 0);
        } else if (lua_istable(L, -1)) {
            auto section_errors = read_mechanic(L, lua_gettop(L), *id, config);
            errors.insert(errors.end(), section_errors.begin(), section_errors.end());
        } else {
            errors.push_back(
                fmt::format("Mechanics.{} must be a table or a boolean", key));
        }
        lua_pop(L, 1);
    }
    lua_pop(L, 1); // Mechanics

    if (!errors.empty()) {
        std::string message = "Invalid mechanics config:";
        for (const auto& e : errors) message += "\n  " + e;
        return Error(std::move(message));
    }

    config = mechanics::resolve_dependencies(config);
    auto invalid = mechanics::validate(config);
    if (!invalid.empty()) {
        std::string message = "Invalid mechanics config:";
        for (const auto& e : invalid) message += "\n  " + e.message;
        return Error(std::move(message));
    }
    return config;
}

} // namespace tac::lua
