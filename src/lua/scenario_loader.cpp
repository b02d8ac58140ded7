#include "lua/scenario_loader.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_fields.hpp"

#include <cmath>
#include <set>

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace tac::lua {

using battle::BattleUnit;
using battle::Position;

namespace {

i32 read_int_field(lua_State* L, int idx, const char* key, i32 default_val) {
    auto v = read_number_field(L, idx, key);
    return v ? static_cast<i32>(std::floor(*v)) : default_val;
}

/// Parse capabilities = { "cavalry", "charge", ... }
Result<battle::CapabilitySet> read_capabilities(lua_State* L, int unit_idx,
                                                const std::string& unit_id) {
    battle::CapabilitySet caps;
    int caps_idx = push_table_field(L, unit_idx, "capabilities");
    if (!caps_idx) return caps;

    for (int i = 1;; ++i) {
        lua_pushnumber(L, i);
        lua_gettable(L, caps_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (lua_type(L, -1) != LUA_TSTRING) {
            lua_pop(L, 2);
            return Error("unit '" + unit_id + "': capabilities must be strings");
        }
        std::string name = lua_tostring(L, -1);
        lua_pop(L, 1);

        auto cap = battle::capability_from_name(name);
        if (!cap) {
            lua_pop(L, 1);
            return Error("unit '" + unit_id + "': unknown capability '" + name + "'");
        }
        caps.add(*cap);
    }
    lua_pop(L, 1);
    return caps;
}

Result<BattleUnit> read_unit(lua_State* L, int unit_idx, int index) {
    BattleUnit unit;
    auto id = read_string_field(L, unit_idx, "id");
    if (!id || id->empty()) {
        return Error(fmt::format("units[{}] has no id", index));
    }
    unit.id = *id;

    auto team = read_number_field(L, unit_idx, "team");
    if (!team) {
        return Error("unit '" + unit.id + "' has no team");
    }
    unit.team = static_cast<i32>(*team);
    unit.position = {read_int_field(L, unit_idx, "x", 0),
                     read_int_field(L, unit_idx, "y", 0)};

    if (auto facing = read_string_field(L, unit_idx, "facing")) {
        auto f = battle::facing_from_name(*facing);
        if (!f) {
            return Error("unit '" + unit.id + "': unknown facing '" + *facing + "'");
        }
        unit.facing = *f;
    }

    auto& s = unit.stats;
    s.hp = read_int_field(L, unit_idx, "hp", 1);
    s.atk = read_int_field(L, unit_idx, "atk", 0);
    s.atk_count = read_int_field(L, unit_idx, "atk_count", 1);
    s.armor = read_int_field(L, unit_idx, "armor", 0);
    s.speed = read_int_field(L, unit_idx, "speed", 0);
    s.initiative = read_int_field(L, unit_idx, "initiative", 0);
    s.dodge = read_int_field(L, unit_idx, "dodge", 0);
    if (s.hp <= 0) {
        return Error("unit '" + unit.id + "': hp must be positive");
    }

    unit.current_hp = s.hp;
    unit.range = read_int_field(L, unit_idx, "range", 1);
    unit.resolve = read_int_field(L, unit_idx, "resolve", 100);

    auto caps = read_capabilities(L, unit_idx, unit.id);
    if (!caps) return caps.error();
    unit.capabilities = caps.value();
    return unit;
}

/// Parse path = { {x, y}, {x = .., y = ..}, ... }
Result<std::vector<Position>> read_path(lua_State* L, int turn_idx,
                                        const std::string& actor) {
    std::vector<Position> path;
    int path_idx = push_table_field(L, turn_idx, "path");
    if (!path_idx) return path;

    for (int i = 1;; ++i) {
        lua_pushnumber(L, i);
        lua_gettable(L, path_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (!lua_istable(L, -1)) {
            lua_pop(L, 2);
            return Error(fmt::format("turn of '{}': path[{}] is not a cell", actor, i));
        }
        int cell_idx = lua_gettop(L);

        auto x = read_number_field(L, cell_idx, "x");
        auto y = read_number_field(L, cell_idx, "y");
        if (!x || !y) {
            lua_rawgeti(L, cell_idx, 1);
            lua_rawgeti(L, cell_idx, 2);
            if (lua_type(L, -2) == LUA_TNUMBER && lua_type(L, -1) == LUA_TNUMBER) {
                x = lua_tonumber(L, -2);
                y = lua_tonumber(L, -1);
            }
            lua_pop(L, 2);
        }
        lua_pop(L, 1); // cell
        if (!x || !y) {
            lua_pop(L, 1);
            return Error(fmt::format("turn of '{}': path[{}] needs x and y", actor, i));
        }
        path.push_back({static_cast<i32>(*x), static_cast<i32>(*y)});
    }
    lua_pop(L, 1);
    return path;
}

Result<sim::ScriptedTurn> read_turn(lua_State* L, int turn_idx,
                                    const std::set<std::string>& ids) {
    sim::ScriptedTurn turn;
    auto actor = read_string_field(L, turn_idx, "actor");
    if (!actor) return Error("turn has no actor");
    if (ids.count(*actor) == 0) {
        return Error("turn names unknown unit '" + *actor + "'");
    }
    turn.actor = *actor;

    auto path = read_path(L, turn_idx, turn.actor);
    if (!path) return path.error();
    turn.path = path.take();
    if (turn.path.size() == 1) turn.path.clear();

    if (auto target = read_string_field(L, turn_idx, "attack")) {
        if (ids.count(*target) == 0) {
            return Error("turn of '" + turn.actor + "' attacks unknown unit '" +
                         *target + "'");
        }
        turn.attack_target = *target;
    }
    if (auto ability = read_string_field(L, turn_idx, "ability")) {
        turn.ability_id = *ability;
    }
    return turn;
}

} // namespace

Result<sim::Scenario> ScenarioLoader::load_file(LuaState& state,
                                                const fs::path& path) {
    auto result = state.do_file(path);
    if (!result) {
        return result.error().wrap("loading " + path.string());
    }
    auto scenario = read_scenario(state);
    if (!scenario) {
        return scenario.error().wrap(path.string());
    }
    if (scenario.value().name.empty()) {
        scenario.value().name = path.stem().string();
    }
    return scenario;
}

Result<sim::Scenario> ScenarioLoader::load_string(LuaState& state,
                                                  std::string_view code) {
    auto result = state.do_string(code);
    if (!result) return result.error();
    return read_scenario(state);
}

Result<sim::Scenario> ScenarioLoader::read_scenario(LuaState& state) {
    lua_State* L = state.raw();
    int base = lua_gettop(L);

    lua_getglobal(L, "Scenario");
    if (!lua_istable(L, -1)) {
        lua_settop(L, base);
        return Error("Scenario table not found");
    }
    int root = lua_gettop(L);

    sim::Scenario scenario;
    scenario.name = read_string_field(L, root, "name").value_or("");
    scenario.seed = static_cast<u64>(read_number_field(L, root, "seed").value_or(0));

    // Units
    int units_idx = push_table_field(L, root, "units");
    if (!units_idx) {
        lua_settop(L, base);
        return Error("Scenario.units not found");
    }
    std::set<std::string> ids;
    for (int i = 1;; ++i) {
        int unit_idx = push_table_element(L, units_idx, i);
        if (!unit_idx) break;

        auto unit = read_unit(L, unit_idx, i);
        lua_pop(L, 1);
        if (!unit) {
            lua_settop(L, base);
            return unit.error();
        }
        if (!ids.insert(unit.value().id).second) {
            lua_settop(L, base);
            return Error("duplicate unit id '" + unit.value().id + "'");
        }
        scenario.units.push_back(unit.take());
    }
    lua_pop(L, 1); // units
    if (scenario.units.empty()) {
        lua_settop(L, base);
        return Error("Scenario.units is empty");
    }

    // Rounds: an array of rounds, each an array of turns
    if (int rounds_idx = push_table_field(L, root, "rounds")) {
        for (int r = 1;; ++r) {
            int round_idx = push_table_element(L, rounds_idx, r);
            if (!round_idx) break;

            std::vector<sim::ScriptedTurn> turns;
            for (int t = 1;; ++t) {
                int turn_idx = push_table_element(L, round_idx, t);
                if (!turn_idx) break;

                auto turn = read_turn(L, turn_idx, ids);
                lua_pop(L, 1);
                if (!turn) {
                    lua_settop(L, base);
                    return turn.error().wrap(fmt::format("round {}", r));
                }
                turns.push_back(turn.take());
            }
            lua_pop(L, 1); // round
            scenario.rounds.push_back(std::move(turns));
        }
        lua_pop(L, 1); // rounds
    }

    lua_settop(L, base);
    spdlog::info("Scenario '{}': {} units, {} rounds", scenario.name,
                 scenario.units.size(), scenario.rounds.size());
    return scenario;
}

} // namespace tac::lua
