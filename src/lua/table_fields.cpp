#include "lua/table_fields.hpp"

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace tac::lua {

std::optional<std::string> read_string_field(lua_State* L, int table_idx,
                                             const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::optional<std::string> result;
    if (lua_type(L, -1) == LUA_TSTRING) {
        result = lua_tostring(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

std::optional<f64> read_number_field(lua_State* L, int table_idx,
                                     const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::optional<f64> result;
    if (lua_type(L, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

int push_table_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return 0;
    }
    return lua_gettop(L);
}

int push_table_element(lua_State* L, int table_idx, int i) {
    lua_pushnumber(L, i);
    lua_gettable(L, table_idx);
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return 0;
    }
    return lua_gettop(L);
}

} // namespace tac::lua
