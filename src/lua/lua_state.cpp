#include "lua/lua_state.hpp"
#include "core/log.hpp"

#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace tac::lua {

LuaState::LuaState() {
    L_ = luaL_newstate();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    luaL_openlibs(L_);

    register_function("LOG", log::l_LOG);
    register_function("WARN", log::l_WARN);
    register_function("SPEW", log::l_SPEW);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

std::optional<std::string> LuaState::get_global_string(const char* name) const {
    lua_getglobal(L_, name);
    std::optional<std::string> result;
    if (lua_type(L_, -1) == LUA_TSTRING) {
        result = lua_tostring(L_, -1);
    }
    lua_pop(L_, 1);
    return result;
}

namespace {

/// Pop the error object left by a failed load or call.
std::string pop_error(lua_State* L) {
    std::string err;
    if (lua_isstring(L, -1)) {
        err = lua_tostring(L, -1);
    } else {
        err = std::string("error object is a ") +
              lua_typename(L, lua_type(L, -1)) + " value";
    }
    lua_pop(L, 1);
    return err;
}

} // namespace

Result<void> LuaState::run_loaded(int load_status) {
    if (load_status != 0) return Error(pop_error(L_));

    int status = lua_pcall(L_, 0, 0, 0);
    if (status != 0) return Error(pop_error(L_));

    return {};
}

Result<void> LuaState::do_string(std::string_view code) {
    return run_loaded(luaL_loadbuffer(L_, code.data(), code.size(), "=string"));
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error("Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(buffer.data(), size)) {
        return Error("Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                   const char* name) {
    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    return run_loaded(luaL_loadbuffer(L_, buf, len, name));
}

} // namespace tac::lua
