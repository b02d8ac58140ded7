#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace tac::log {

/// Initialize logging with console + file sinks.
/// An empty path disables the file sink.
void init(const std::filesystem::path& log_file = "tactica.log",
          spdlog::level::level_enum level = spdlog::level::info);

/// Flush and shutdown logging.
void shutdown();

/// Parse "debug", "info", "warn"... Falls back to info.
spdlog::level::level_enum level_from_name(const std::string& name);

// Lua-side logging functions, registered into every LuaState
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);

} // namespace tac::log
