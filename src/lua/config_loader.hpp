#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "mechanics/config.hpp"

#include <string_view>

namespace tac::lua {

class LuaState;

/// Reads a mechanics configuration from the `Mechanics` global of a Lua
/// chunk:
///
///   Mechanics = {
///       preset = "tactical",                 -- base config, default "mvp"
///       charge = { enabled = true, min_charge_distance = 2 },
///       phalanx = true,                      -- enabled with defaults
///   }
///
/// Missing dependencies are enabled and the result is validated.
class ConfigLoader {
public:
    Result<mechanics::MechanicsConfig> load_file(LuaState& state,
                                                 const fs::path& path);
    Result<mechanics::MechanicsConfig> load_string(LuaState& state,
                                                   std::string_view code);

    /// Read `Mechanics` from a state whose chunk has already run.
    Result<mechanics::MechanicsConfig> read_config(LuaState& state);
};

} // namespace tac::lua
