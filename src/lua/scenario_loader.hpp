#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sim/scripted_battle.hpp"

#include <string_view>

namespace tac::lua {

class LuaState;

/// Reads a scripted battle from the `Scenario` global of a Lua chunk:
///
///   Scenario = {
///       name = "Spear line", seed = 7,
///       units = {
///           { id = "lancer", team = 1, x = 0, y = 0, facing = "east",
///             hp = 30, atk = 12, armor = 1, speed = 5,
///             capabilities = { "cavalry", "charge" } },
///           ...
///       },
///       rounds = {
///           { { actor = "lancer", path = { {0,0}, {1,0}, {2,0} },
///               attack = "pike" } },
///       },
///   }
class ScenarioLoader {
public:
    Result<sim::Scenario> load_file(LuaState& state, const fs::path& path);
    Result<sim::Scenario> load_string(LuaState& state, std::string_view code);

    /// Read `Scenario` from a state whose chunk has already run.
    Result<sim::Scenario> read_scenario(LuaState& state);
};

} // namespace tac::lua
