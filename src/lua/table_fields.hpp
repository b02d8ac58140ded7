#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

struct lua_State;

namespace tac::lua {

// Field readers for the table at an absolute stack index. Each leaves the
// stack as it found it.

/// Returns nullopt if the field doesn't exist or isn't a string.
std::optional<std::string> read_string_field(lua_State* L, int table_idx,
                                             const char* key);

/// Returns nullopt if the field doesn't exist or isn't a number.
std::optional<f64> read_number_field(lua_State* L, int table_idx,
                                     const char* key);

/// Push t[key] if it is a table and return its index; otherwise push
/// nothing and return 0.
int push_table_field(lua_State* L, int table_idx, const char* key);

/// Push t[i] if it is a table and return its index; otherwise push
/// nothing and return 0.
int push_table_element(lua_State* L, int table_idx, int i);

} // namespace tac::lua
