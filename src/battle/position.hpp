#pragma once

#include "core/types.hpp"

#include <cstdlib>
#include <optional>
#include <string_view>

namespace tac::battle {

/// Integer grid coordinate. y grows downward (south).
struct Position {
    i32 x = 0;
    i32 y = 0;

    bool operator==(const Position& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

inline i32 manhattan(Position a, Position b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline i32 chebyshev(Position a, Position b) {
    i32 dx = std::abs(a.x - b.x);
    i32 dy = std::abs(a.y - b.y);
    return dx > dy ? dx : dy;
}

inline bool orthogonally_adjacent(Position a, Position b) {
    return manhattan(a, b) == 1;
}

enum class Facing : u8 { North, East, South, West };

/// Unit vector for a facing, in grid coordinates.
inline Position facing_vector(Facing f) {
    switch (f) {
    case Facing::North: return {0, -1};
    case Facing::East:  return {1, 0};
    case Facing::South: return {0, 1};
    case Facing::West:  return {-1, 0};
    }
    return {0, 0};
}

const char* facing_name(Facing f);
std::optional<Facing> facing_from_name(std::string_view name);

} // namespace tac::battle
