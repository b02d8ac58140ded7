#include "battle/position.hpp"

namespace tac::battle {

const char* facing_name(Facing f) {
    switch (f) {
    case Facing::North: return "north";
    case Facing::East:  return "east";
    case Facing::South: return "south";
    case Facing::West:  return "west";
    }
    return "north";
}

std::optional<Facing> facing_from_name(std::string_view name) {
    if (name == "north" || name == "n") return Facing::North;
    if (name == "east" || name == "e") return Facing::East;
    if (name == "south" || name == "s") return Facing::South;
    if (name == "west" || name == "w") return Facing::West;
    return std::nullopt;
}

} // namespace tac::battle
