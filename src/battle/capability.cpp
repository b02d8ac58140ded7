#include "battle/capability.hpp"

#include <array>
#include <utility>

namespace tac::battle {

namespace {

const std::array<std::pair<Capability, const char*>, 14> CAPABILITY_NAMES = {{
    {Capability::Cavalry, "cavalry"},
    {Capability::Charge, "charge"},
    {Capability::SpearWall, "spear_wall"},
    {Capability::ZoneOfControl, "zone_of_control"},
    {Capability::Phalanx, "phalanx"},
    {Capability::PhalanxImmune, "phalanx_immune"},
    {Capability::Ranged, "ranged"},
    {Capability::Mage, "mage"},
    {Capability::UnlimitedAmmo, "unlimited_ammo"},
    {Capability::QuickCooldown, "quick_cooldown"},
    {Capability::QuickReload, "quick_reload"},
    {Capability::ArcFire, "arc_fire"},
    {Capability::LosTransparent, "los_transparent"},
    {Capability::Stealth, "stealth"},
}};

} // namespace

const char* capability_name(Capability c) {
    for (const auto& [cap, name] : CAPABILITY_NAMES) {
        if (cap == c) return name;
    }
    return "none";
}

std::optional<Capability> capability_from_name(std::string_view name) {
    for (const auto& [cap, cap_name] : CAPABILITY_NAMES) {
        if (name == cap_name) return cap;
    }
    return std::nullopt;
}

std::vector<std::string> CapabilitySet::names() const {
    std::vector<std::string> out;
    for (const auto& [cap, name] : CAPABILITY_NAMES) {
        if (has(cap)) out.emplace_back(name);
    }
    return out;
}

} // namespace tac::battle
