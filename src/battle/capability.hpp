#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tac::battle {

/// Behavioural markers attached to units. Mechanics dispatch on these
/// instead of free-form tags.
enum class Capability : u32 {
    None          = 0,
    Cavalry       = 1 << 0,
    Charge        = 1 << 1,  // Builds momentum while moving
    SpearWall     = 1 << 2,  // Hard intercept, counters charges
    ZoneOfControl = 1 << 3,  // Soft intercept
    Phalanx       = 1 << 4,
    PhalanxImmune = 1 << 5,
    Ranged        = 1 << 6,
    Mage          = 1 << 7,
    UnlimitedAmmo = 1 << 8,
    QuickCooldown = 1 << 9,
    QuickReload   = 1 << 10,
    ArcFire       = 1 << 11,
    LosTransparent = 1 << 12,
    Stealth       = 1 << 13, // Immune to overwatch
};

inline Capability operator|(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<u32>(a) | static_cast<u32>(b));
}
inline Capability operator&(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<u32>(a) & static_cast<u32>(b));
}

/// Set of capabilities stored as a bitmask.
class CapabilitySet {
public:
    CapabilitySet() = default;
    CapabilitySet(Capability caps) : bits_(static_cast<u32>(caps)) {}

    bool has(Capability c) const {
        return (bits_ & static_cast<u32>(c)) != 0;
    }
    /// True if any of the capabilities in `caps` is present.
    bool has_any(CapabilitySet caps) const { return (bits_ & caps.bits_) != 0; }

    CapabilitySet with(Capability c) const {
        CapabilitySet s = *this;
        s.bits_ |= static_cast<u32>(c);
        return s;
    }
    CapabilitySet without(Capability c) const {
        CapabilitySet s = *this;
        s.bits_ &= ~static_cast<u32>(c);
        return s;
    }
    void add(Capability c) { bits_ |= static_cast<u32>(c); }
    void remove(Capability c) { bits_ &= ~static_cast<u32>(c); }

    bool empty() const { return bits_ == 0; }
    u32 bits() const { return bits_; }

    /// Names of all set capabilities in declaration order.
    std::vector<std::string> names() const;

    bool operator==(const CapabilitySet& o) const { return bits_ == o.bits_; }
    bool operator!=(const CapabilitySet& o) const { return bits_ != o.bits_; }

private:
    u32 bits_ = 0;
};

/// Script-facing name, e.g. "spear_wall".
const char* capability_name(Capability c);
std::optional<Capability> capability_from_name(std::string_view name);

} // namespace tac::battle
