#pragma once

#include "battle/battle_state.hpp"
#include "mechanics/config.hpp"
#include "mechanics/mechanic_processor.hpp"
#include "mechanics/reason.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tac::mechanics {

enum class AmmoState : u8 { Full, Partial, Empty, Reloading };
enum class CooldownState : u8 { Ready, Cooling, Reduced };

const char* ammo_state_name(AmmoState s);
const char* cooldown_state_name(CooldownState s);

struct AmmoCheck {
    bool can_attack = true;
    bool has_ammo = true;
    i32 ammo_remaining = battle::UNLIMITED_AMMO;
    AmmoState ammo_state = AmmoState::Full;
    std::optional<Reason> reason;
};

struct AmmoConsumeResult {
    bool success = false;
    i32 ammo_consumed = 0;
    i32 ammo_remaining = 0;
    AmmoState ammo_state = AmmoState::Full;
    std::optional<Reason> reason;
    battle::BattleState state;
};

struct ReloadResult {
    bool success = false;
    i32 ammo_restored = 0;
    i32 new_ammo = 0;
    bool reload_started = false; // timed reload begun, ammo arrives later
    std::optional<Reason> reason;
    battle::BattleState state;
};

struct CooldownCheck {
    bool can_use = true;
    i32 turns_remaining = 0;
    CooldownState cooldown_state = CooldownState::Ready;
    std::optional<Reason> reason;
};

struct CooldownTriggerResult {
    bool success = false;
    i32 duration = 0;
    bool reduced = false;
    std::optional<Reason> reason;
    battle::BattleState state;
};

struct CooldownTickResult {
    std::vector<std::string> ready_abilities;
    battle::BattleState state;
};

/// Shared ammunition pool, queried by mechanics that spend shots.
class AmmoLedger {
public:
    virtual ~AmmoLedger() = default;

    virtual AmmoCheck check_ammo(const battle::UnitId& unit,
                                 const battle::BattleState& state) const = 0;
    virtual AmmoConsumeResult consume_ammo(const battle::UnitId& unit,
                                           const battle::BattleState& state,
                                           i32 amount = 1) const = 0;
};

/// Ammunition for ranged units, per-ability cooldowns for mages.
class AmmunitionProcessor : public MechanicProcessor, public AmmoLedger {
public:
    explicit AmmunitionProcessor(AmmunitionConfig config);

    const char* name() const override { return "ammunition"; }
    battle::BattleState initialize(const battle::BattleState& state) const override;
    battle::BattleState apply(battle::BattlePhase phase,
                              const battle::BattleState& state,
                              const battle::PhaseContext& ctx) const override;

    /// Explicit component type if present, else derived from capabilities.
    battle::ResourceType get_resource_type(const battle::BattleUnit& unit,
                                           const battle::BattleState& state) const;

    /// Attach a fresh resource component. Units with no resource are
    /// returned unchanged.
    battle::BattleState initialize_unit(const battle::UnitId& unit,
                                        const battle::BattleState& state) const;

    AmmoCheck check_ammo(const battle::UnitId& unit,
                         const battle::BattleState& state) const override;
    AmmoConsumeResult consume_ammo(const battle::UnitId& unit,
                                   const battle::BattleState& state,
                                   i32 amount = 1) const override;

    /// Restore ammo. With a reload duration configured the refill is
    /// deferred until tick_reload completes it.
    ReloadResult reload(const battle::UnitId& unit,
                        const battle::BattleState& state,
                        std::optional<i32> amount = std::nullopt) const;

    /// Advance a timed reload by one turn. Dead units are left as they are.
    battle::BattleState tick_reload(const battle::UnitId& unit,
                                    const battle::BattleState& state) const;

    CooldownCheck check_cooldown(const battle::UnitId& unit,
                                 const std::string& ability_id,
                                 const battle::BattleState& state) const;
    CooldownTriggerResult trigger_cooldown(
        const battle::UnitId& unit, const std::string& ability_id,
        const battle::BattleState& state,
        std::optional<i32> duration = std::nullopt) const;
    CooldownTickResult tick_cooldowns(const battle::UnitId& unit,
                                      const battle::BattleState& state) const;

    const AmmunitionConfig& config() const { return config_; }

private:
    battle::ResourceType derive_resource_type(const battle::BattleUnit& unit) const;
    AmmoState classify(const battle::AmmoComponent& c) const;

    AmmunitionConfig config_;
};

} // namespace tac::mechanics
