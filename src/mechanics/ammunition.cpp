#include "mechanics/ammunition.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tac::mechanics {

using battle::AmmoComponent;
using battle::BattlePhase;
using battle::BattleState;
using battle::Capability;
using battle::ResourceType;
using battle::UnitId;

const char* ammo_state_name(AmmoState s) {
    switch (s) {
    case AmmoState::Full:      return "full";
    case AmmoState::Partial:   return "partial";
    case AmmoState::Empty:     return "empty";
    case AmmoState::Reloading: return "reloading";
    }
    return "unknown";
}

const char* cooldown_state_name(CooldownState s) {
    switch (s) {
    case CooldownState::Ready:   return "ready";
    case CooldownState::Cooling: return "cooling";
    case CooldownState::Reduced: return "reduced";
    }
    return "unknown";
}

AmmunitionProcessor::AmmunitionProcessor(AmmunitionConfig config)
    : config_(std::move(config)) {}

ResourceType AmmunitionProcessor::get_resource_type(
    const battle::BattleUnit& unit, const BattleState& state) const {
    if (const auto* c = state.component<AmmoComponent>(unit.id)) {
        return c->resource_type;
    }
    return derive_resource_type(unit);
}

ResourceType AmmunitionProcessor::derive_resource_type(
    const battle::BattleUnit& unit) const {
    if (unit.has(Capability::Mage) && config_.mage_cooldowns) {
        return ResourceType::Cooldown;
    }
    if (unit.has(Capability::Ranged)) {
        return ResourceType::Ammo;
    }
    return ResourceType::None;
}

BattleState AmmunitionProcessor::initialize_unit(const UnitId& id,
                                                 const BattleState& state) const {
    const auto* unit = state.find(id);
    if (!unit) return state;

    AmmoComponent c;
    c.resource_type = derive_resource_type(*unit);
    c.has_unlimited_ammo = unit->has(Capability::UnlimitedAmmo);
    c.has_quick_cooldown = unit->has(Capability::QuickCooldown);

    switch (c.resource_type) {
    case ResourceType::None:
        return state;
    case ResourceType::Ammo:
        if (c.has_unlimited_ammo) {
            c.ammo = battle::UNLIMITED_AMMO;
            c.max_ammo = battle::UNLIMITED_AMMO;
        } else {
            c.ammo = config_.default_ammo;
            c.max_ammo = config_.default_ammo;
        }
        break;
    case ResourceType::Cooldown:
        break;
    }
    return state.with_component(id, std::move(c));
}

BattleState AmmunitionProcessor::initialize(const BattleState& state) const {
    BattleState s = state;
    size_t count = 0;
    state.for_each([&](const battle::BattleUnit& u) {
        if (state.component<AmmoComponent>(u.id)) return;
        BattleState next = initialize_unit(u.id, s);
        if (next.component<AmmoComponent>(u.id)) count++;
        s = std::move(next);
    });
    spdlog::debug("ammunition: {} units track resources", count);
    return s;
}

AmmoState AmmunitionProcessor::classify(const AmmoComponent& c) const {
    if (c.is_reloading) return AmmoState::Reloading;
    if (c.has_unlimited_ammo) return AmmoState::Full;
    if (c.ammo <= 0) return AmmoState::Empty;
    if (c.ammo >= c.max_ammo) return AmmoState::Full;
    return AmmoState::Partial;
}

AmmoCheck AmmunitionProcessor::check_ammo(const UnitId& id,
                                          const BattleState& state) const {
    AmmoCheck check;
    const auto* unit = state.find(id);
    if (!unit) {
        check.can_attack = false;
        check.has_ammo = false;
        check.ammo_remaining = 0;
        check.reason = Reason::UnitNotFound;
        return check;
    }
    if (!unit->alive) {
        check.can_attack = false;
        check.reason = Reason::UnitDead;
        return check;
    }

    const auto* c = state.component<AmmoComponent>(id);
    if (!c || c->resource_type != ResourceType::Ammo) return check;

    check.ammo_remaining = c->ammo;
    check.ammo_state = classify(*c);
    if (c->has_unlimited_ammo) return check;

    check.has_ammo = c->ammo > 0;
    if (c->is_reloading) {
        check.can_attack = false;
        check.reason = Reason::Reloading;
    } else if (c->ammo <= 0) {
        check.can_attack = false;
        check.reason = Reason::NoAmmo;
    }
    return check;
}

AmmoConsumeResult AmmunitionProcessor::consume_ammo(const UnitId& id,
                                                    const BattleState& state,
                                                    i32 amount) const {
    AmmoConsumeResult result;
    result.state = state;

    const auto* unit = state.find(id);
    if (!unit) {
        result.reason = Reason::UnitNotFound;
        return result;
    }
    if (!unit->alive) {
        result.reason = Reason::UnitDead;
        return result;
    }

    const auto* c = state.component<AmmoComponent>(id);
    if (!c || c->resource_type != ResourceType::Ammo) {
        result.success = true;
        result.ammo_remaining = battle::UNLIMITED_AMMO;
        return result;
    }

    result.ammo_state = classify(*c);
    if (c->has_unlimited_ammo) {
        result.success = true;
        result.ammo_consumed = amount;
        result.ammo_remaining = battle::UNLIMITED_AMMO;
        return result;
    }

    result.ammo_remaining = c->ammo;
    if (c->is_reloading) {
        result.reason = Reason::Reloading;
        return result;
    }
    if (amount > c->ammo) {
        result.reason = Reason::NoAmmo;
        return result;
    }

    AmmoComponent next = *c;
    next.ammo -= amount;
    result.success = true;
    result.ammo_consumed = amount;
    result.ammo_remaining = next.ammo;
    result.ammo_state = classify(next);
    result.state = state.with_component(id, std::move(next));
    return result;
}

ReloadResult AmmunitionProcessor::reload(const UnitId& id,
                                         const BattleState& state,
                                         std::optional<i32> amount) const {
    ReloadResult result;
    result.state = state;

    const auto* unit = state.find(id);
    if (!unit) {
        result.reason = Reason::UnitNotFound;
        return result;
    }
    if (!unit->alive) {
        result.reason = Reason::UnitDead;
        return result;
    }
    const auto* c = state.component<AmmoComponent>(id);
    if (!c || c->resource_type != ResourceType::Ammo) {
        result.reason = Reason::NotRanged;
        return result;
    }
    result.new_ammo = c->ammo;
    if (c->is_reloading) {
        result.reason = Reason::AlreadyReloading;
        return result;
    }
    if (c->has_unlimited_ammo || c->ammo >= c->max_ammo) {
        result.reason = Reason::AlreadyFull;
        return result;
    }

    AmmoComponent next = *c;
    if (config_.reload_duration > 0 && !unit->has(Capability::QuickReload)) {
        next.is_reloading = true;
        next.reload_turns_remaining = config_.reload_duration;
        result.success = true;
        result.reload_started = true;
        result.state = state.with_component(id, std::move(next));
        spdlog::debug("ammunition: {} starts reloading ({} turns)", id,
                      config_.reload_duration);
        return result;
    }

    i32 restore = amount ? *amount
                         : (config_.reload_amount > 0 ? config_.reload_amount
                                                      : c->max_ammo);
    next.ammo = std::min(c->max_ammo, c->ammo + std::max(0, restore));
    result.success = true;
    result.ammo_restored = next.ammo - c->ammo;
    result.new_ammo = next.ammo;
    result.state = state.with_component(id, std::move(next));
    return result;
}

BattleState AmmunitionProcessor::tick_reload(const UnitId& id,
                                             const BattleState& state) const {
    const auto* unit = state.find(id);
    if (!unit || !unit->alive) return state;
    const auto* c = state.component<AmmoComponent>(id);
    if (!c || !c->is_reloading) return state;

    AmmoComponent next = *c;
    next.reload_turns_remaining = std::max(0, next.reload_turns_remaining - 1);
    if (next.reload_turns_remaining == 0) {
        i32 restore = config_.reload_amount > 0 ? config_.reload_amount
                                                : next.max_ammo;
        next.ammo = std::min(next.max_ammo, next.ammo + restore);
        next.is_reloading = false;
        spdlog::debug("ammunition: {} reloaded to {}", id, next.ammo);
    }
    return state.with_component(id, std::move(next));
}

CooldownCheck AmmunitionProcessor::check_cooldown(const UnitId& id,
                                                  const std::string& ability_id,
                                                  const BattleState& state) const {
    CooldownCheck check;
    const auto* c = state.component<AmmoComponent>(id);
    if (!c || c->resource_type != ResourceType::Cooldown) return check;

    auto it = c->cooldowns.find(ability_id);
    if (it == c->cooldowns.end() || it->second <= 0) return check;

    check.can_use = false;
    check.turns_remaining = it->second;
    check.cooldown_state = c->has_quick_cooldown ? CooldownState::Reduced
                                                 : CooldownState::Cooling;
    check.reason = Reason::OnCooldown;
    return check;
}

CooldownTriggerResult AmmunitionProcessor::trigger_cooldown(
    const UnitId& id, const std::string& ability_id, const BattleState& state,
    std::optional<i32> duration) const {
    CooldownTriggerResult result;
    result.state = state;

    const auto* unit = state.find(id);
    if (!unit) {
        result.reason = Reason::UnitNotFound;
        return result;
    }
    if (!unit->alive) {
        result.reason = Reason::UnitDead;
        return result;
    }
    const auto* c = state.component<AmmoComponent>(id);
    if (!c || c->resource_type != ResourceType::Cooldown) {
        result.reason = Reason::NoCooldownResource;
        return result;
    }

    i32 turns = std::max(0, duration.value_or(config_.default_cooldown));
    if (c->has_quick_cooldown && turns > 0) {
        turns = std::max(1, turns - 1);
        result.reduced = true;
    }

    AmmoComponent next = *c;
    if (turns > 0) {
        next.cooldowns[ability_id] = turns;
    } else {
        next.cooldowns.erase(ability_id);
    }
    result.success = true;
    result.duration = turns;
    result.state = state.with_component(id, std::move(next));
    return result;
}

CooldownTickResult AmmunitionProcessor::tick_cooldowns(const UnitId& id,
                                                       const BattleState& state) const {
    CooldownTickResult result;
    result.state = state;

    const auto* c = state.component<AmmoComponent>(id);
    if (!c || c->cooldowns.empty()) return result;

    i32 step = c->has_quick_cooldown ? config_.quick_cooldown_tick : 1;
    AmmoComponent next = *c;
    for (auto it = next.cooldowns.begin(); it != next.cooldowns.end();) {
        it->second = std::max(0, it->second - step);
        if (it->second == 0) {
            result.ready_abilities.push_back(it->first);
            it = next.cooldowns.erase(it);
        } else {
            ++it;
        }
    }
    result.state = state.with_component(id, std::move(next));
    return result;
}

BattleState AmmunitionProcessor::apply(BattlePhase phase,
                                       const BattleState& state,
                                       const battle::PhaseContext& ctx) const {
    const auto* unit = state.find(ctx.active_unit_id);
    if (!unit || !unit->alive) return state;

    switch (phase) {
    case BattlePhase::TurnStart: {
        BattleState s = tick_reload(unit->id, state);
        return tick_cooldowns(unit->id, s).state;
    }
    case BattlePhase::Attack: {
        if (!ctx.target_id) return state;
        if (ctx.action && ctx.action->type != battle::ActionType::Attack)
            return state;
        auto consumed = consume_ammo(unit->id, state);
        if (!consumed.success && consumed.reason) {
            spdlog::warn("ammunition: {} attacked without ammo ({})", unit->id,
                         reason_name(*consumed.reason));
        }
        return consumed.state;
    }
    case BattlePhase::TurnEnd: {
        const auto* ability = ctx.ability_id();
        if (!ability) return state;
        if (get_resource_type(*unit, state) != ResourceType::Cooldown)
            return state;
        return trigger_cooldown(unit->id, *ability, state).state;
    }
    default:
        return state;
    }
}

} // namespace tac::mechanics
