#include "mechanics/mechanics_engine.hpp"
#include "mechanics/ammunition.hpp"
#include "mechanics/charge.hpp"
#include "mechanics/intercept.hpp"
#include "mechanics/line_of_sight.hpp"
#include "mechanics/overwatch.hpp"
#include "mechanics/phalanx.hpp"

#include <spdlog/spdlog.h>

namespace tac::mechanics {

using battle::BattlePhase;
using battle::BattleState;
using battle::LosComponent;

Result<MechanicsEngine> MechanicsEngine::create(const MechanicsConfig& config) {
    MechanicsConfig resolved = resolve_dependencies(config);
    auto errors = validate(resolved);
    if (!errors.empty()) {
        std::string message = "Invalid mechanics config:";
        for (const auto& e : errors) {
            message += "\n  " + e.message;
        }
        return Error(std::move(message));
    }
    return MechanicsEngine(resolved);
}

MechanicsEngine::MechanicsEngine(const MechanicsConfig& config) : config_(config) {
    // Construction order doubles as wiring order: every query a processor
    // receives is built before it.
    if (config_.ammunition.enabled) {
        ammunition_ = std::make_unique<AmmunitionProcessor>(config_.ammunition);
        pipeline_.push_back(ammunition_.get());
    }
    if (config_.intercept.enabled) {
        intercept_ = std::make_unique<InterceptProcessor>(config_.intercept);
        pipeline_.push_back(intercept_.get());
    }
    if (config_.charge.enabled) {
        charge_ = std::make_unique<ChargeProcessor>(config_.charge, intercept_.get());
        pipeline_.push_back(charge_.get());
    }
    if (config_.phalanx.enabled) {
        phalanx_ = std::make_unique<PhalanxProcessor>(config_.phalanx);
        pipeline_.push_back(phalanx_.get());
    }
    if (config_.line_of_sight.enabled) {
        line_of_sight_ = std::make_unique<LineOfSightProcessor>(
            config_.line_of_sight, ammunition_.get());
        pipeline_.push_back(line_of_sight_.get());
    }
    if (config_.overwatch.enabled) {
        overwatch_ = std::make_unique<OverwatchProcessor>(
            config_.overwatch, ammunition_.get(), intercept_.get());
        pipeline_.push_back(overwatch_.get());
    }

    if (pipeline_.empty()) {
        spdlog::info("Mechanics: none enabled");
    } else {
        std::string names;
        for (const auto* p : pipeline_) {
            if (!names.empty()) names += ", ";
            names += p->name();
        }
        spdlog::info("Mechanics: {}", names);
    }
}

MechanicsEngine::~MechanicsEngine() = default;
MechanicsEngine::MechanicsEngine(MechanicsEngine&&) noexcept = default;
MechanicsEngine& MechanicsEngine::operator=(MechanicsEngine&&) noexcept = default;

std::vector<std::string> MechanicsEngine::processor_names() const {
    std::vector<std::string> names;
    for (const auto* p : pipeline_) names.emplace_back(p->name());
    return names;
}

BattleState MechanicsEngine::initialize_battle(const BattleState& state) const {
    BattleState s = state;
    for (const auto* p : pipeline_) {
        s = p->initialize(s);
    }
    return s;
}

BattleState MechanicsEngine::apply(BattlePhase phase, const BattleState& state,
                                   const battle::PhaseContext& ctx) const {
    BattleState s = state;
    for (const auto* p : pipeline_) {
        s = p->apply(phase, s, ctx);
    }
    return s;
}

bool MechanicsEngine::attack_permitted(const BattleState& state,
                                       const battle::UnitId& attacker,
                                       const battle::UnitId& /*target*/) const {
    if (ammunition_ && !ammunition_->check_ammo(attacker, state).can_attack) {
        return false;
    }
    if (line_of_sight_) {
        const auto* c = state.component<LosComponent>(attacker);
        if (c && c->fire_mode == battle::FireMode::Blocked) return false;
    }
    return true;
}

f64 MechanicsEngine::accuracy_modifier(const BattleState& state,
                                       const battle::UnitId& attacker) const {
    if (!line_of_sight_) return 1.0;
    const auto* c = state.component<LosComponent>(attacker);
    if (!c || !c->fire_mode) return 1.0;
    LosCheck los;
    los.recommended_mode = *c->fire_mode;
    return line_of_sight_->accuracy_modifier(los);
}

i32 MechanicsEngine::attack_damage(const BattleState& state,
                                   const battle::UnitId& attacker,
                                   const battle::BattleUnit& target,
                                   i32 base_damage) const {
    if (!charge_) return base_damage;
    return charge_->charge_damage(attacker, target, base_damage, state);
}

i32 MechanicsEngine::effective_armor(const BattleState& state,
                                     const battle::BattleUnit& unit) const {
    if (!phalanx_) return unit.stats.armor;
    return phalanx_->get_effective_armor(unit, state);
}

} // namespace tac::mechanics
