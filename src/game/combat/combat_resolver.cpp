/// @file combat_resolver.cpp
/// @brief CombatResolver implementation.

#include "arc/game/combat_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::LogCategory;

namespace {

float clampReduction(float reduction) {
    return std::clamp(foundation::sanitizeNonNegative(reduction, 0.0f, "damage reduction"),
                      0.0f, 1.0f);
}

} // namespace

CombatResolver::CombatResolver(CombatBalance combat, ProgressionBalance progression,
                               RandomSource random)
    : combat_(combat), progression_(std::move(progression)), random_(std::move(random)) {}

// ── Damage ──────────────────────────────────────────────────────────────

float CombatResolver::ResolveHit(const StatBlock& attacker, TargetHealth& target,
                                 float rawDamage) {
    if (attacker.IsDead() || target.dead) {
        return 0.0f;
    }

    float raw = foundation::sanitizeNonNegative(rawDamage, 0.0f, "hit damage");
    float applied = raw * (1.0f - clampReduction(target.damageReduction));

    float health = foundation::sanitizeNonNegative(target.health, 0.0f, "target health");
    target.health = std::max(0.0f, health - applied);

    if (target.health <= 0.0f) {
        target.dead = true;
        ARC_LOG_DEBUG(LogCategory::Combat, "target killed");
        onTargetKilled_.emit(target);
    }
    return applied;
}

float CombatResolver::TakeDamage(StatBlock& defender, const EquipmentSet& equipment,
                                 float rawDamage) {
    if (defender.IsDead()) {
        return 0.0f;
    }

    float raw = foundation::sanitizeNonNegative(rawDamage, 0.0f, "incoming damage");
    float actual = raw * (1.0f - clampReduction(equipment.DamageReduction()));

    defender.SetHealth(defender.Health() - actual);
    if (defender.Health() <= 0.0f) {
        die(defender);
    }
    return actual;
}

void CombatResolver::die(StatBlock& character) {
    character.SetDead(true);
    character.SetCanMove(false);

    auto& flags = character.Flags();
    flags.isMoving = false;
    flags.isAttacking = false;
    flags.isUsingSkill = false;

    ARC_LOG_INFO(LogCategory::Combat,
                 "character died at level " + std::to_string(character.Level()));
    onDeath_.emit();
}

bool CombatResolver::Revive(StatBlock& character) {
    if (!character.IsDead()) {
        return false;
    }

    float fraction = std::clamp(
        foundation::sanitizeNonNegative(progression_.reviveFraction, 0.75f, "revive fraction"),
        0.0f, 1.0f);

    character.SetDead(false);
    character.SetCanMove(true);
    character.SetHealth(character.MaxHealth() * fraction);
    character.SetMana(character.MaxMana() * fraction);

    ARC_LOG_INFO(LogCategory::Combat, "character revived");
    onRevive_.emit();
    return true;
}

int32_t CombatResolver::AwardExperience(StatBlock& character, float amount) {
    if (character.IsDead()) {
        return 0;
    }
    return character.AddExperience(
        foundation::sanitizeNonNegative(amount, 0.0f, "experience award"));
}

// ── Punch ───────────────────────────────────────────────────────────────

PunchDamage CombatResolver::ComputePunchDamage(const StatBlock& attacker,
                                               const EquipmentSet& equipment,
                                               const PunchStep& step) const {
    PunchDamage result;
    result.knockback = step.isFinisher;
    if (attacker.IsDead()) {
        return result;
    }

    const auto& bonuses = equipment.Bonuses();
    float power = attacker.AttackPower() + bonuses.attackPower;
    float strength = attacker.Strength() + bonuses.strength;
    float levelBonus = static_cast<float>(attacker.Level() - 1) * combat_.attackPowerPerLevel;

    float base = power + strength * combat_.strengthContribution + levelBonus +
                 equipment.WeaponDamage();
    float multiplier = foundation::sanitizeNonNegative(step.multiplier, 1.0f, "combo multiplier");

    // Uniform in [1 - variation, 1 + variation).
    float variation = 1.0f + (random_() * 2.0f - 1.0f) * combat_.damageVariation;
    float amount = base * multiplier * variation;

    if (RollCritical()) {
        amount *= combat_.critMultiplier;
        result.critical = true;
    }

    result.amount = std::max(0.0f, std::round(amount));
    return result;
}

bool CombatResolver::RollCritical() const {
    return random_() < combat_.baseCritChance;
}

} // namespace arc::game
