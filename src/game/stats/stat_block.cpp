/// @file stat_block.cpp
/// @brief StatBlock implementation.

#include "arc/game/stat_block.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::LogCategory;
using foundation::sanitizeFloat;
using foundation::sanitizeNonNegative;

StatBlock::StatBlock(ProgressionBalance balance) : balance_(std::move(balance)) {
    const auto& base = balance_.base;
    level_ = std::max(1, base.level);
    experience_ = sanitizeNonNegative(base.experience, 0.0f, "experience");
    experienceToNextLevel_ =
        std::max(1.0f, sanitizeNonNegative(base.experienceToNextLevel, 100.0f,
                                           "experience_to_next_level"));
    maxHealth_ = sanitizeNonNegative(base.maxHealth, 0.0f, "max_health");
    maxMana_ = sanitizeNonNegative(base.maxMana, 0.0f, "max_mana");
    health_ = maxHealth_;
    mana_ = maxMana_;
    strength_ = sanitizeNonNegative(base.strength, 0.0f, "strength");
    dexterity_ = sanitizeNonNegative(base.dexterity, 0.0f, "dexterity");
    intelligence_ = sanitizeNonNegative(base.intelligence, 0.0f, "intelligence");
    movementSpeed_ = sanitizeNonNegative(base.movementSpeed, 0.0f, "movement_speed");
    attackPower_ = sanitizeNonNegative(base.attackPower, 0.0f, "attack_power");
}

// ── Getters ─────────────────────────────────────────────────────────────

int32_t StatBlock::Level() const {
    return level_ >= 1 ? level_ : 1;
}

float StatBlock::Experience() const {
    return sanitizeNonNegative(experience_, 0.0f, "experience");
}

float StatBlock::ExperienceToNextLevel() const {
    return sanitizeNonNegative(experienceToNextLevel_, balance_.base.experienceToNextLevel,
                               "experience_to_next_level");
}

float StatBlock::Health() const {
    return sanitizeNonNegative(health_, balance_.base.maxHealth, "health");
}

float StatBlock::MaxHealth() const {
    return Get(StatKind::MaxHealth);
}

float StatBlock::Mana() const {
    return sanitizeNonNegative(mana_, balance_.base.maxMana, "mana");
}

float StatBlock::MaxMana() const {
    return Get(StatKind::MaxMana);
}

float StatBlock::Strength() const {
    return Get(StatKind::Strength);
}

float StatBlock::Dexterity() const {
    return Get(StatKind::Dexterity);
}

float StatBlock::Intelligence() const {
    return Get(StatKind::Intelligence);
}

float StatBlock::MovementSpeed() const {
    return Get(StatKind::MovementSpeed);
}

float StatBlock::AttackPower() const {
    return Get(StatKind::AttackPower);
}

float StatBlock::Get(StatKind stat) const {
    return sanitizeNonNegative(fieldFor(stat), baseFor(stat), statKindName(stat));
}

void StatBlock::Set(StatKind stat, float value) {
    float& target = fieldFor(stat);
    target = std::max(0.0f, sanitizeFloat(value, target, statKindName(stat)));
    if (stat == StatKind::MaxHealth || stat == StatKind::MaxMana) {
        clampPools();
    }
}

// ── Pools ───────────────────────────────────────────────────────────────

void StatBlock::SetHealth(float value) {
    value = sanitizeFloat(value, health_, "health");
    health_ = std::clamp(value, 0.0f, MaxHealth());
}

void StatBlock::SetMana(float value) {
    value = sanitizeFloat(value, mana_, "mana");
    mana_ = std::clamp(value, 0.0f, MaxMana());
}

float StatBlock::Heal(float amount) {
    amount = sanitizeNonNegative(amount, 0.0f, "heal amount");
    if (dead_) {
        return 0.0f;
    }
    float missing = MaxHealth() - Health();
    if (amount >= missing) {
        health_ = MaxHealth();
        return missing;
    }
    health_ += amount;
    return amount;
}

float StatBlock::RestoreMana(float amount) {
    amount = sanitizeNonNegative(amount, 0.0f, "mana amount");
    float missing = MaxMana() - Mana();
    if (amount >= missing) {
        mana_ = MaxMana();
        return missing;
    }
    mana_ += amount;
    return amount;
}

bool StatBlock::SpendMana(float amount) {
    amount = sanitizeNonNegative(amount, 0.0f, "mana cost");
    if (Mana() < amount) {
        return false;
    }
    mana_ = std::max(0.0f, Mana() - amount);
    return true;
}

// ── Progression ─────────────────────────────────────────────────────────

int32_t StatBlock::AddExperience(float amount) {
    amount = sanitizeNonNegative(amount, 0.0f, "experience award");
    experience_ = Experience() + amount;

    int32_t newLevel = 0;
    while (experience_ >= ExperienceToNextLevel()) {
        newLevel = LevelUp();
    }
    return newLevel;
}

int32_t StatBlock::LevelUp() {
    float required = ExperienceToNextLevel();
    ++level_;
    experience_ = std::max(0.0f, Experience() - required);
    experienceToNextLevel_ =
        std::max(1.0f, std::floor(required * balance_.experienceMultiplier));

    const auto& d = balance_.levelUp;
    raiseStat(StatKind::MaxHealth, d.maxHealth);
    raiseStat(StatKind::MaxMana, d.maxMana);
    raiseStat(StatKind::Strength, d.strength);
    raiseStat(StatKind::Dexterity, d.dexterity);
    raiseStat(StatKind::Intelligence, d.intelligence);
    raiseStat(StatKind::AttackPower, d.attackPower);

    health_ = MaxHealth();
    mana_ = MaxMana();

    ARC_LOG_INFO(LogCategory::Stats, "level up: " + std::to_string(level_));
    onLevelUp_.emit(level_);
    return level_;
}

void StatBlock::RegenerateResources(float deltaTime) {
    deltaTime = sanitizeNonNegative(deltaTime, 0.0f, "regen delta");
    modifiers_.Update(*this, deltaTime);
    if (dead_) {
        return;
    }
    health_ = std::min(MaxHealth(), Health() + deltaTime * balance_.healthRegenPerSecond);
    mana_ = std::min(MaxMana(), Mana() + deltaTime * balance_.manaRegenPerSecond);
}

// ── Persistence ─────────────────────────────────────────────────────────

StatSnapshot StatBlock::Snapshot() const {
    auto baseline = [this](StatKind stat) {
        return modifiers_.Baseline(stat).value_or(Get(stat));
    };

    StatSnapshot s;
    s.level = Level();
    s.experience = Experience();
    s.experienceToNextLevel = ExperienceToNextLevel();
    s.maxHealth = baseline(StatKind::MaxHealth);
    s.maxMana = baseline(StatKind::MaxMana);
    s.health = std::min(Health(), s.maxHealth);
    s.mana = std::min(Mana(), s.maxMana);
    s.strength = baseline(StatKind::Strength);
    s.dexterity = baseline(StatKind::Dexterity);
    s.intelligence = baseline(StatKind::Intelligence);
    s.movementSpeed = baseline(StatKind::MovementSpeed);
    s.attackPower = baseline(StatKind::AttackPower);
    s.isDead = dead_;
    return s;
}

void StatBlock::Restore(const StatSnapshot& s) {
    const auto& base = balance_.base;
    modifiers_ = TemporaryModifierSet{};

    if (s.level >= 1) {
        level_ = s.level;
    } else {
        ARC_LOG_WARN(LogCategory::Stats,
                     "invalid level in snapshot: " + std::to_string(s.level));
        level_ = std::max(1, base.level);
    }
    experienceToNextLevel_ = sanitizeNonNegative(s.experienceToNextLevel,
                                                 base.experienceToNextLevel,
                                                 "experience_to_next_level");
    if (experienceToNextLevel_ < 1.0f) {
        experienceToNextLevel_ = std::max(1.0f, base.experienceToNextLevel);
    }
    experience_ = sanitizeNonNegative(s.experience, 0.0f, "experience");

    maxHealth_ = sanitizeNonNegative(s.maxHealth, base.maxHealth, "max_health");
    maxMana_ = sanitizeNonNegative(s.maxMana, base.maxMana, "max_mana");
    health_ = sanitizeNonNegative(s.health, maxHealth_, "health");
    mana_ = sanitizeNonNegative(s.mana, maxMana_, "mana");
    strength_ = sanitizeNonNegative(s.strength, base.strength, "strength");
    dexterity_ = sanitizeNonNegative(s.dexterity, base.dexterity, "dexterity");
    intelligence_ = sanitizeNonNegative(s.intelligence, base.intelligence, "intelligence");
    movementSpeed_ =
        sanitizeNonNegative(s.movementSpeed, base.movementSpeed, "movement_speed");
    attackPower_ = sanitizeNonNegative(s.attackPower, base.attackPower, "attack_power");
    clampPools();

    dead_ = s.isDead;
    canMove_ = true;

    // Surplus experience from an older requirement levels up normally.
    if (experience_ >= experienceToNextLevel_) {
        AddExperience(0.0f);
    }
}

// ── Internals ───────────────────────────────────────────────────────────

float& StatBlock::fieldFor(StatKind stat) {
    switch (stat) {
        case StatKind::MaxHealth:     return maxHealth_;
        case StatKind::MaxMana:       return maxMana_;
        case StatKind::Strength:      return strength_;
        case StatKind::Dexterity:     return dexterity_;
        case StatKind::Intelligence:  return intelligence_;
        case StatKind::MovementSpeed: return movementSpeed_;
        case StatKind::AttackPower:
        case StatKind::COUNT:         break;
    }
    return attackPower_;
}

float StatBlock::fieldFor(StatKind stat) const {
    switch (stat) {
        case StatKind::MaxHealth:     return maxHealth_;
        case StatKind::MaxMana:       return maxMana_;
        case StatKind::Strength:      return strength_;
        case StatKind::Dexterity:     return dexterity_;
        case StatKind::Intelligence:  return intelligence_;
        case StatKind::MovementSpeed: return movementSpeed_;
        case StatKind::AttackPower:
        case StatKind::COUNT:         break;
    }
    return attackPower_;
}

float StatBlock::baseFor(StatKind stat) const {
    const auto& base = balance_.base;
    switch (stat) {
        case StatKind::MaxHealth:     return base.maxHealth;
        case StatKind::MaxMana:       return base.maxMana;
        case StatKind::Strength:      return base.strength;
        case StatKind::Dexterity:     return base.dexterity;
        case StatKind::Intelligence:  return base.intelligence;
        case StatKind::MovementSpeed: return base.movementSpeed;
        case StatKind::AttackPower:
        case StatKind::COUNT:         break;
    }
    return base.attackPower;
}

void StatBlock::raiseStat(StatKind stat, float delta) {
    if (delta != 0.0f) {
        modifiers_.ShiftBaseline(*this, stat, delta);
    }
}

void StatBlock::clampPools() {
    health_ = std::min(health_, maxHealth_);
    mana_ = std::min(mana_, maxMana_);
}

} // namespace arc::game
