#pragma once

/// @file stat_block.hpp
/// @brief StatBlock: a character's health, mana, level and attributes.
///
/// Every setter and getter passes through the numeric guard: a NaN or
/// infinite input never reaches a field. Setters keep the field's previous
/// value when handed a non-finite number; getters fall back to the base
/// stat from ProgressionBalance should a field ever hold one.

#include <cstdint>

#include "arc/foundation/game_serializer.hpp"
#include "arc/foundation/signal.hpp"
#include "arc/game/balance_config.hpp"
#include "arc/game/stat_types.hpp"
#include "arc/game/temporary_modifier_set.hpp"

namespace arc::game {

/// Persisted form of a StatBlock.
///
/// Boosted stats are stored at their baseline so transient buffs are never
/// written to disk.
struct StatSnapshot {
    int32_t level = 1;
    float experience = 0.0f;
    float experienceToNextLevel = 100.0f;
    float health = 0.0f;
    float maxHealth = 0.0f;
    float mana = 0.0f;
    float maxMana = 0.0f;
    float strength = 0.0f;
    float dexterity = 0.0f;
    float intelligence = 0.0f;
    float movementSpeed = 0.0f;
    float attackPower = 0.0f;
    bool isDead = false;
};

/// Numeric state of one character.
///
/// Invariants after every public call:
///   0 <= health <= maxHealth, 0 <= mana <= maxMana,
///   level >= 1, 0 <= experience < experienceToNextLevel.
///
/// Example:
/// @code
///   StatBlock stats(BalanceConfig::Defaults().progression);
///   stats.OnLevelUp().connect([](int32_t level) { ... });
///   stats.AddExperience(250.0f);   // 1 -> 2 -> 3
///   stats.Modifiers().AddBoost(stats, StatKind::MovementSpeed, 0.5f, 2.0f);
/// @endcode
class StatBlock {
public:
    explicit StatBlock(ProgressionBalance balance = {});

    // ── Getters ─────────────────────────────────────────────────────────

    [[nodiscard]] int32_t Level() const;
    [[nodiscard]] float Experience() const;
    [[nodiscard]] float ExperienceToNextLevel() const;
    [[nodiscard]] float Health() const;
    [[nodiscard]] float MaxHealth() const;
    [[nodiscard]] float Mana() const;
    [[nodiscard]] float MaxMana() const;
    [[nodiscard]] float Strength() const;
    [[nodiscard]] float Dexterity() const;
    [[nodiscard]] float Intelligence() const;
    [[nodiscard]] float MovementSpeed() const;
    [[nodiscard]] float AttackPower() const;

    /// Value of an adjustable stat.
    [[nodiscard]] float Get(StatKind stat) const;

    /// Overwrite an adjustable stat. Values are floored at zero; lowering a
    /// maximum clamps the matching pool.
    void Set(StatKind stat, float value);

    // ── Pools ───────────────────────────────────────────────────────────

    /// Clamp to [0, maxHealth].
    void SetHealth(float value);

    /// Clamp to [0, maxMana].
    void SetMana(float value);

    /// Add health up to the maximum.
    /// @return The amount actually restored (0 while dead).
    float Heal(float amount);

    /// Add mana up to the maximum.
    /// @return The amount actually restored.
    float RestoreMana(float amount);

    /// Deduct mana when at least amount is available.
    /// @return false (mana untouched) when there is not enough.
    bool SpendMana(float amount);

    // ── Progression ─────────────────────────────────────────────────────

    /// Grant experience, levelling up as many times as it covers.
    /// @return The new level, or 0 when no level was gained.
    int32_t AddExperience(float amount);

    /// Advance one level: carry surplus experience over, scale the
    /// requirement, apply the level-up deltas and refill both pools.
    /// @return The new level.
    int32_t LevelUp();

    /// Age temporary modifiers, then regenerate health and mana for
    /// deltaTime seconds. Regeneration is skipped while dead.
    void RegenerateResources(float deltaTime);

    [[nodiscard]] TemporaryModifierSet& Modifiers() noexcept { return modifiers_; }
    [[nodiscard]] const TemporaryModifierSet& Modifiers() const noexcept { return modifiers_; }

    // ── State ───────────────────────────────────────────────────────────

    [[nodiscard]] bool IsDead() const noexcept { return dead_; }
    void SetDead(bool dead) noexcept { dead_ = dead; }

    [[nodiscard]] bool CanMove() const noexcept { return canMove_; }
    void SetCanMove(bool canMove) noexcept { canMove_ = canMove; }

    [[nodiscard]] CharacterFlags& Flags() noexcept { return flags_; }
    [[nodiscard]] const CharacterFlags& Flags() const noexcept { return flags_; }

    /// Fired once per level gained, with the new level.
    [[nodiscard]] foundation::Signal<int32_t>& OnLevelUp() noexcept { return onLevelUp_; }

    [[nodiscard]] const ProgressionBalance& Balance() const noexcept { return balance_; }

    // ── Persistence ─────────────────────────────────────────────────────

    [[nodiscard]] StatSnapshot Snapshot() const;

    /// Replace every field from a snapshot. Active modifiers are dropped;
    /// invalid fields fall back to the base stats.
    void Restore(const StatSnapshot& snapshot);

private:
    float& fieldFor(StatKind stat);
    [[nodiscard]] float fieldFor(StatKind stat) const;
    [[nodiscard]] float baseFor(StatKind stat) const;
    void raiseStat(StatKind stat, float delta);
    void clampPools();

    ProgressionBalance balance_;

    int32_t level_ = 1;
    float experience_ = 0.0f;
    float experienceToNextLevel_ = 100.0f;
    float health_ = 0.0f;
    float maxHealth_ = 0.0f;
    float mana_ = 0.0f;
    float maxMana_ = 0.0f;
    float strength_ = 0.0f;
    float dexterity_ = 0.0f;
    float intelligence_ = 0.0f;
    float movementSpeed_ = 0.0f;
    float attackPower_ = 0.0f;

    bool dead_ = false;
    bool canMove_ = true;
    CharacterFlags flags_;

    TemporaryModifierSet modifiers_;
    foundation::Signal<int32_t> onLevelUp_;
};

} // namespace arc::game

ARC_SERIALIZABLE(arc::game::StatSnapshot, 1,
    field("level", &arc::game::StatSnapshot::level),
    field("experience", &arc::game::StatSnapshot::experience),
    field("experienceToNextLevel", &arc::game::StatSnapshot::experienceToNextLevel),
    field("health", &arc::game::StatSnapshot::health),
    field("maxHealth", &arc::game::StatSnapshot::maxHealth),
    field("mana", &arc::game::StatSnapshot::mana),
    field("maxMana", &arc::game::StatSnapshot::maxMana),
    field("strength", &arc::game::StatSnapshot::strength),
    field("dexterity", &arc::game::StatSnapshot::dexterity),
    field("intelligence", &arc::game::StatSnapshot::intelligence),
    field("movementSpeed", &arc::game::StatSnapshot::movementSpeed),
    field("attackPower", &arc::game::StatSnapshot::attackPower),
    field("isDead", &arc::game::StatSnapshot::isDead)
);
