#pragma once

/// @file combat_resolver.hpp
/// @brief CombatResolver: damage, experience and death/revive transitions.

#include <cstdint>

#include "arc/foundation/signal.hpp"
#include "arc/game/balance_config.hpp"
#include "arc/game/combo_punch_controller.hpp"
#include "arc/game/equipment_set.hpp"
#include "arc/game/random_source.hpp"
#include "arc/game/stat_block.hpp"

namespace arc::game {

/// Health of a hit target that is not a full character (an enemy owned by
/// the host). Hit detection happens outside the core; only the numbers
/// pass through here.
struct TargetHealth {
    float health = 0.0f;
    float maxHealth = 0.0f;
    float damageReduction = 0.0f;  ///< Fraction in [0, 1].
    bool dead = false;
};

/// Damage a single punch deals before the target's reduction.
struct PunchDamage {
    float amount = 0.0f;
    bool critical = false;
    bool knockback = false;
};

/// Stateless combat arithmetic plus the death and revive signals of one
/// character.
///
/// Example:
/// @code
///   CombatResolver combat(balance.combat, balance.progression, makeRandomSource());
///   combat.OnDeath().connect([] { showDeathScreen(); });
///   float taken = combat.TakeDamage(stats, equipment, 100.0f);
/// @endcode
class CombatResolver {
public:
    CombatResolver(CombatBalance combat, ProgressionBalance progression, RandomSource random);

    /// Apply an attacker's hit to a target.
    ///
    /// The target's damage reduction is applied, health is clamped at zero
    /// and the target is marked dead (OnTargetKilled fires once) when it
    /// reaches zero.
    /// @return Damage after reduction; 0 when either side is already dead.
    float ResolveHit(const StatBlock& attacker, TargetHealth& target, float rawDamage);

    /// Apply incoming damage to a character, reduced by its armor.
    ///
    /// Health is clamped at zero; reaching zero triggers the death
    /// transition exactly once.
    /// @return Damage after reduction; 0 when already dead.
    float TakeDamage(StatBlock& defender, const EquipmentSet& equipment, float rawDamage);

    /// Bring a dead character back with a fraction of health and mana.
    /// @return false when the character was not dead.
    bool Revive(StatBlock& character);

    /// Grant experience for a kill.
    /// @return The new level, or 0 when no level was gained.
    int32_t AwardExperience(StatBlock& character, float amount);

    /// Damage of one combo punch, with variation and a critical roll.
    [[nodiscard]] PunchDamage ComputePunchDamage(const StatBlock& attacker,
                                                 const EquipmentSet& equipment,
                                                 const PunchStep& step) const;

    /// Critical strike trial at the base crit chance.
    [[nodiscard]] bool RollCritical() const;

    [[nodiscard]] foundation::Signal<>& OnDeath() noexcept { return onDeath_; }
    [[nodiscard]] foundation::Signal<>& OnRevive() noexcept { return onRevive_; }
    [[nodiscard]] foundation::Signal<const TargetHealth&>& OnTargetKilled() noexcept {
        return onTargetKilled_;
    }

    [[nodiscard]] const CombatBalance& Balance() const noexcept { return combat_; }

private:
    void die(StatBlock& character);

    CombatBalance combat_;
    ProgressionBalance progression_;
    RandomSource random_;

    foundation::Signal<> onDeath_;
    foundation::Signal<> onRevive_;
    foundation::Signal<const TargetHealth&> onTargetKilled_;
};

} // namespace arc::game
