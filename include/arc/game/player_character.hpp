#pragma once

/// @file player_character.hpp
/// @brief PlayerCharacter: one character's combat components and their
///        per-tick update order.

#include <cstdint>
#include <string_view>

#include "arc/foundation/game_result.hpp"
#include "arc/game/active_skill_set.hpp"
#include "arc/game/balance_config.hpp"
#include "arc/game/collaborators.hpp"
#include "arc/game/combat_resolver.hpp"
#include "arc/game/combo_punch_controller.hpp"
#include "arc/game/equipment_set.hpp"
#include "arc/game/inventory.hpp"
#include "arc/game/loot_roller.hpp"
#include "arc/game/math_types.hpp"
#include "arc/game/progression_store.hpp"
#include "arc/game/random_source.hpp"
#include "arc/game/stat_block.hpp"
#include "arc/game/status_effect_tracker.hpp"

namespace arc::game {

/// Outcome of one landed punch.
struct PunchResult {
    PunchStep step;
    PunchDamage damage;
    float applied = 0.0f;  ///< Damage after the target's reduction.
    bool killed = false;   ///< This punch brought the target to zero.
};

/// Owns every combat component of one character.
///
/// Update() advances them in a fixed order so that an effect expiring this
/// tick never leaks into the same tick's numbers:
///   status effects -> temporary modifiers -> regeneration -> combo timers
///   -> skill instances and cooldowns.
///
/// Equipped maximum health, maximum mana, dexterity and intelligence are
/// folded into the StatBlock baselines, so Stats() reports effective values.
/// Snapshot() strips them again for saving. The remaining bonuses are read
/// from the EquipmentSet when they are used.
///
/// Level-up rewards (stat points, skill points, gold and milestone bonuses)
/// are granted from the BalanceConfig reward table.
///
/// Example:
/// @code
///   PlayerCharacter hero(balance, catalog, store, targeting, &renderer, &hud);
///   hero.CastSkill(skill_ids::kWaveOfLight);
///   hero.Update(1.0f / 60.0f);
/// @endcode
class PlayerCharacter {
public:
    PlayerCharacter(const BalanceConfig& balance, SkillCatalog& catalog,
                    PlayerProgressionStore& store, const ITargetingCollaborator& targeting,
                    IRenderingCollaborator* rendering = nullptr,
                    INotificationCollaborator* notifier = nullptr,
                    RandomSource random = makeRandomSource());

    PlayerCharacter(const PlayerCharacter&) = delete;
    PlayerCharacter& operator=(const PlayerCharacter&) = delete;

    void Update(float deltaTime);

    // ── Actions ─────────────────────────────────────────────────────────

    /// Throw a combo punch at a target already hit-tested by the host.
    /// @return The punch, or CharacterDead / ComboOnCooldown.
    foundation::GameResult<PunchResult> Punch(TargetHealth& target);

    /// Cast a skill from the battle loadout. Primary attacks go through the
    /// primary-attack rules.
    /// @return InvalidSkillId for a skill outside the loadout, otherwise the
    ///         cast result.
    CastResult CastSkill(foundation::SkillId id);

    /// Incoming damage, reduced by armor.
    float TakeDamage(float rawDamage);

    bool Revive();

    /// Grant kill experience scaled by the current world tier.
    /// @return The new level, or 0.
    int32_t AwardExperience(float amount);

    /// Put a rolled drop into the bag (gold goes to the purse).
    void Collect(const LootDrop& drop);

    /// Equip the named item from the bag.
    foundation::GameResult<void> Equip(std::string_view itemName);

    /// Move an equipped item back into the bag.
    foundation::GameResult<void> Unequip(EquipSlot slot);

    // ── Persistence ─────────────────────────────────────────────────────

    /// Stats without the equipped bonuses.
    [[nodiscard]] StatSnapshot Snapshot() const;

    void SaveStats();

    /// Restore saved stats and re-apply the equipped bonuses on top.
    /// @return RecordNotFound when nothing was saved, or the decode error.
    foundation::GameResult<void> LoadStats();

    // ── Movement ────────────────────────────────────────────────────────

    [[nodiscard]] const Vector3& Position() const noexcept { return position_; }
    void SetPosition(const Vector3& position) noexcept { position_ = position; }

    [[nodiscard]] const Vector3& Facing() const noexcept { return facing_; }
    void SetFacing(const Vector3& facing) noexcept { facing_ = facing; }

    /// Movement speed including equipment; 0 while unable to move.
    [[nodiscard]] float EffectiveMovementSpeed() const;

    // ── Components ──────────────────────────────────────────────────────

    [[nodiscard]] StatBlock& Stats() noexcept { return stats_; }
    [[nodiscard]] const StatBlock& Stats() const noexcept { return stats_; }
    [[nodiscard]] StatusEffectTracker& Status() noexcept { return status_; }
    [[nodiscard]] EquipmentSet& Equipment() noexcept { return equipment_; }
    [[nodiscard]] Inventory& Bag() noexcept { return inventory_; }
    [[nodiscard]] const Inventory& Bag() const noexcept { return inventory_; }
    [[nodiscard]] ComboPunchController& Combo() noexcept { return combo_; }
    [[nodiscard]] ActiveSkillInstanceSet& Skills() noexcept { return skills_; }
    [[nodiscard]] CombatResolver& Combat() noexcept { return combat_; }
    [[nodiscard]] PlayerProgressionStore& Progression() noexcept { return store_; }

    [[nodiscard]] int32_t UnspentStatPoints() const noexcept { return statPoints_; }
    [[nodiscard]] int32_t UnspentSkillPoints() const noexcept { return skillPoints_; }

private:
    void grantLevelRewards(int32_t level);
    void onDeath();
    void syncEquipmentStats();

    const BalanceConfig& balance_;
    PlayerProgressionStore& store_;
    INotificationCollaborator* notifier_;

    StatBlock stats_;
    StatusEffectTracker status_;
    EquipmentSet equipment_;
    Inventory inventory_;
    ComboPunchController combo_;
    ActiveSkillInstanceSet skills_;
    CombatResolver combat_;

    Vector3 position_;
    Vector3 facing_ = Vector3::Forward();

    StatBonuses appliedGear_;  ///< Bonuses currently folded into stats_.

    int32_t statPoints_ = 0;
    int32_t skillPoints_ = 0;
};

} // namespace arc::game
