/// @file player_character.cpp
/// @brief PlayerCharacter implementation.

#include "arc/game/player_character.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::SkillId;

PlayerCharacter::PlayerCharacter(const BalanceConfig& balance, SkillCatalog& catalog,
                                 PlayerProgressionStore& store,
                                 const ITargetingCollaborator& targeting,
                                 IRenderingCollaborator* rendering,
                                 INotificationCollaborator* notifier, RandomSource random)
    : balance_(balance),
      store_(store),
      notifier_(notifier),
      stats_(balance.progression),
      status_(stats_, balance.status, random, rendering),
      combo_(balance.combo),
      skills_(catalog, balance.targeting, targeting, rendering, notifier),
      combat_(balance.combat, balance.progression, random) {
    status_.SetDamageHandler([this](StatusKind, float damage) {
        combat_.TakeDamage(stats_, equipment_, damage);
    });
    stats_.OnLevelUp().connect([this](int32_t level) { grantLevelRewards(level); });
    combat_.OnDeath().connect([this] { onDeath(); });
}

// ── Tick ────────────────────────────────────────────────────────────────

void PlayerCharacter::Update(float deltaTime) {
    deltaTime = foundation::sanitizeNonNegative(deltaTime, 0.0f, "character delta");

    // Picks up gear changed through Equipment() directly.
    syncEquipmentStats();
    status_.Update(deltaTime);
    stats_.RegenerateResources(deltaTime);
    combo_.Update(deltaTime);
    skills_.Update(deltaTime, position_);

    stats_.Flags().isUsingSkill = skills_.Count() > 0;
}

// ── Actions ─────────────────────────────────────────────────────────────

GameResult<PunchResult> PlayerCharacter::Punch(TargetHealth& target) {
    if (stats_.IsDead()) {
        return GameResult<PunchResult>::err(
            GameError(ErrorCode::CharacterDead, "dead characters cannot punch"));
    }

    auto step = combo_.TryPunch();
    if (!step) {
        return GameResult<PunchResult>::err(step.error());
    }

    PunchResult result;
    result.step = step.value();
    result.damage = combat_.ComputePunchDamage(stats_, equipment_, result.step);

    bool wasDead = target.dead;
    result.applied = combat_.ResolveHit(stats_, target, result.damage.amount);
    result.killed = !wasDead && target.dead;

    stats_.Flags().isAttacking = true;
    return GameResult<PunchResult>::ok(result);
}

CastResult PlayerCharacter::CastSkill(SkillId id) {
    const auto* def = skills_.Catalog().Find(id);
    if (def == nullptr || !store_.IsSelected(id)) {
        ARC_LOG_DEBUG(LogCategory::Skill,
                      "skill " + std::to_string(id.value()) + " is not in the loadout");
        return CastResult::err(CastError::InvalidSkillId);
    }

    auto variant = store_.Variant(id);
    if (def->IsPrimary()) {
        return skills_.CastPrimaryAttack(id, stats_, position_, facing_, variant);
    }
    return skills_.Cast(id, stats_, position_, facing_, variant);
}

float PlayerCharacter::TakeDamage(float rawDamage) {
    return combat_.TakeDamage(stats_, equipment_, rawDamage);
}

bool PlayerCharacter::Revive() {
    return combat_.Revive(stats_);
}

int32_t PlayerCharacter::AwardExperience(float amount) {
    float multiplier = 1.0f;
    if (const auto* tier = balance_.GetWorldTier(store_.WorldTier())) {
        multiplier = tier->experienceMultiplier;
    }
    return combat_.AwardExperience(stats_, amount * multiplier);
}

void PlayerCharacter::Collect(const LootDrop& drop) {
    if (drop.IsGold()) {
        inventory_.AddGold(drop.item.amount);
        return;
    }
    inventory_.Add(drop.item);
}

GameResult<void> PlayerCharacter::Equip(std::string_view itemName) {
    auto result = equipment_.EquipFromInventory(itemName, inventory_);
    if (result) {
        syncEquipmentStats();
    }
    return result;
}

GameResult<void> PlayerCharacter::Unequip(EquipSlot slot) {
    auto result = equipment_.UnequipToInventory(slot, inventory_);
    if (result) {
        syncEquipmentStats();
    }
    return result;
}

float PlayerCharacter::EffectiveMovementSpeed() const {
    if (!stats_.CanMove() || stats_.IsDead()) {
        return 0.0f;
    }
    return stats_.MovementSpeed() + equipment_.Bonuses().movementSpeed;
}

// ── Persistence ─────────────────────────────────────────────────────────

StatSnapshot PlayerCharacter::Snapshot() const {
    auto snapshot = stats_.Snapshot();
    snapshot.maxHealth = std::max(0.0f, snapshot.maxHealth - appliedGear_.maxHealth);
    snapshot.maxMana = std::max(0.0f, snapshot.maxMana - appliedGear_.maxMana);
    snapshot.dexterity = std::max(0.0f, snapshot.dexterity - appliedGear_.dexterity);
    snapshot.intelligence = std::max(0.0f, snapshot.intelligence - appliedGear_.intelligence);
    snapshot.health = std::min(snapshot.health, snapshot.maxHealth);
    snapshot.mana = std::min(snapshot.mana, snapshot.maxMana);
    return snapshot;
}

void PlayerCharacter::SaveStats() {
    store_.SaveStats(Snapshot());
}

GameResult<void> PlayerCharacter::LoadStats() {
    auto loaded = store_.LoadStats(stats_);
    if (!loaded) {
        return loaded;
    }
    // The saved stats carry no gear; apply the current loadout afresh.
    appliedGear_ = StatBonuses{};
    syncEquipmentStats();
    return loaded;
}

// ── Reactions ───────────────────────────────────────────────────────────

void PlayerCharacter::grantLevelRewards(int32_t level) {
    const auto& rewards = balance_.rewards;
    statPoints_ += rewards.statPointsPerLevel;
    skillPoints_ += rewards.skillPointsPerLevel;

    int64_t gold = rewards.goldPerLevel;
    if (auto milestone = balance_.GetMilestone(level)) {
        statPoints_ += milestone->statPoints;
        skillPoints_ += milestone->skillPoints;
        gold += milestone->gold;
        if (notifier_ != nullptr) {
            notifier_->Notify(milestone->description);
        }
    }
    inventory_.AddGold(gold);

    if (notifier_ != nullptr) {
        notifier_->Notify("Level up! You are now level " + std::to_string(level));
    }
}

void PlayerCharacter::onDeath() {
    status_.Clear();
    // Clearing a stun restores movement; the dead stay put.
    stats_.SetCanMove(false);
    skills_.Clear();
    combo_.Reset();
    if (notifier_ != nullptr) {
        notifier_->Notify("You have died");
    }
}

void PlayerCharacter::syncEquipmentStats() {
    const auto& gear = equipment_.Bonuses();
    auto& modifiers = stats_.Modifiers();
    auto shift = [&](StatKind stat, float target, float& applied) {
        if (target == applied) {
            return;
        }
        modifiers.ShiftBaseline(stats_, stat, target - applied);
        applied = target;
    };
    shift(StatKind::MaxHealth, gear.maxHealth, appliedGear_.maxHealth);
    shift(StatKind::MaxMana, gear.maxMana, appliedGear_.maxMana);
    shift(StatKind::Dexterity, gear.dexterity, appliedGear_.dexterity);
    shift(StatKind::Intelligence, gear.intelligence, appliedGear_.intelligence);
}

} // namespace arc::game
