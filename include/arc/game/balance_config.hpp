#pragma once

/// @file balance_config.hpp
/// @brief BalanceConfig: static tables every other module reads.
///
/// Defaults() returns the shipped balance. ApplyOverrides() overlays values
/// from a ConfigManager (YAML) and is all-or-nothing: on the first invalid
/// value the config is left untouched and the error names the key.

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "arc/foundation/config_manager.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/game/balance_types.hpp"
#include "arc/game/equipment_types.hpp"

namespace arc::game {

// ── Player progression ─────────────────────────────────────────────────────

/// Stats of a freshly spawned character.
struct PlayerBaseStats {
    int32_t level = 1;
    float experience = 0.0f;
    float experienceToNextLevel = 100.0f;
    float maxHealth = 500.0f;
    float maxMana = 200.0f;
    float strength = 10.0f;
    float dexterity = 10.0f;
    float intelligence = 10.0f;
    float movementSpeed = 15.0f;
    float attackPower = 10.0f;
};

/// Flat increases applied on each level-up.
struct LevelUpDeltas {
    float maxHealth = 10.0f;
    float maxMana = 5.0f;
    float strength = 1.0f;
    float dexterity = 1.0f;
    float intelligence = 1.0f;
    float attackPower = 2.0f;
};

struct ProgressionBalance {
    PlayerBaseStats base;
    LevelUpDeltas levelUp;
    float experienceMultiplier = 1.5f;
    float healthRegenPerSecond = 2.0f;
    float manaRegenPerSecond = 5.0f;
    float reviveFraction = 0.75f;
};

// ── Combat ─────────────────────────────────────────────────────────────────

struct ComboBalance {
    std::vector<float> multipliers{1.0f, 1.1f, 1.3f, 1.8f};
    float cooldownSeconds = 0.5f;
    float windowSeconds = 1.5f;
    float range = 2.0f;
    float knockbackDistance = 3.0f;   ///< Applied by the final combo step.
    float knockbackDuration = 0.3f;
};

struct CombatBalance {
    float baseCritChance = 0.05f;
    float critMultiplier = 1.5f;
    float damageVariation = 0.1f;      ///< Punch damage varies by +/- this fraction.
    float attackPowerPerLevel = 2.0f;  ///< Punch bonus per level above 1.
    float strengthContribution = 0.5f;
};

struct StatusBalance {
    DotMode dotMode = DotMode::Stochastic;
    float dotTicksPerSecond = 2.0f;
    float defaultSlowIntensity = 0.3f;
    float burnTickDamage = 5.0f;
    float poisonTickDamage = 3.0f;
};

struct TargetingBalance {
    float defaultSweepRange = 15.0f;   ///< Used when a skill has no range.
    float meleeRange = 3.0f;
    float minTeleportRange = 4.0f;
    float teleportStopDistance = 1.5f; ///< Teleports stop this short of the target.
};

// ── Enemies and world ──────────────────────────────────────────────────────

struct RankMultipliers {
    float health = 1.0f;
    float damage = 1.0f;
};

struct EnemyScalingBalance {
    float healthMultiplier = 2.5f;
    float damageMultiplier = 1.0f;
    float experienceMultiplier = 1.0f;
    float levelScalingFactor = 0.1f;
    std::array<RankMultipliers, kEnemyRankCount> ranks{};
    std::array<float, kZoneCount> zones{};
};

struct DifficultyCurve {
    std::string name;
    int32_t enemyLevelOffset = 0;
    float damageMultiplier = 1.0f;
    float healthMultiplier = 1.0f;
    float experienceMultiplier = 1.0f;
    float itemQualityMultiplier = 1.0f;
    float dropRateMultiplier = 1.0f;
    float affixChanceMultiplier = 1.0f;
    float specialAbilityChanceMultiplier = 1.0f;
    bool guaranteedRareAffix = false;
};

struct WorldTier {
    int32_t tier = 1;
    std::string name;
    float difficultyMultiplier = 1.0f;
    float itemQualityMultiplier = 1.0f;
    float itemQuantityMultiplier = 1.0f;
    float experienceMultiplier = 1.0f;
    float goldMultiplier = 1.0f;
    bool guaranteedLegendary = false;
};

struct EnemyTemplate {
    std::string id;
    std::string name;
    float health = 0.0f;
    float damage = 0.0f;
    float speed = 0.0f;
    float attackRange = 0.0f;
    float experience = 0.0f;
    Zone zone = Zone::Forest;
    bool isBoss = false;
};

// ── Loot ───────────────────────────────────────────────────────────────────

struct RarityEntry {
    float statMultiplier = 1.0f;
    float baseDropChancePercent = 0.0f;
    float levelInfluencePercent = 0.0f;  ///< Percentage points per player level.
    int32_t minLevel = 1;
};

struct DropChances {
    float boss = 1.0f;
    float normal = 0.001f;
};

/// One weighted row of a drop table. Ranges are inclusive.
struct LootEntry {
    std::string name;
    ItemCategory category = ItemCategory::Consumable;
    std::optional<EquipSlot> slot;
    ItemRarity rarity = ItemRarity::Common;
    int32_t minAmount = 1;
    int32_t maxAmount = 1;
    float minDamage = 0.0f;
    float maxDamage = 0.0f;
    float minDamageReduction = 0.0f;
    float maxDamageReduction = 0.0f;
    float weight = 1.0f;
};

struct MilestoneReward {
    int32_t level = 0;
    std::string description;
    int32_t skillPoints = 0;
    int32_t statPoints = 0;
    int32_t gold = 0;
};

struct LevelUpRewards {
    int32_t statPointsPerLevel = 3;
    int32_t skillPointsPerLevel = 1;
    int32_t goldPerLevel = 100;
    std::vector<MilestoneReward> milestones;
};

// ── BalanceConfig ──────────────────────────────────────────────────────────

/// All balance tables of the combat core.
struct BalanceConfig {
    ProgressionBalance progression;
    ComboBalance combo;
    CombatBalance combat;
    StatusBalance status;
    TargetingBalance targeting;
    EnemyScalingBalance enemyScaling;
    std::array<DifficultyCurve, kDifficultyCount> difficulties{};
    int32_t worldTierUnlockLevel = 30;
    std::vector<WorldTier> worldTiers;
    std::array<RarityEntry, kItemRarityCount> rarities{};
    DropChances drops;
    std::vector<LootEntry> regularLoot;
    std::vector<LootEntry> bossLoot;
    std::vector<EnemyTemplate> enemies;
    LevelUpRewards rewards;

    /// The shipped balance.
    [[nodiscard]] static BalanceConfig Defaults();

    /// Defaults overlaid with a YAML file.
    [[nodiscard]] static foundation::GameResult<BalanceConfig> LoadFromFile(
        const std::filesystem::path& path);

    /// Overlay every key present in config. Keys that are absent keep their
    /// current value.
    ///
    /// @return Success, or the first InvalidNumericInput / ConfigTypeMismatch
    ///         error (config left unchanged).
    foundation::GameResult<void> ApplyOverrides(const foundation::ConfigManager& config);

    [[nodiscard]] const DifficultyCurve& GetDifficulty(Difficulty d) const;
    [[nodiscard]] const RarityEntry& GetRarity(ItemRarity r) const;
    [[nodiscard]] float GetZoneMultiplier(Zone z) const;
    [[nodiscard]] const RankMultipliers& GetRank(EnemyRank r) const;

    /// Tier by number (1-based); nullptr when out of range.
    [[nodiscard]] const WorldTier* GetWorldTier(int32_t tier) const;

    [[nodiscard]] const EnemyTemplate* FindEnemy(std::string_view id) const;

    /// Milestone reward for exactly this level, if any.
    [[nodiscard]] std::optional<MilestoneReward> GetMilestone(int32_t level) const;
};

} // namespace arc::game
