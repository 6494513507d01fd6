/// @file balance_config.cpp
/// @brief BalanceConfig lookups and YAML overlay.

#include "arc/game/balance_config.hpp"

#include <algorithm>
#include <string>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr float kLowest = -3.4028235e38f;

/// Reads optional keys from a ConfigManager into a config copy, stopping at
/// the first invalid value.
class OverrideReader {
public:
    explicit OverrideReader(const ConfigManager& config) : config_(config) {}

    void Float(const std::string& key, float& target, float minimum = kLowest) {
        if (failed() || !config_.hasKey(key)) {
            return;
        }
        auto value = config_.get<float>(key);
        if (!value) {
            error_ = value.error();
            return;
        }
        auto checked = foundation::requireFinite(value.value(), key, minimum);
        if (!checked) {
            error_ = checked.error();
            return;
        }
        target = checked.value();
        ++applied_;
    }

    void Fraction(const std::string& key, float& target) {
        float value = target;
        Float(key, value, 0.0f);
        if (!failed() && value > 1.0f) {
            error_ = GameError(ErrorCode::InvalidNumericInput,
                               "value must be within [0, 1]: " + key, key);
            return;
        }
        target = value;
    }

    void Int(const std::string& key, int32_t& target) {
        if (failed() || !config_.hasKey(key)) {
            return;
        }
        auto value = config_.get<int32_t>(key);
        if (!value) {
            error_ = value.error();
            return;
        }
        target = value.value();
        ++applied_;
    }

    void Bool(const std::string& key, bool& target) {
        if (failed() || !config_.hasKey(key)) {
            return;
        }
        auto value = config_.get<bool>(key);
        if (!value) {
            error_ = value.error();
            return;
        }
        target = value.value();
        ++applied_;
    }

    void String(const std::string& key, std::string& target) {
        if (failed() || !config_.hasKey(key)) {
            return;
        }
        auto value = config_.get<std::string>(key);
        if (!value) {
            error_ = value.error();
            return;
        }
        target = value.value();
        ++applied_;
    }

    void FloatList(const std::string& key, std::vector<float>& target) {
        if (failed() || !config_.hasKey(key)) {
            return;
        }
        auto value = config_.get<std::vector<float>>(key);
        if (!value) {
            error_ = value.error();
            return;
        }
        if (value.value().empty()) {
            error_ = GameError(ErrorCode::InvalidNumericInput,
                               "list must not be empty: " + key, key);
            return;
        }
        for (float v : value.value()) {
            auto checked = foundation::requireFinite(v, key, 0.0f);
            if (!checked) {
                error_ = checked.error();
                return;
            }
        }
        target = value.value();
        ++applied_;
    }

    void Fail(GameError error) {
        if (!failed()) {
            error_ = std::move(error);
        }
    }

    [[nodiscard]] bool failed() const { return error_.has_value(); }
    [[nodiscard]] const GameError& error() const { return *error_; }
    [[nodiscard]] int applied() const { return applied_; }

private:
    const ConfigManager& config_;
    std::optional<GameError> error_;
    int applied_ = 0;
};

void readProgression(OverrideReader& r, ProgressionBalance& p) {
    r.Int("player.base.level", p.base.level);
    r.Float("player.base.experience_to_next_level", p.base.experienceToNextLevel, 1.0f);
    r.Float("player.base.max_health", p.base.maxHealth, 1.0f);
    r.Float("player.base.max_mana", p.base.maxMana, 0.0f);
    r.Float("player.base.strength", p.base.strength, 0.0f);
    r.Float("player.base.dexterity", p.base.dexterity, 0.0f);
    r.Float("player.base.intelligence", p.base.intelligence, 0.0f);
    r.Float("player.base.movement_speed", p.base.movementSpeed, 0.0f);
    r.Float("player.base.attack_power", p.base.attackPower, 0.0f);

    r.Float("player.level_up.max_health", p.levelUp.maxHealth, 0.0f);
    r.Float("player.level_up.max_mana", p.levelUp.maxMana, 0.0f);
    r.Float("player.level_up.strength", p.levelUp.strength, 0.0f);
    r.Float("player.level_up.dexterity", p.levelUp.dexterity, 0.0f);
    r.Float("player.level_up.intelligence", p.levelUp.intelligence, 0.0f);
    r.Float("player.level_up.attack_power", p.levelUp.attackPower, 0.0f);

    r.Float("player.experience_multiplier", p.experienceMultiplier, 1.0f);
    r.Float("player.health_regen", p.healthRegenPerSecond, 0.0f);
    r.Float("player.mana_regen", p.manaRegenPerSecond, 0.0f);
    r.Fraction("player.revive_fraction", p.reviveFraction);

    if (!r.failed() && p.base.level < 1) {
        r.Fail(GameError(ErrorCode::InvalidNumericInput,
                         "player.base.level must be >= 1",
                         std::string("player.base.level")));
    }
}

void readCombat(OverrideReader& r, BalanceConfig& cfg) {
    r.FloatList("combo.multipliers", cfg.combo.multipliers);
    r.Float("combo.cooldown_seconds", cfg.combo.cooldownSeconds, 0.0f);
    r.Float("combo.window_seconds", cfg.combo.windowSeconds, 0.0f);
    r.Float("combo.range", cfg.combo.range, 0.0f);
    r.Float("combo.knockback_distance", cfg.combo.knockbackDistance, 0.0f);
    r.Float("combo.knockback_duration", cfg.combo.knockbackDuration, 0.0f);

    r.Fraction("combat.base_crit_chance", cfg.combat.baseCritChance);
    r.Float("combat.crit_multiplier", cfg.combat.critMultiplier, 1.0f);
    r.Fraction("combat.damage_variation", cfg.combat.damageVariation);
    r.Float("combat.attack_power_per_level", cfg.combat.attackPowerPerLevel, 0.0f);
    r.Float("combat.strength_contribution", cfg.combat.strengthContribution, 0.0f);

    std::string mode = cfg.status.dotMode == DotMode::Stochastic ? "stochastic"
                                                                 : "fixed_interval";
    r.String("status.dot_mode", mode);
    if (mode == "stochastic") {
        cfg.status.dotMode = DotMode::Stochastic;
    } else if (mode == "fixed_interval") {
        cfg.status.dotMode = DotMode::FixedInterval;
    } else {
        r.Fail(GameError(ErrorCode::ConfigTypeMismatch,
                         "status.dot_mode must be stochastic or fixed_interval",
                         std::string("status.dot_mode")));
    }
    r.Float("status.dot_ticks_per_second", cfg.status.dotTicksPerSecond, 0.0f);
    r.Fraction("status.default_slow_intensity", cfg.status.defaultSlowIntensity);
    r.Float("status.burn_tick_damage", cfg.status.burnTickDamage, 0.0f);
    r.Float("status.poison_tick_damage", cfg.status.poisonTickDamage, 0.0f);

    r.Float("targeting.default_sweep_range", cfg.targeting.defaultSweepRange, 0.0f);
    r.Float("targeting.melee_range", cfg.targeting.meleeRange, 0.0f);
    r.Float("targeting.min_teleport_range", cfg.targeting.minTeleportRange, 0.0f);
    r.Float("targeting.teleport_stop_distance", cfg.targeting.teleportStopDistance, 0.0f);
}

void readWorld(OverrideReader& r, const ConfigManager& config, BalanceConfig& cfg) {
    auto& es = cfg.enemyScaling;
    r.Float("enemy_scaling.health_multiplier", es.healthMultiplier, 0.0f);
    r.Float("enemy_scaling.damage_multiplier", es.damageMultiplier, 0.0f);
    r.Float("enemy_scaling.experience_multiplier", es.experienceMultiplier, 0.0f);
    r.Float("enemy_scaling.level_scaling_factor", es.levelScalingFactor, 0.0f);
    for (std::size_t i = 0; i < kEnemyRankCount; ++i) {
        std::string prefix = "enemy_scaling." + std::string(kEnemyRankNames[i]);
        r.Float(prefix + ".health", es.ranks[i].health, 0.0f);
        r.Float(prefix + ".damage", es.ranks[i].damage, 0.0f);
    }
    for (std::size_t i = 0; i < kZoneCount; ++i) {
        r.Float("zones." + std::string(kZoneNames[i]), es.zones[i], 0.0f);
    }

    for (std::size_t i = 0; i < kDifficultyCount; ++i) {
        std::string prefix = "difficulty." + std::string(kDifficultyNames[i]);
        auto& d = cfg.difficulties[i];
        r.String(prefix + ".name", d.name);
        r.Int(prefix + ".enemy_level_offset", d.enemyLevelOffset);
        r.Float(prefix + ".damage_multiplier", d.damageMultiplier, 0.0f);
        r.Float(prefix + ".health_multiplier", d.healthMultiplier, 0.0f);
        r.Float(prefix + ".experience_multiplier", d.experienceMultiplier, 0.0f);
        r.Float(prefix + ".item_quality_multiplier", d.itemQualityMultiplier, 0.0f);
        r.Float(prefix + ".drop_rate_multiplier", d.dropRateMultiplier, 0.0f);
        r.Float(prefix + ".affix_chance_multiplier", d.affixChanceMultiplier, 0.0f);
        r.Float(prefix + ".special_ability_chance_multiplier",
                d.specialAbilityChanceMultiplier, 0.0f);
        r.Bool(prefix + ".guaranteed_rare_affix", d.guaranteedRareAffix);
    }

    r.Int("world_tiers.unlock_level", cfg.worldTierUnlockLevel);

    for (std::size_t i = 0; i < kItemRarityCount; ++i) {
        std::string prefix = "rarity." + std::string(kItemRarityNames[i]);
        auto& e = cfg.rarities[i];
        r.Float(prefix + ".stat_multiplier", e.statMultiplier, 0.0f);
        r.Float(prefix + ".drop_chance_percent", e.baseDropChancePercent, 0.0f);
        r.Float(prefix + ".level_influence_percent", e.levelInfluencePercent);
        r.Int(prefix + ".min_level", e.minLevel);
    }

    r.Fraction("drops.boss_chance", cfg.drops.boss);
    r.Fraction("drops.normal_chance", cfg.drops.normal);

    // Enemy templates: existing ids are patched, unknown ids are appended.
    for (const auto& id : config.childrenOf("enemies")) {
        if (r.failed()) {
            return;
        }
        std::string prefix = "enemies." + id;
        auto it = std::find_if(cfg.enemies.begin(), cfg.enemies.end(),
                               [&](const EnemyTemplate& t) { return t.id == id; });
        EnemyTemplate tmpl;
        if (it != cfg.enemies.end()) {
            tmpl = *it;
        } else {
            tmpl.id = id;
            tmpl.name = id;
        }
        r.String(prefix + ".name", tmpl.name);
        r.Float(prefix + ".health", tmpl.health, 1.0f);
        r.Float(prefix + ".damage", tmpl.damage, 0.0f);
        r.Float(prefix + ".speed", tmpl.speed, 0.0f);
        r.Float(prefix + ".attack_range", tmpl.attackRange, 0.0f);
        r.Float(prefix + ".experience", tmpl.experience, 0.0f);
        r.Bool(prefix + ".boss", tmpl.isBoss);

        std::string zone(zoneName(tmpl.zone));
        r.String(prefix + ".zone", zone);
        if (auto parsed = parseZone(zone)) {
            tmpl.zone = *parsed;
        } else {
            r.Fail(GameError(ErrorCode::ConfigTypeMismatch,
                             "unknown zone for " + prefix, prefix + ".zone"));
        }

        if (it != cfg.enemies.end()) {
            *it = std::move(tmpl);
        } else {
            cfg.enemies.push_back(std::move(tmpl));
        }
    }
}

} // namespace

GameResult<BalanceConfig> BalanceConfig::LoadFromFile(const std::filesystem::path& path) {
    ConfigManager config;
    auto loaded = config.load(path);
    if (!loaded) {
        return GameResult<BalanceConfig>::err(loaded.error());
    }
    auto cfg = Defaults();
    auto applied = cfg.ApplyOverrides(config);
    if (!applied) {
        return GameResult<BalanceConfig>::err(applied.error());
    }
    return GameResult<BalanceConfig>::ok(std::move(cfg));
}

GameResult<void> BalanceConfig::ApplyOverrides(const ConfigManager& config) {
    BalanceConfig staged = *this;
    OverrideReader reader(config);

    readProgression(reader, staged.progression);
    readCombat(reader, staged);
    readWorld(reader, config, staged);

    if (reader.failed()) {
        ARC_LOG_ERROR(LogCategory::Config,
                      "balance override rejected: " + std::string(reader.error().message()));
        return GameResult<void>::err(reader.error());
    }

    *this = std::move(staged);
    ARC_LOG_INFO(LogCategory::Config,
                 "applied " + std::to_string(reader.applied()) + " balance overrides");
    return GameResult<void>::ok();
}

// ── Lookups ─────────────────────────────────────────────────────────────────

const DifficultyCurve& BalanceConfig::GetDifficulty(Difficulty d) const {
    auto idx = static_cast<std::size_t>(d);
    return difficulties[idx < kDifficultyCount ? idx : static_cast<std::size_t>(Difficulty::Medium)];
}

const RarityEntry& BalanceConfig::GetRarity(ItemRarity r) const {
    auto idx = static_cast<std::size_t>(r);
    return rarities[idx < kItemRarityCount ? idx : 0];
}

float BalanceConfig::GetZoneMultiplier(Zone z) const {
    auto idx = static_cast<std::size_t>(z);
    return idx < kZoneCount ? enemyScaling.zones[idx] : 1.0f;
}

const RankMultipliers& BalanceConfig::GetRank(EnemyRank r) const {
    auto idx = static_cast<std::size_t>(r);
    return enemyScaling.ranks[idx < kEnemyRankCount ? idx : 0];
}

const WorldTier* BalanceConfig::GetWorldTier(int32_t tier) const {
    for (const auto& t : worldTiers) {
        if (t.tier == tier) {
            return &t;
        }
    }
    return nullptr;
}

const EnemyTemplate* BalanceConfig::FindEnemy(std::string_view id) const {
    for (const auto& e : enemies) {
        if (e.id == id) {
            return &e;
        }
    }
    return nullptr;
}

std::optional<MilestoneReward> BalanceConfig::GetMilestone(int32_t level) const {
    for (const auto& m : rewards.milestones) {
        if (m.level == level) {
            return m;
        }
    }
    return std::nullopt;
}

} // namespace arc::game
