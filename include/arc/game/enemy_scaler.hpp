#pragma once

/// @file enemy_scaler.hpp
/// @brief EnemyScaler: enemy stats for a given player level and difficulty.

#include <cstdint>
#include <optional>
#include <string_view>

#include "arc/foundation/game_result.hpp"
#include "arc/game/balance_config.hpp"

namespace arc::game {

/// Final stats of a spawned enemy.
struct EnemyStats {
    int32_t level = 1;
    float health = 0.0f;
    float damage = 0.0f;
    float experience = 0.0f;
};

/// Everything besides the template that shapes an enemy.
struct ScalingContext {
    int32_t playerLevel = 1;
    Difficulty difficulty = Difficulty::Medium;
    std::optional<EnemyRank> rank;  ///< Defaults to Boss for boss templates, else Normal.
    std::optional<Zone> zone;       ///< Defaults to the template's zone.
    int32_t worldTier = 1;
};

/// Applies level, zone, difficulty, rank and world-tier scaling to enemy
/// templates.
///
/// @code
///   levelScale = 1 + playerLevel * levelScalingFactor
///   health     = round(base * healthMultiplier * levelScale * zone * difficulty.health)
///   damage     = round(base * damageMultiplier * difficulty.damage * levelScale)
///   experience = round(base * experienceMultiplier * difficulty.experience)
/// @endcode
/// Rank multipliers follow (health and damage), then the world tier.
class EnemyScaler {
public:
    explicit EnemyScaler(const BalanceConfig& balance) : balance_(balance) {}

    [[nodiscard]] EnemyStats Scale(const EnemyTemplate& enemy,
                                   const ScalingContext& context) const;

    /// Scale a template looked up by id.
    /// @return The stats, or RecordNotFound for an unknown id.
    [[nodiscard]] foundation::GameResult<EnemyStats> ScaleById(
        std::string_view enemyId, const ScalingContext& context) const;

    /// Enemy level for a player level under a difficulty (never below 1).
    [[nodiscard]] int32_t EnemyLevel(int32_t playerLevel, Difficulty difficulty) const;

private:
    const BalanceConfig& balance_;
};

} // namespace arc::game
