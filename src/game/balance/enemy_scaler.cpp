/// @file enemy_scaler.cpp
/// @brief EnemyScaler implementation.

#include "arc/game/enemy_scaler.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

EnemyStats EnemyScaler::Scale(const EnemyTemplate& enemy, const ScalingContext& context) const {
    const auto& scaling = balance_.enemyScaling;
    const auto& difficulty = balance_.GetDifficulty(context.difficulty);

    int32_t playerLevel = std::max(1, context.playerLevel);
    float levelScale = 1.0f + static_cast<float>(playerLevel) * scaling.levelScalingFactor;
    float zone = balance_.GetZoneMultiplier(context.zone.value_or(enemy.zone));

    EnemyStats stats;
    stats.level = EnemyLevel(playerLevel, context.difficulty);
    stats.health = std::round(enemy.health * scaling.healthMultiplier * levelScale * zone *
                              difficulty.healthMultiplier);
    stats.damage = std::round(enemy.damage * scaling.damageMultiplier *
                              difficulty.damageMultiplier * levelScale);
    stats.experience = std::round(enemy.experience * scaling.experienceMultiplier *
                                  difficulty.experienceMultiplier);

    EnemyRank rank = context.rank.value_or(enemy.isBoss ? EnemyRank::Boss : EnemyRank::Normal);
    const auto& rankMult = balance_.GetRank(rank);
    stats.health = std::round(stats.health * rankMult.health);
    stats.damage = std::round(stats.damage * rankMult.damage);

    if (const auto* tier = balance_.GetWorldTier(context.worldTier)) {
        stats.health = std::round(stats.health * tier->difficultyMultiplier);
        stats.damage = std::round(stats.damage * tier->difficultyMultiplier);
        stats.experience = std::round(stats.experience * tier->experienceMultiplier);
    } else if (context.worldTier != 1) {
        ARC_LOG_WARN(LogCategory::Progression,
                     "unknown world tier " + std::to_string(context.worldTier) +
                         ", scaling without tier");
    }
    return stats;
}

GameResult<EnemyStats> EnemyScaler::ScaleById(std::string_view enemyId,
                                              const ScalingContext& context) const {
    const auto* enemy = balance_.FindEnemy(enemyId);
    if (enemy == nullptr) {
        return GameResult<EnemyStats>::err(GameError(
            ErrorCode::RecordNotFound, "unknown enemy: " + std::string(enemyId)));
    }
    return GameResult<EnemyStats>::ok(Scale(*enemy, context));
}

int32_t EnemyScaler::EnemyLevel(int32_t playerLevel, Difficulty difficulty) const {
    return std::max(1, playerLevel + balance_.GetDifficulty(difficulty).enemyLevelOffset);
}

} // namespace arc::game
