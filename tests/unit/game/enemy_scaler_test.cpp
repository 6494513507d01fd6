#include <gtest/gtest.h>

#include <string_view>

#include "arc/game/balance_config.hpp"
#include "arc/game/enemy_scaler.hpp"

using namespace arc::game;
using arc::foundation::ErrorCode;

namespace {

class EnemyScalerTest : public ::testing::Test {
protected:
    EnemyScalerTest() : balance_(BalanceConfig::Defaults()), scaler_(balance_) {}

    EnemyStats scale(std::string_view id, const ScalingContext& ctx) {
        auto result = scaler_.ScaleById(id, ctx);
        EXPECT_TRUE(result.hasValue()) << id;
        return result.hasValue() ? result.value() : EnemyStats{};
    }

    BalanceConfig balance_;
    EnemyScaler scaler_;
};

} // namespace

TEST_F(EnemyScalerTest, SkeletonAtLevelOne) {
    ScalingContext ctx;
    auto stats = scale("skeleton", ctx);

    // 50 * 2.5 * 1.1 * 1.2 (ruins)
    EXPECT_FLOAT_EQ(stats.health, 165.0f);
    EXPECT_FLOAT_EQ(stats.damage, 11.0f);
    EXPECT_FLOAT_EQ(stats.experience, 20.0f);
    EXPECT_EQ(stats.level, 1);
}

TEST_F(EnemyScalerTest, DifficultyAndLevelCompound) {
    ScalingContext ctx;
    ctx.playerLevel = 10;
    ctx.difficulty = Difficulty::Hell;
    auto stats = scale("skeleton", ctx);

    EXPECT_FLOAT_EQ(stats.health, 750.0f);
    EXPECT_FLOAT_EQ(stats.damage, 40.0f);
    EXPECT_FLOAT_EQ(stats.experience, 30.0f);
    EXPECT_EQ(stats.level, 15);
}

TEST_F(EnemyScalerTest, BossTemplatesUseBossRank) {
    ScalingContext ctx;
    auto stats = scale("skeleton_king", ctx);

    EXPECT_FLOAT_EQ(stats.health, 2970.0f);
    EXPECT_FLOAT_EQ(stats.damage, 42.0f);
    EXPECT_FLOAT_EQ(stats.experience, 200.0f);
}

TEST_F(EnemyScalerTest, ExplicitRankOverridesTemplate) {
    ScalingContext ctx;
    ctx.rank = EnemyRank::Elite;
    auto stats = scale("skeleton", ctx);

    EXPECT_FLOAT_EQ(stats.health, 297.0f);
    EXPECT_FLOAT_EQ(stats.damage, 14.0f);
}

TEST_F(EnemyScalerTest, ExplicitZoneOverridesTemplate) {
    ScalingContext ctx;
    ctx.playerLevel = 10;
    ctx.zone = Zone::FrozenWastes;
    auto stats = scale("skeleton", ctx);

    EXPECT_FLOAT_EQ(stats.health, 550.0f);
}

TEST_F(EnemyScalerTest, WorldTierScalesEverything) {
    ScalingContext ctx;
    ctx.playerLevel = 10;
    ctx.worldTier = 2;
    auto stats = scale("skeleton", ctx);

    EXPECT_FLOAT_EQ(stats.health, 450.0f);
    EXPECT_FLOAT_EQ(stats.damage, 30.0f);
    EXPECT_FLOAT_EQ(stats.experience, 24.0f);
}

TEST_F(EnemyScalerTest, UnknownWorldTierIsIgnored) {
    ScalingContext plain;
    plain.playerLevel = 10;
    ScalingContext unknown = plain;
    unknown.worldTier = 9;

    auto base = scale("skeleton", plain);
    auto stats = scale("skeleton", unknown);
    EXPECT_FLOAT_EQ(stats.health, base.health);
    EXPECT_FLOAT_EQ(stats.damage, base.damage);
}

TEST_F(EnemyScalerTest, NonPositivePlayerLevelTreatedAsOne) {
    ScalingContext ctx;
    ctx.playerLevel = -3;
    auto stats = scale("skeleton", ctx);
    EXPECT_FLOAT_EQ(stats.health, 165.0f);
    EXPECT_EQ(stats.level, 1);
}

TEST_F(EnemyScalerTest, UnknownEnemyIsNotFound) {
    auto result = scaler_.ScaleById("dragon", ScalingContext{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::RecordNotFound);
}

TEST_F(EnemyScalerTest, EnemyLevelFollowsDifficultyOffset) {
    EXPECT_EQ(scaler_.EnemyLevel(1, Difficulty::Basic), 1);
    EXPECT_EQ(scaler_.EnemyLevel(10, Difficulty::Medium), 8);
    EXPECT_EQ(scaler_.EnemyLevel(30, Difficulty::Inferno), 40);
}
