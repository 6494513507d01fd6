#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

#include "arc/foundation/game_serializer.hpp"
#include "arc/game/balance_config.hpp"
#include "arc/game/stat_block.hpp"
#include "arc/game/temporary_modifier_set.hpp"

using namespace arc::game;
using arc::foundation::GameSerializer;

namespace {

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

ProgressionBalance defaultProgression() {
    return BalanceConfig::Defaults().progression;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Spawn state
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatBlockTest, SpawnsWithBaseStatsAndFullPools) {
    StatBlock stats(defaultProgression());
    EXPECT_EQ(stats.Level(), 1);
    EXPECT_FLOAT_EQ(stats.Experience(), 0.0f);
    EXPECT_FLOAT_EQ(stats.ExperienceToNextLevel(), 100.0f);
    EXPECT_FLOAT_EQ(stats.MaxHealth(), 500.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 500.0f);
    EXPECT_FLOAT_EQ(stats.MaxMana(), 200.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 200.0f);
    EXPECT_FLOAT_EQ(stats.Strength(), 10.0f);
    EXPECT_FLOAT_EQ(stats.MovementSpeed(), 15.0f);
    EXPECT_FLOAT_EQ(stats.AttackPower(), 10.0f);
    EXPECT_FALSE(stats.IsDead());
    EXPECT_TRUE(stats.CanMove());
}

TEST(StatBlockTest, ConstGetReadsEachStat) {
    StatBlock stats(defaultProgression());
    stats.Set(StatKind::Dexterity, 12.0f);
    stats.Set(StatKind::Intelligence, 14.0f);
    const StatBlock& view = stats;

    EXPECT_FLOAT_EQ(view.Get(StatKind::MaxHealth), 500.0f);
    EXPECT_FLOAT_EQ(view.Get(StatKind::MaxMana), 200.0f);
    EXPECT_FLOAT_EQ(view.Get(StatKind::Strength), 10.0f);
    EXPECT_FLOAT_EQ(view.Get(StatKind::Dexterity), 12.0f);
    EXPECT_FLOAT_EQ(view.Get(StatKind::Intelligence), 14.0f);
    EXPECT_FLOAT_EQ(view.Get(StatKind::MovementSpeed), 15.0f);
    EXPECT_FLOAT_EQ(view.Get(StatKind::AttackPower), 10.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Pools
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatBlockTest, SetHealthAndManaClamp) {
    StatBlock stats(defaultProgression());
    stats.SetHealth(900.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 500.0f);
    stats.SetHealth(-20.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 0.0f);

    stats.SetMana(250.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 200.0f);
    stats.SetMana(-1.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 0.0f);
}

TEST(StatBlockTest, HealReturnsExactlyTheAmountRestored) {
    StatBlock stats(defaultProgression());
    for (float start : {0.0f, 120.0f, 499.0f, 500.0f}) {
        for (float amount : {0.0f, 0.5f, 1.0f, 50.0f, 380.0f, 10000.0f}) {
            stats.SetHealth(start);
            float expected = std::min(amount, stats.MaxHealth() - stats.Health());
            float healed = stats.Heal(amount);
            EXPECT_FLOAT_EQ(healed, expected) << "start " << start << " amount " << amount;
            EXPECT_LE(stats.Health(), stats.MaxHealth());
        }
    }
}

TEST(StatBlockTest, HealDoesNothingWhileDead) {
    StatBlock stats(defaultProgression());
    stats.SetHealth(0.0f);
    stats.SetDead(true);
    EXPECT_FLOAT_EQ(stats.Heal(100.0f), 0.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 0.0f);
}

TEST(StatBlockTest, SpendManaFailsWithoutTouchingMana) {
    StatBlock stats(defaultProgression());
    stats.SetMana(20.0f);
    EXPECT_FALSE(stats.SpendMana(30.0f));
    EXPECT_FLOAT_EQ(stats.Mana(), 20.0f);
    EXPECT_TRUE(stats.SpendMana(20.0f));
    EXPECT_FLOAT_EQ(stats.Mana(), 0.0f);
}

TEST(StatBlockTest, RestoreManaCapsAtMaximum) {
    StatBlock stats(defaultProgression());
    stats.SetMana(190.0f);
    EXPECT_FLOAT_EQ(stats.RestoreMana(25.0f), 10.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 200.0f);
}

TEST(StatBlockTest, LoweringMaximumClampsPool) {
    StatBlock stats(defaultProgression());
    stats.Set(StatKind::MaxHealth, 300.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 300.0f);
    stats.Set(StatKind::MaxMana, 50.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 50.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Numeric guards
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatBlockTest, NonFiniteSetterKeepsPreviousValue) {
    StatBlock stats(defaultProgression());
    stats.SetHealth(250.0f);
    stats.SetHealth(kNaN);
    EXPECT_FLOAT_EQ(stats.Health(), 250.0f);

    stats.Set(StatKind::Strength, std::numeric_limits<float>::infinity());
    EXPECT_FLOAT_EQ(stats.Strength(), 10.0f);

    stats.Set(StatKind::Dexterity, -4.0f);
    EXPECT_FLOAT_EQ(stats.Dexterity(), 0.0f);
}

TEST(StatBlockTest, NonFiniteAmountsAreIgnored) {
    StatBlock stats(defaultProgression());
    stats.SetHealth(100.0f);
    EXPECT_FLOAT_EQ(stats.Heal(kNaN), 0.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 100.0f);
    EXPECT_EQ(stats.AddExperience(kNaN), 0);
    EXPECT_FLOAT_EQ(stats.Experience(), 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Progression
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatBlockTest, AddExperienceBelowRequirementDoesNotLevel) {
    StatBlock stats(defaultProgression());
    EXPECT_EQ(stats.AddExperience(99.0f), 0);
    EXPECT_EQ(stats.Level(), 1);
    EXPECT_FLOAT_EQ(stats.Experience(), 99.0f);
}

TEST(StatBlockTest, LevelUpAppliesDeltasAndRefills) {
    StatBlock stats(defaultProgression());
    stats.SetHealth(10.0f);
    stats.SetMana(10.0f);

    EXPECT_EQ(stats.AddExperience(130.0f), 2);
    EXPECT_EQ(stats.Level(), 2);
    EXPECT_FLOAT_EQ(stats.Experience(), 30.0f);
    EXPECT_FLOAT_EQ(stats.ExperienceToNextLevel(), 150.0f);
    EXPECT_FLOAT_EQ(stats.MaxHealth(), 510.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 510.0f);
    EXPECT_FLOAT_EQ(stats.MaxMana(), 205.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 205.0f);
    EXPECT_FLOAT_EQ(stats.Strength(), 11.0f);
    EXPECT_FLOAT_EQ(stats.AttackPower(), 12.0f);
}

TEST(StatBlockTest, LargeAwardLevelsMoreThanOnce) {
    StatBlock stats(defaultProgression());
    std::vector<int32_t> levels;
    stats.OnLevelUp().connect([&](int32_t level) { levels.push_back(level); });

    // 100 + 150 + 225 = 475 for three levels.
    EXPECT_EQ(stats.AddExperience(500.0f), 4);
    EXPECT_EQ(levels, (std::vector<int32_t>{2, 3, 4}));
    EXPECT_FLOAT_EQ(stats.Experience(), 25.0f);
    EXPECT_FLOAT_EQ(stats.ExperienceToNextLevel(), 337.0f);
    EXPECT_LT(stats.Experience(), stats.ExperienceToNextLevel());
}

TEST(StatBlockTest, ExperienceInvariantHoldsAcrossAwardSequences) {
    StatBlock stats(defaultProgression());
    float total = 0.0f;
    for (float award : {40.0f, 35.0f, 80.0f, 5.0f, 260.0f, 1.0f, 999.0f}) {
        stats.AddExperience(award);
        total += award;
        EXPECT_LT(stats.Experience(), stats.ExperienceToNextLevel());
    }
    EXPECT_GE(total, 100.0f);
    EXPECT_GT(stats.Level(), 1);
}

TEST(StatBlockTest, RegenerationIsClampedAndSkippedWhileDead) {
    StatBlock stats(defaultProgression());
    stats.SetHealth(100.0f);
    stats.SetMana(100.0f);

    stats.RegenerateResources(2.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 104.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 110.0f);

    stats.RegenerateResources(1000.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 500.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 200.0f);

    stats.SetHealth(0.0f);
    stats.SetDead(true);
    stats.RegenerateResources(5.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Temporary modifiers
// ═══════════════════════════════════════════════════════════════════════════

TEST(TemporaryModifierTest, BoostAppliesImmediatelyAndRevertsExactly) {
    ProgressionBalance balance = defaultProgression();
    balance.base.movementSpeed = 10.0f;
    StatBlock stats(balance);

    stats.Modifiers().AddBoost(stats, StatKind::MovementSpeed, 0.5f, 2.0f);
    EXPECT_FLOAT_EQ(stats.MovementSpeed(), 15.0f);

    stats.RegenerateResources(2.0f);
    EXPECT_EQ(stats.MovementSpeed(), 10.0f);
    EXPECT_FALSE(stats.Modifiers().HasBoost(StatKind::MovementSpeed));
    EXPECT_TRUE(stats.Modifiers().Empty());
}

TEST(TemporaryModifierTest, BoostsCompoundInOrder) {
    ProgressionBalance balance = defaultProgression();
    balance.base.attackPower = 100.0f;
    StatBlock stats(balance);
    auto& mods = stats.Modifiers();

    mods.AddBoost(stats, StatKind::AttackPower, 0.2f, 1.0f);
    mods.AddBoost(stats, StatKind::AttackPower, 0.5f, 3.0f);
    EXPECT_FLOAT_EQ(stats.AttackPower(), 180.0f);  // 100 * 1.2 * 1.5
    EXPECT_EQ(mods.BoostCount(StatKind::AttackPower), 2u);

    mods.Update(stats, 1.0f);
    EXPECT_FLOAT_EQ(stats.AttackPower(), 150.0f);
    EXPECT_EQ(mods.BoostCount(StatKind::AttackPower), 1u);

    mods.Update(stats, 2.0f);
    EXPECT_EQ(stats.AttackPower(), 100.0f);
    EXPECT_FALSE(mods.Baseline(StatKind::AttackPower).has_value());
}

TEST(TemporaryModifierTest, ZeroDurationIsIgnored) {
    StatBlock stats(defaultProgression());
    stats.Modifiers().AddBoost(stats, StatKind::Strength, 1.0f, 0.0f);
    EXPECT_FLOAT_EQ(stats.Strength(), 10.0f);
    EXPECT_TRUE(stats.Modifiers().Empty());
}

TEST(TemporaryModifierTest, ClearRestoresEveryBaseline) {
    StatBlock stats(defaultProgression());
    auto& mods = stats.Modifiers();
    mods.AddBoost(stats, StatKind::Strength, 1.0f, 5.0f);
    mods.AddBoost(stats, StatKind::MovementSpeed, 0.4f, 5.0f);

    mods.Clear(stats);
    EXPECT_FLOAT_EQ(stats.Strength(), 10.0f);
    EXPECT_FLOAT_EQ(stats.MovementSpeed(), 15.0f);
    EXPECT_TRUE(mods.Empty());
}

TEST(TemporaryModifierTest, ScaleAppliesAfterBoostsAndSurvivesClear) {
    StatBlock stats(defaultProgression());
    auto& mods = stats.Modifiers();

    mods.SetScale(stats, StatKind::MovementSpeed, 0.5f);
    EXPECT_FLOAT_EQ(stats.MovementSpeed(), 7.5f);
    EXPECT_FALSE(mods.HasBoost(StatKind::MovementSpeed));

    mods.AddBoost(stats, StatKind::MovementSpeed, 1.0f, 5.0f);
    EXPECT_FLOAT_EQ(stats.MovementSpeed(), 15.0f);  // 15 * 2 * 0.5

    mods.Clear(stats);
    EXPECT_FLOAT_EQ(stats.MovementSpeed(), 7.5f);
    EXPECT_FLOAT_EQ(mods.Scale(StatKind::MovementSpeed), 0.5f);

    mods.ClearScale(stats, StatKind::MovementSpeed);
    EXPECT_EQ(stats.MovementSpeed(), 15.0f);
    EXPECT_TRUE(mods.Empty());
}

TEST(TemporaryModifierTest, SnapshotIgnoresScale) {
    StatBlock stats(defaultProgression());
    stats.Modifiers().SetScale(stats, StatKind::MovementSpeed, 0.4f);
    EXPECT_FLOAT_EQ(stats.Snapshot().movementSpeed, 15.0f);
}

TEST(TemporaryModifierTest, LevelUpDuringBoostMovesBaseline) {
    ProgressionBalance balance = defaultProgression();
    balance.base.attackPower = 100.0f;
    StatBlock stats(balance);

    stats.Modifiers().AddBoost(stats, StatKind::AttackPower, 0.5f, 4.0f);
    EXPECT_FLOAT_EQ(stats.AttackPower(), 150.0f);

    stats.AddExperience(100.0f);  // +2 attack power
    EXPECT_FLOAT_EQ(stats.AttackPower(), 153.0f);

    stats.RegenerateResources(4.0f);
    EXPECT_FLOAT_EQ(stats.AttackPower(), 102.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Snapshot / restore
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatSnapshotTest, RoundTripThroughJsonReproducesFields) {
    StatBlock original(defaultProgression());
    original.AddExperience(180.0f);
    original.SetHealth(321.5f);
    original.SetMana(42.25f);
    original.Set(StatKind::Intelligence, 17.0f);

    auto& serializer = GameSerializer::instance();
    auto json = serializer.serializeJson(original.Snapshot());
    auto decoded = serializer.deserializeJson<StatSnapshot>(json);
    ASSERT_TRUE(decoded.hasValue());

    StatBlock restored(defaultProgression());
    restored.Restore(decoded.value());

    EXPECT_EQ(restored.Level(), original.Level());
    EXPECT_EQ(restored.Experience(), original.Experience());
    EXPECT_EQ(restored.ExperienceToNextLevel(), original.ExperienceToNextLevel());
    EXPECT_EQ(restored.Health(), original.Health());
    EXPECT_EQ(restored.MaxHealth(), original.MaxHealth());
    EXPECT_EQ(restored.Mana(), original.Mana());
    EXPECT_EQ(restored.MaxMana(), original.MaxMana());
    EXPECT_EQ(restored.Strength(), original.Strength());
    EXPECT_EQ(restored.Dexterity(), original.Dexterity());
    EXPECT_EQ(restored.Intelligence(), original.Intelligence());
    EXPECT_EQ(restored.MovementSpeed(), original.MovementSpeed());
    EXPECT_EQ(restored.AttackPower(), original.AttackPower());
    EXPECT_EQ(restored.IsDead(), original.IsDead());
}

TEST(StatSnapshotTest, BoostedStatsAreStoredAtBaseline) {
    StatBlock stats(defaultProgression());
    stats.Modifiers().AddBoost(stats, StatKind::MovementSpeed, 1.0f, 10.0f);
    EXPECT_FLOAT_EQ(stats.MovementSpeed(), 30.0f);
    EXPECT_FLOAT_EQ(stats.Snapshot().movementSpeed, 15.0f);
}

TEST(StatSnapshotTest, InvalidFieldsFallBackToBaseStats) {
    StatSnapshot snapshot = StatBlock(defaultProgression()).Snapshot();
    snapshot.level = 0;
    snapshot.maxHealth = kNaN;
    snapshot.strength = -5.0f;

    StatBlock stats(defaultProgression());
    stats.Restore(snapshot);
    EXPECT_EQ(stats.Level(), 1);
    EXPECT_FLOAT_EQ(stats.MaxHealth(), 500.0f);
    EXPECT_FLOAT_EQ(stats.Strength(), 10.0f);
}

TEST(StatSnapshotTest, SurplusExperienceLevelsUpOnRestore) {
    StatSnapshot snapshot = StatBlock(defaultProgression()).Snapshot();
    snapshot.experience = 120.0f;

    StatBlock stats(defaultProgression());
    stats.Restore(snapshot);
    EXPECT_EQ(stats.Level(), 2);
    EXPECT_FLOAT_EQ(stats.Experience(), 20.0f);
}
