#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "arc/game/balance_config.hpp"
#include "arc/game/combat_resolver.hpp"
#include "arc/game/equipment_set.hpp"
#include "arc/game/stat_block.hpp"
#include "test_doubles.hpp"

using namespace arc::game;
using arc::test::fixedRandom;
using arc::test::scriptedRandom;

namespace {

CombatResolver makeResolver(RandomSource random) {
    auto balance = BalanceConfig::Defaults();
    return CombatResolver(balance.combat, balance.progression, std::move(random));
}

Item makeArmor(float reduction) {
    Item armor;
    armor.name = "Chainmail";
    armor.category = ItemCategory::Equipment;
    armor.slot = EquipSlot::Armor;
    armor.bonuses.damageReduction = reduction;
    return armor;
}

Item makeWeapon(float damage) {
    Item weapon;
    weapon.name = "Sword";
    weapon.category = ItemCategory::Equipment;
    weapon.slot = EquipSlot::Weapon;
    weapon.bonuses.damage = damage;
    return weapon;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Incoming damage
// ═══════════════════════════════════════════════════════════════════════════

TEST(CombatResolverTest, ArmorReducesIncomingDamage) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock stats(BalanceConfig::Defaults().progression);
    EquipmentSet gear;
    ASSERT_TRUE(gear.Equip(makeArmor(0.3f)).hasValue());

    float taken = combat.TakeDamage(stats, gear, 100.0f);
    EXPECT_FLOAT_EQ(taken, 70.0f);
    EXPECT_FLOAT_EQ(stats.Health(), 430.0f);
}

TEST(CombatResolverTest, LethalDamageKillsExactlyOnce) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock stats(BalanceConfig::Defaults().progression);
    EquipmentSet gear;
    int deaths = 0;
    combat.OnDeath().connect([&] { ++deaths; });

    stats.Flags().isMoving = true;
    stats.Flags().isUsingSkill = true;

    combat.TakeDamage(stats, gear, 10000.0f);
    EXPECT_TRUE(stats.IsDead());
    EXPECT_FLOAT_EQ(stats.Health(), 0.0f);
    EXPECT_FALSE(stats.CanMove());
    EXPECT_FALSE(stats.Flags().isMoving);
    EXPECT_FALSE(stats.Flags().isUsingSkill);

    EXPECT_FLOAT_EQ(combat.TakeDamage(stats, gear, 50.0f), 0.0f);
    EXPECT_EQ(deaths, 1);
}

TEST(CombatResolverTest, ReviveRestoresFractionOfPools) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock stats(BalanceConfig::Defaults().progression);
    EquipmentSet gear;
    int revives = 0;
    combat.OnRevive().connect([&] { ++revives; });

    EXPECT_FALSE(combat.Revive(stats));

    combat.TakeDamage(stats, gear, 600.0f);
    ASSERT_TRUE(stats.IsDead());
    EXPECT_TRUE(combat.Revive(stats));

    EXPECT_FALSE(stats.IsDead());
    EXPECT_TRUE(stats.CanMove());
    EXPECT_FLOAT_EQ(stats.Health(), 375.0f);
    EXPECT_FLOAT_EQ(stats.Mana(), 150.0f);
    EXPECT_EQ(revives, 1);
}

TEST(CombatResolverTest, NoExperienceWhileDead) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock stats(BalanceConfig::Defaults().progression);
    EquipmentSet gear;

    EXPECT_EQ(combat.AwardExperience(stats, 100.0f), 2);
    combat.TakeDamage(stats, gear, 10000.0f);
    EXPECT_EQ(combat.AwardExperience(stats, 1000.0f), 0);
    EXPECT_EQ(stats.Level(), 2);
    EXPECT_FLOAT_EQ(stats.Experience(), 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Outgoing hits
// ═══════════════════════════════════════════════════════════════════════════

TEST(CombatResolverTest, ResolveHitAppliesTargetReduction) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    TargetHealth target{100.0f, 100.0f, 0.5f, false};

    EXPECT_FLOAT_EQ(combat.ResolveHit(attacker, target, 40.0f), 20.0f);
    EXPECT_FLOAT_EQ(target.health, 80.0f);
    EXPECT_FALSE(target.dead);
}

TEST(CombatResolverTest, ResolveHitKillsTarget) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    TargetHealth target{10.0f, 100.0f, 0.0f, false};
    int kills = 0;
    combat.OnTargetKilled().connect([&](const TargetHealth& killed) {
        EXPECT_TRUE(killed.dead);
        ++kills;
    });

    combat.ResolveHit(attacker, target, 25.0f);
    EXPECT_TRUE(target.dead);
    EXPECT_FLOAT_EQ(target.health, 0.0f);

    EXPECT_FLOAT_EQ(combat.ResolveHit(attacker, target, 25.0f), 0.0f);
    EXPECT_EQ(kills, 1);
}

TEST(CombatResolverTest, DeadAttackerDealsNothing) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    attacker.SetDead(true);
    TargetHealth target{100.0f, 100.0f, 0.0f, false};

    EXPECT_FLOAT_EQ(combat.ResolveHit(attacker, target, 50.0f), 0.0f);
    EXPECT_FLOAT_EQ(target.health, 100.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Punch damage
// ═══════════════════════════════════════════════════════════════════════════

TEST(PunchDamageTest, MidRollHasNoVariationAndNoCrit) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    EquipmentSet gear;

    // 10 attack power + 10 strength * 0.5.
    auto damage = combat.ComputePunchDamage(attacker, gear, PunchStep{0, 1.0f, false});
    EXPECT_FLOAT_EQ(damage.amount, 15.0f);
    EXPECT_FALSE(damage.critical);
    EXPECT_FALSE(damage.knockback);
}

TEST(PunchDamageTest, FinisherScalesAndKnocksBack) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    EquipmentSet gear;

    auto damage = combat.ComputePunchDamage(attacker, gear, PunchStep{3, 1.8f, true});
    EXPECT_FLOAT_EQ(damage.amount, 27.0f);
    EXPECT_TRUE(damage.knockback);
}

TEST(PunchDamageTest, LowRollCrits) {
    auto combat = makeResolver(fixedRandom(0.0f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    EquipmentSet gear;

    // 15 * 0.9 * 1.5 = 20.25
    auto damage = combat.ComputePunchDamage(attacker, gear, PunchStep{0, 1.0f, false});
    EXPECT_TRUE(damage.critical);
    EXPECT_FLOAT_EQ(damage.amount, 20.0f);
}

TEST(PunchDamageTest, VariationAndCritUseSeparateDraws) {
    auto combat = makeResolver(scriptedRandom({1.0f, 0.01f}));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    EquipmentSet gear;

    // 15 * 1.1 * 1.5 = 24.75
    auto damage = combat.ComputePunchDamage(attacker, gear, PunchStep{0, 1.0f, false});
    EXPECT_TRUE(damage.critical);
    EXPECT_FLOAT_EQ(damage.amount, 25.0f);
}

TEST(PunchDamageTest, LevelAndWeaponAddToBase) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    attacker.AddExperience(100.0f);  // level 2: AP 12, str 11
    EquipmentSet gear;
    ASSERT_TRUE(gear.Equip(makeWeapon(8.0f)).hasValue());

    // 12 + 11 * 0.5 + 1 * 2 + 8 = 27.5
    auto damage = combat.ComputePunchDamage(attacker, gear, PunchStep{0, 1.0f, false});
    EXPECT_FLOAT_EQ(damage.amount, 28.0f);
}

TEST(PunchDamageTest, DeadAttackerPunchesForNothing) {
    auto combat = makeResolver(fixedRandom(0.5f));
    StatBlock attacker(BalanceConfig::Defaults().progression);
    attacker.SetDead(true);
    EquipmentSet gear;

    auto damage = combat.ComputePunchDamage(attacker, gear, PunchStep{0, 1.0f, false});
    EXPECT_FLOAT_EQ(damage.amount, 0.0f);
}
