/// @file balance_defaults.cpp
/// @brief The shipped balance tables.

#include "arc/game/balance_config.hpp"

#include <string>
#include <utility>

namespace arc::game {

namespace {

LootEntry consumable(std::string name, int32_t amount, float weight) {
    LootEntry e;
    e.name = std::move(name);
    e.category = ItemCategory::Consumable;
    e.minAmount = amount;
    e.maxAmount = amount;
    e.weight = weight;
    return e;
}

LootEntry gold(std::string name, int32_t minAmount, int32_t maxAmount, float weight) {
    LootEntry e;
    e.name = std::move(name);
    e.category = ItemCategory::Currency;
    e.minAmount = minAmount;
    e.maxAmount = maxAmount;
    e.weight = weight;
    return e;
}

LootEntry gear(std::string name, EquipSlot slot, ItemRarity rarity,
               float minDamage, float maxDamage,
               float minReduction, float maxReduction, float weight) {
    LootEntry e;
    e.name = std::move(name);
    e.category = ItemCategory::Equipment;
    e.slot = slot;
    e.rarity = rarity;
    e.minDamage = minDamage;
    e.maxDamage = maxDamage;
    e.minDamageReduction = minReduction;
    e.maxDamageReduction = maxReduction;
    e.weight = weight;
    return e;
}

} // namespace

BalanceConfig BalanceConfig::Defaults() {
    BalanceConfig cfg;

    // Enemy ranks: health, damage.
    cfg.enemyScaling.ranks = {{
        {1.0f, 1.0f},  // normal
        {1.8f, 1.3f},  // elite
        {2.2f, 1.4f},  // champion
        {3.0f, 1.5f},  // boss
    }};
    cfg.enemyScaling.zones = {1.0f, 1.2f, 1.4f, 1.6f, 1.8f, 2.0f, 2.2f};

    // name, level offset, damage, health, experience, item quality,
    // drop rate, affix chance, special ability chance, guaranteed rare affix
    cfg.difficulties = {{
        {"Basic (Easy)",        -5, 0.7f, 0.7f, 0.8f, 0.8f, 1.2f, 0.5f, 0.5f, false},
        {"Medium (Normal)",     -2, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, false},
        {"Hard (Challenging)",   2, 1.3f, 1.5f, 1.2f, 1.2f, 1.0f, 1.5f, 1.5f, false},
        {"Hell (Very Hard)",     5, 2.0f, 2.5f, 1.5f, 1.5f, 0.8f, 2.0f, 2.0f, false},
        {"Inferno (Endgame)",   10, 3.0f, 4.0f, 2.0f, 2.0f, 0.7f, 3.0f, 3.0f, true},
    }};

    cfg.worldTiers = {
        {1, "World Tier I",   1.0f, 1.0f, 1.0f, 1.0f, 1.0f, false},
        {2, "World Tier II",  1.5f, 1.2f, 1.1f, 1.2f, 1.2f, false},
        {3, "World Tier III", 2.0f, 1.4f, 1.2f, 1.4f, 1.4f, false},
        {4, "World Tier IV",  2.5f, 1.6f, 1.3f, 1.6f, 1.6f, false},
        {5, "World Tier V",   3.0f, 1.8f, 1.4f, 1.8f, 1.8f, false},
        {6, "World Tier VI",  4.0f, 2.0f, 1.5f, 2.0f, 2.0f, true},
    };

    // stat multiplier, base drop %, level influence (points/level), min level
    cfg.rarities = {{
        {1.0f, 60.0f, -0.5f,  1},
        {1.2f, 25.0f,  0.2f,  1},
        {1.5f, 10.0f,  0.15f, 5},
        {2.0f,  4.0f,  0.1f, 10},
        {2.5f,  1.0f,  0.04f, 20},
        {3.0f,  0.1f,  0.01f, 30},
    }};

    cfg.regularLoot = {
        consumable("Health Potion", 1, 40.0f),
        consumable("Mana Potion", 1, 30.0f),
        gold("Gold Coin", 5, 24, 20.0f),
        gear("Common Weapon", EquipSlot::Weapon, ItemRarity::Common, 5.0f, 9.0f, 0.0f, 0.0f, 5.0f),
        gear("Common Armor", EquipSlot::Armor, ItemRarity::Common, 0.0f, 0.0f, 0.05f, 0.1f, 5.0f),
    };

    cfg.bossLoot = {
        consumable("Greater Health Potion", 2, 20.0f),
        consumable("Greater Mana Potion", 2, 15.0f),
        gold("Gold Pile", 50, 149, 20.0f),
        gear("Rare Weapon", EquipSlot::Weapon, ItemRarity::Rare, 15.0f, 24.0f, 0.0f, 0.0f, 15.0f),
        gear("Rare Armor", EquipSlot::Armor, ItemRarity::Rare, 0.0f, 0.0f, 0.1f, 0.2f, 15.0f),
        gear("Rare Helmet", EquipSlot::Helmet, ItemRarity::Rare, 2.0f, 4.0f, 0.05f, 0.1f, 10.0f),
        gear("Rare Boots", EquipSlot::Boots, ItemRarity::Rare, 0.0f, 0.0f, 0.05f, 0.1f, 5.0f),
    };

    // id, name, health, damage, speed, attack range, experience, zone, boss
    cfg.enemies = {
        {"skeleton", "Skeleton", 50.0f, 10.0f, 3.0f, 1.5f, 20.0f, Zone::Ruins, false},
        {"skeleton_archer", "Skeleton Archer", 40.0f, 15.0f, 2.5f, 8.0f, 25.0f, Zone::Ruins, false},
        {"zombie", "Zombie", 80.0f, 15.0f, 2.0f, 1.2f, 30.0f, Zone::Swamp, false},
        {"zombie_brute", "Zombie Brute", 120.0f, 25.0f, 1.5f, 1.8f, 45.0f, Zone::Swamp, false},
        {"demon", "Demon", 100.0f, 20.0f, 4.0f, 1.8f, 50.0f, Zone::Mountains, false},
        {"demon_scout", "Demon Scout", 70.0f, 15.0f, 5.0f, 1.5f, 40.0f, Zone::Mountains, false},
        {"necromancer", "Necromancer", 80.0f, 18.0f, 2.5f, 6.0f, 45.0f, Zone::Ruins, false},
        {"shadow_beast", "Shadow Beast", 90.0f, 22.0f, 3.5f, 1.5f, 55.0f, Zone::Forest, false},
        {"infernal_golem", "Infernal Golem", 150.0f, 30.0f, 1.8f, 2.0f, 70.0f, Zone::Mountains, false},
        {"forest_spider", "Forest Spider", 60.0f, 12.0f, 4.5f, 1.2f, 25.0f, Zone::Forest, false},
        {"corrupted_treant", "Corrupted Treant", 140.0f, 18.0f, 1.5f, 2.5f, 40.0f, Zone::Forest, false},
        {"feral_wolf", "Feral Wolf", 70.0f, 14.0f, 5.0f, 1.3f, 30.0f, Zone::Forest, false},
        {"ancient_guardian", "Ancient Guardian", 160.0f, 22.0f, 1.8f, 2.0f, 60.0f, Zone::Ruins, false},
        {"cursed_spirit", "Cursed Spirit", 65.0f, 16.0f, 3.0f, 4.0f, 35.0f, Zone::Ruins, false},
        {"ruin_crawler", "Ruin Crawler", 85.0f, 14.0f, 3.2f, 1.0f, 30.0f, Zone::Ruins, false},
        {"poison_toad", "Poison Toad", 75.0f, 12.0f, 2.5f, 5.0f, 35.0f, Zone::Swamp, false},
        {"bog_lurker", "Bog Lurker", 110.0f, 20.0f, 1.8f, 2.2f, 45.0f, Zone::Swamp, false},
        {"swamp_witch", "Swamp Witch", 70.0f, 18.0f, 2.2f, 7.0f, 50.0f, Zone::Swamp, false},
        {"frost_elemental", "Frost Elemental", 90.0f, 22.0f, 2.5f, 5.0f, 45.0f, Zone::Mountains, false},
        {"mountain_troll", "Mountain Troll", 180.0f, 28.0f, 1.5f, 2.5f, 65.0f, Zone::Mountains, false},
        {"harpy", "Harpy", 75.0f, 16.0f, 4.5f, 1.5f, 40.0f, Zone::Mountains, false},
        {"void_wraith", "Void Wraith", 85.0f, 24.0f, 3.0f, 3.0f, 55.0f, Zone::DarkSanctum, false},
        {"blood_cultist", "Blood Cultist", 70.0f, 18.0f, 2.8f, 1.8f, 45.0f, Zone::DarkSanctum, false},
        {"shadow_stalker", "Shadow Stalker", 95.0f, 26.0f, 3.8f, 1.5f, 60.0f, Zone::DarkSanctum, false},
        {"fire_elemental", "Fire Elemental", 100.0f, 25.0f, 2.8f, 4.5f, 50.0f, Zone::HellfirePeaks, false},
        {"lava_golem", "Lava Golem", 190.0f, 30.0f, 1.5f, 2.2f, 70.0f, Zone::HellfirePeaks, false},
        {"ash_demon", "Ash Demon", 120.0f, 22.0f, 3.2f, 2.0f, 55.0f, Zone::HellfirePeaks, false},
        {"flame_imp", "Flame Imp", 60.0f, 15.0f, 4.5f, 1.2f, 30.0f, Zone::HellfirePeaks, false},
        {"hellhound", "Hellhound", 85.0f, 20.0f, 4.8f, 1.5f, 45.0f, Zone::HellfirePeaks, false},
        {"ice_golem", "Ice Golem", 170.0f, 26.0f, 1.6f, 2.2f, 65.0f, Zone::FrozenWastes, false},
        {"snow_troll", "Snow Troll", 150.0f, 24.0f, 2.0f, 2.0f, 60.0f, Zone::FrozenWastes, false},
        {"frozen_revenant", "Frozen Revenant", 90.0f, 22.0f, 2.5f, 1.8f, 50.0f, Zone::FrozenWastes, false},
        {"winter_wolf", "Winter Wolf", 80.0f, 18.0f, 4.5f, 1.5f, 40.0f, Zone::FrozenWastes, false},
        {"skeleton_king", "Skeleton King", 300.0f, 25.0f, 2.5f, 2.0f, 200.0f, Zone::Ruins, true},
        {"swamp_horror", "Swamp Horror", 400.0f, 30.0f, 1.8f, 2.2f, 250.0f, Zone::Swamp, true},
        {"demon_lord", "Demon Lord", 500.0f, 35.0f, 3.0f, 2.5f, 300.0f, Zone::Mountains, true},
        {"frost_titan", "Frost Titan", 600.0f, 40.0f, 2.0f, 3.0f, 350.0f, Zone::Mountains, true},
        {"necromancer_lord", "Necromancer Lord", 550.0f, 35.0f, 2.2f, 8.0f, 320.0f, Zone::DarkSanctum, true},
        {"ancient_treant", "Ancient Treant", 450.0f, 30.0f, 1.5f, 3.0f, 280.0f, Zone::Forest, true},
        {"spider_queen", "Spider Queen", 380.0f, 28.0f, 3.2f, 2.5f, 260.0f, Zone::Forest, true},
        {"ancient_construct", "Ancient Construct", 520.0f, 38.0f, 1.8f, 2.5f, 310.0f, Zone::Ruins, true},
        {"plague_lord", "Plague Lord", 480.0f, 32.0f, 2.0f, 4.0f, 290.0f, Zone::Swamp, true},
        {"void_harbinger", "Void Harbinger", 580.0f, 42.0f, 2.5f, 5.0f, 340.0f, Zone::DarkSanctum, true},
        {"inferno_lord", "Inferno Lord", 650.0f, 45.0f, 2.2f, 3.5f, 380.0f, Zone::HellfirePeaks, true},
        {"molten_behemoth", "Molten Behemoth", 700.0f, 48.0f, 1.5f, 2.8f, 400.0f, Zone::HellfirePeaks, true},
        {"frost_monarch", "Frost Monarch", 620.0f, 43.0f, 2.0f, 4.0f, 370.0f, Zone::FrozenWastes, true},
        {"ancient_yeti", "Ancient Yeti", 680.0f, 46.0f, 1.8f, 2.5f, 390.0f, Zone::FrozenWastes, true},
    };

    cfg.rewards.milestones = {
        {5,  "First Skill Variant Unlocked",  2,  0,  250},
        {10, "Second Skill Variant Unlocked", 3,  0,  500},
        {15, "Third Skill Variant Unlocked",  3,  5,  750},
        {20, "Special Ability Unlocked",      4,  0, 1000},
        {30, "World Tier System Unlocked",    5, 10, 2000},
    };

    return cfg;
}

} // namespace arc::game
