/// @file loot_roller.cpp
/// @brief LootRoller implementation.

#include "arc/game/loot_roller.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::LogCategory;

LootRoller::LootRoller(const BalanceConfig& balance, RandomSource random)
    : balance_(balance), random_(std::move(random)) {}

namespace {

const WorldTier* tierOrNull(const BalanceConfig& balance, int32_t worldTier) {
    const auto* tier = balance.GetWorldTier(worldTier);
    if (tier == nullptr && worldTier != 1) {
        ARC_LOG_WARN(LogCategory::Progression,
                     "unknown world tier " + std::to_string(worldTier) + " ignored for loot");
    }
    return tier;
}

void scaleBonuses(StatBonuses& bonuses, float factor) {
    bonuses.damage = std::floor(bonuses.damage * factor);
    bonuses.damageReduction *= factor;
    bonuses.strength *= factor;
    bonuses.dexterity *= factor;
    bonuses.intelligence *= factor;
    bonuses.maxHealth *= factor;
    bonuses.maxMana *= factor;
    bonuses.attackPower *= factor;
    bonuses.movementSpeed *= factor;
}

} // namespace

float LootRoller::DropChance(bool isBoss, Difficulty difficulty, int32_t worldTier) const {
    if (isBoss) {
        return balance_.drops.boss;
    }
    float chance = balance_.drops.normal * balance_.GetDifficulty(difficulty).dropRateMultiplier;
    if (const auto* tier = balance_.GetWorldTier(worldTier)) {
        chance *= tier->itemQuantityMultiplier;
    }
    return std::min(1.0f, chance);
}

std::optional<LootDrop> LootRoller::RollDrop(bool isBoss, Difficulty difficulty) {
    LootContext context;
    context.difficulty = difficulty;
    return RollDrop(isBoss, context);
}

std::optional<LootDrop> LootRoller::RollDrop(bool isBoss, const LootContext& context) {
    const auto* tier = tierOrNull(balance_, context.worldTier);
    if (random_() >= DropChance(isBoss, context.difficulty, tier ? tier->tier : 1)) {
        return std::nullopt;
    }

    const auto& table = isBoss ? balance_.bossLoot : balance_.regularLoot;
    const auto* entry = PickWeighted(table);
    if (entry == nullptr) {
        ARC_LOG_WARN(LogCategory::Progression, "drop table has no weighted entries");
        return std::nullopt;
    }

    LootDrop drop;
    drop.item = makeItem(*entry);
    if (drop.IsGold() && tier != nullptr) {
        drop.item.amount = static_cast<int32_t>(
            std::lround(static_cast<float>(drop.item.amount) * tier->goldMultiplier));
    }
    if (drop.item.IsEquippable() && context.playerLevel > 0) {
        upgradeRarity(drop.item, isBoss, context);
    }
    ARC_LOG_DEBUG(LogCategory::Progression,
                  "dropped " + drop.item.name + " x" + std::to_string(drop.item.amount));
    return drop;
}

const LootEntry* LootRoller::PickWeighted(std::span<const LootEntry> table) {
    float total = 0.0f;
    for (const auto& entry : table) {
        total += std::max(0.0f, entry.weight);
    }
    if (total <= 0.0f) {
        return nullptr;
    }

    float roll = random_() * total;
    const LootEntry* last = nullptr;
    for (const auto& entry : table) {
        if (entry.weight <= 0.0f) {
            continue;
        }
        roll -= entry.weight;
        if (roll < 0.0f) {
            return &entry;
        }
        last = &entry;
    }
    // Rounding can leave roll at exactly zero after the last entry.
    return last;
}

ItemRarity LootRoller::RollRarity(int32_t playerLevel, Difficulty difficulty,
                                  int32_t worldTier) {
    float quality = balance_.GetDifficulty(difficulty).itemQualityMultiplier;
    if (const auto* tier = balance_.GetWorldTier(worldTier)) {
        quality *= tier->itemQualityMultiplier;
    }

    std::array<float, kItemRarityCount> chances{};
    float total = 0.0f;
    for (std::size_t i = 0; i < kItemRarityCount; ++i) {
        const auto& rarity = balance_.rarities[i];
        if (playerLevel < rarity.minLevel) {
            continue;
        }
        float chance = rarity.baseDropChancePercent +
                       static_cast<float>(playerLevel) * rarity.levelInfluencePercent;
        if (i != static_cast<std::size_t>(ItemRarity::Common)) {
            chance *= quality;
        }
        chances[i] = std::max(0.0f, chance);
        total += chances[i];
    }
    if (total <= 0.0f) {
        return ItemRarity::Common;
    }

    float roll = random_() * total;
    for (std::size_t i = 0; i < kItemRarityCount; ++i) {
        if (chances[i] <= 0.0f) {
            continue;
        }
        roll -= chances[i];
        if (roll < 0.0f) {
            return static_cast<ItemRarity>(i);
        }
    }
    return ItemRarity::Common;
}

Item LootRoller::makeItem(const LootEntry& entry) {
    Item item;
    item.id = foundation::ItemId(nextItemId_++);
    item.name = entry.name;
    item.category = entry.category;
    item.slot = entry.slot;
    item.rarity = entry.rarity;

    int32_t span = std::max(0, entry.maxAmount - entry.minAmount);
    item.amount = entry.minAmount +
                  std::min(span, static_cast<int32_t>(random_() * static_cast<float>(span + 1)));

    if (entry.maxDamage > 0.0f) {
        item.bonuses.damage = std::floor(
            entry.minDamage + random_() * (entry.maxDamage - entry.minDamage + 1.0f));
        item.bonuses.damage = std::min(item.bonuses.damage, entry.maxDamage);
    }
    if (entry.maxDamageReduction > 0.0f) {
        item.bonuses.damageReduction =
            entry.minDamageReduction +
            random_() * (entry.maxDamageReduction - entry.minDamageReduction);
    }
    return item;
}

void LootRoller::upgradeRarity(Item& item, bool isBoss, const LootContext& context) {
    auto rolled = RollRarity(context.playerLevel, context.difficulty, context.worldTier);
    auto rarity = std::max(item.rarity, rolled);

    const auto* tier = balance_.GetWorldTier(context.worldTier);
    if (isBoss && tier != nullptr && tier->guaranteedLegendary) {
        rarity = std::max(rarity, ItemRarity::Legendary);
    }
    if (rarity == item.rarity) {
        return;
    }

    float from = balance_.GetRarity(item.rarity).statMultiplier;
    float to = balance_.GetRarity(rarity).statMultiplier;
    if (from > 0.0f) {
        scaleBonuses(item.bonuses, to / from);
    }
    ARC_LOG_DEBUG(LogCategory::Progression,
                  item.name + " upgraded to " + std::string(itemRarityName(rarity)));
    item.rarity = rarity;
}

} // namespace arc::game
