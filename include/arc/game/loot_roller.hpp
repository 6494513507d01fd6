#pragma once

/// @file loot_roller.hpp
/// @brief LootRoller: drop trials, weighted table picks and rarity rolls.

#include <cstdint>
#include <optional>
#include <span>

#include "arc/game/balance_config.hpp"
#include "arc/game/equipment_types.hpp"
#include "arc/game/random_source.hpp"

namespace arc::game {

/// One rolled drop. Currency drops carry their gold in item.amount.
struct LootDrop {
    Item item;

    [[nodiscard]] bool IsGold() const noexcept {
        return item.category == ItemCategory::Currency;
    }
};

/// Where and for whom a drop is rolled.
struct LootContext {
    Difficulty difficulty = Difficulty::Medium;
    int32_t worldTier = 1;
    int32_t playerLevel = 0;  ///< 0 keeps every item at its table rarity.
};

/// Rolls loot from the BalanceConfig drop tables.
///
/// Every random draw comes from the injected RandomSource, so a fixed
/// source gives a fixed sequence of drops.
class LootRoller {
public:
    LootRoller(const BalanceConfig& balance, RandomSource random);

    /// Drop-chance trial followed by a weighted pick from the boss or
    /// regular table.
    /// @return The drop, or nullopt when the trial fails or the table is empty.
    [[nodiscard]] std::optional<LootDrop> RollDrop(bool isBoss,
                                                   Difficulty difficulty = Difficulty::Medium);

    /// RollDrop() with world-tier multipliers applied. Gold is scaled by the
    /// tier's gold multiplier. With a player level, equipment also rolls a
    /// rarity: the table rarity is the floor, a guaranteed-legendary tier
    /// lifts boss gear to legendary, and bonuses scale by the ratio of the
    /// final to the table rarity's stat multiplier.
    [[nodiscard]] std::optional<LootDrop> RollDrop(bool isBoss, const LootContext& context);

    /// Rarity for a generated item at a player level.
    [[nodiscard]] ItemRarity RollRarity(int32_t playerLevel,
                                        Difficulty difficulty = Difficulty::Medium,
                                        int32_t worldTier = 1);

    /// Weighted pick; entries with non-positive weight never win.
    /// @return nullptr when no entry has positive weight.
    [[nodiscard]] const LootEntry* PickWeighted(std::span<const LootEntry> table);

    /// Drop chance of one roll after the difficulty drop-rate and world-tier
    /// item-quantity multipliers, capped at 1.
    [[nodiscard]] float DropChance(bool isBoss, Difficulty difficulty,
                                   int32_t worldTier = 1) const;

private:
    [[nodiscard]] Item makeItem(const LootEntry& entry);
    void upgradeRarity(Item& item, bool isBoss, const LootContext& context);

    const BalanceConfig& balance_;
    RandomSource random_;
    uint32_t nextItemId_ = 1;
};

} // namespace arc::game
