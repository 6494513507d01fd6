#pragma once

/// @file equipment_types.hpp
/// @brief Item, slot and stat-bonus types shared by equipment, inventory
///        and loot.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "arc/foundation/types.hpp"
#include "arc/game/balance_types.hpp"

namespace arc::game {

/// Equipment slot.
///
/// COUNT is a sentinel used for array sizing.
enum class EquipSlot : uint8_t {
    Weapon,
    Armor,
    Helmet,
    Boots,
    Accessory,
    COUNT
};

constexpr std::size_t kEquipSlotCount = static_cast<std::size_t>(EquipSlot::COUNT);

inline constexpr std::array<std::string_view, kEquipSlotCount> kEquipSlotNames = {
    "weapon", "armor", "helmet", "boots", "accessory"};

constexpr std::string_view equipSlotName(EquipSlot slot) {
    return detail::nameOf(kEquipSlotNames, slot);
}

constexpr std::optional<EquipSlot> parseEquipSlot(std::string_view name) {
    return detail::parseByName<EquipSlot>(kEquipSlotNames, name);
}

/// Broad item classification.
enum class ItemCategory : uint8_t { Consumable, Currency, Equipment, Material };

/// Additive bonuses an equipped item contributes.
struct StatBonuses {
    float damage = 0.0f;           ///< Added to punch damage (weapons).
    float damageReduction = 0.0f;  ///< Fraction in [0, 1) (armor).
    float strength = 0.0f;
    float dexterity = 0.0f;
    float intelligence = 0.0f;
    float maxHealth = 0.0f;
    float maxMana = 0.0f;
    float attackPower = 0.0f;
    float movementSpeed = 0.0f;

    StatBonuses& operator+=(const StatBonuses& other) {
        damage += other.damage;
        damageReduction += other.damageReduction;
        strength += other.strength;
        dexterity += other.dexterity;
        intelligence += other.intelligence;
        maxHealth += other.maxHealth;
        maxMana += other.maxMana;
        attackPower += other.attackPower;
        movementSpeed += other.movementSpeed;
        return *this;
    }

    bool operator==(const StatBonuses&) const = default;
};

/// An item stack held in the bag or an equipment slot.
///
/// Stacks are keyed by name; equipped items always have amount 1.
struct Item {
    foundation::ItemId id;
    std::string name;
    ItemCategory category = ItemCategory::Material;
    std::optional<EquipSlot> slot;
    ItemRarity rarity = ItemRarity::Common;
    int32_t amount = 1;
    StatBonuses bonuses;

    [[nodiscard]] bool IsEquippable() const noexcept {
        return category == ItemCategory::Equipment && slot.has_value();
    }
};

} // namespace arc::game
