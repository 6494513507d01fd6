/// @file equipment_set.cpp
/// @brief EquipmentSet implementation.

#include "arc/game/equipment_set.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::size_t indexOf(EquipSlot slot) {
    return static_cast<std::size_t>(slot);
}

} // namespace

GameResult<std::optional<Item>> EquipmentSet::Equip(Item item) {
    if (!item.IsEquippable() || *item.slot == EquipSlot::COUNT) {
        return GameResult<std::optional<Item>>::err(
            GameError(ErrorCode::ItemNotEquippable, "item cannot be equipped: " + item.name,
                      item.name));
    }

    auto slot = *item.slot;
    item.amount = 1;
    std::optional<Item> displaced = std::move(slots_[indexOf(slot)]);
    ARC_LOG_INFO(LogCategory::Equipment,
                 "equipped " + item.name + " in " + std::string(equipSlotName(slot)));
    slots_[indexOf(slot)] = std::move(item);
    recompute();
    return GameResult<std::optional<Item>>::ok(std::move(displaced));
}

GameResult<Item> EquipmentSet::Unequip(EquipSlot slot) {
    if (slot == EquipSlot::COUNT || !slots_[indexOf(slot)]) {
        return GameResult<Item>::err(
            GameError(ErrorCode::SlotEmpty,
                      "nothing equipped in " + std::string(equipSlotName(slot))));
    }
    Item removed = std::move(*slots_[indexOf(slot)]);
    slots_[indexOf(slot)].reset();
    recompute();
    ARC_LOG_INFO(LogCategory::Equipment, "unequipped " + removed.name);
    return GameResult<Item>::ok(std::move(removed));
}

GameResult<void> EquipmentSet::EquipFromInventory(std::string_view name,
                                                  Inventory& inventory) {
    const auto* held = inventory.Find(name);
    if (held == nullptr) {
        return GameResult<void>::err(GameError(ErrorCode::ItemNotFound,
                                               "item not in inventory: " + std::string(name),
                                               std::string(name)));
    }
    Item item = *held;

    auto displaced = Equip(item);
    if (!displaced) {
        return GameResult<void>::err(displaced.error());
    }
    inventory.Remove(name, 1);
    if (displaced.value()) {
        inventory.Add(std::move(*displaced.value()));
    }
    return GameResult<void>::ok();
}

GameResult<void> EquipmentSet::UnequipToInventory(EquipSlot slot, Inventory& inventory) {
    auto removed = Unequip(slot);
    if (!removed) {
        return GameResult<void>::err(removed.error());
    }
    inventory.Add(std::move(removed).value());
    return GameResult<void>::ok();
}

const Item* EquipmentSet::GetEquipped(EquipSlot slot) const {
    if (slot == EquipSlot::COUNT || !slots_[indexOf(slot)]) {
        return nullptr;
    }
    return &*slots_[indexOf(slot)];
}

float EquipmentSet::DamageReduction() const {
    const auto* armor = GetEquipped(EquipSlot::Armor);
    if (armor == nullptr) {
        return 0.0f;
    }
    float reduction = foundation::sanitizeFloat(armor->bonuses.damageReduction, 0.0f,
                                                "armor damage reduction");
    return std::clamp(reduction, 0.0f, 1.0f);
}

float EquipmentSet::WeaponDamage() const {
    const auto* weapon = GetEquipped(EquipSlot::Weapon);
    if (weapon == nullptr) {
        return 0.0f;
    }
    return foundation::sanitizeFloat(weapon->bonuses.damage, 0.0f, "weapon damage");
}

std::size_t EquipmentSet::EquippedCount() const {
    return static_cast<std::size_t>(std::count_if(
        slots_.begin(), slots_.end(), [](const auto& slot) { return slot.has_value(); }));
}

void EquipmentSet::recompute() {
    bonuses_ = StatBonuses{};
    for (const auto& slot : slots_) {
        if (slot) {
            bonuses_ += slot->bonuses;
        }
    }
}

} // namespace arc::game
