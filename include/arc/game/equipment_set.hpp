#pragma once

/// @file equipment_set.hpp
/// @brief EquipmentSet: one optional item per slot and the bonuses they add.

#include <array>
#include <optional>
#include <string_view>

#include "arc/foundation/game_result.hpp"
#include "arc/game/equipment_types.hpp"
#include "arc/game/inventory.hpp"

namespace arc::game {

/// Equipped items.
///
/// An item lives in the slot its definition names and nowhere else. The
/// aggregate StatBonuses are rebuilt from scratch after every change.
class EquipmentSet {
public:
    /// Put an item into its slot.
    /// @return The item previously in that slot (if any), or
    ///         ItemNotEquippable.
    foundation::GameResult<std::optional<Item>> Equip(Item item);

    /// Empty a slot.
    /// @return The removed item, or SlotEmpty.
    foundation::GameResult<Item> Unequip(EquipSlot slot);

    /// Move one item of the named stack from the bag into its slot. A
    /// displaced item goes back into the bag.
    foundation::GameResult<void> EquipFromInventory(std::string_view name,
                                                    Inventory& inventory);

    /// Move the item in a slot back into the bag.
    foundation::GameResult<void> UnequipToInventory(EquipSlot slot, Inventory& inventory);

    /// Item in a slot, or nullptr.
    [[nodiscard]] const Item* GetEquipped(EquipSlot slot) const;

    [[nodiscard]] const StatBonuses& Bonuses() const noexcept { return bonuses_; }

    /// Damage reduction of the equipped armor, in [0, 1]. 0 without armor.
    [[nodiscard]] float DamageReduction() const;

    /// Damage bonus of the equipped weapon. 0 without a weapon.
    [[nodiscard]] float WeaponDamage() const;

    [[nodiscard]] std::size_t EquippedCount() const;

private:
    void recompute();

    std::array<std::optional<Item>, kEquipSlotCount> slots_{};
    StatBonuses bonuses_;
};

} // namespace arc::game
