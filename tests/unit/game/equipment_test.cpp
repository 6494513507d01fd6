#include <gtest/gtest.h>

#include <string>

#include "arc/game/equipment_set.hpp"
#include "arc/game/inventory.hpp"

using namespace arc::game;
using arc::foundation::ErrorCode;

namespace {

Item makeWeapon(std::string name, float damage) {
    Item item;
    item.name = std::move(name);
    item.category = ItemCategory::Equipment;
    item.slot = EquipSlot::Weapon;
    item.bonuses.damage = damage;
    return item;
}

Item makeArmor(std::string name, float reduction, float maxHealth = 0.0f) {
    Item item;
    item.name = std::move(name);
    item.category = ItemCategory::Equipment;
    item.slot = EquipSlot::Armor;
    item.bonuses.damageReduction = reduction;
    item.bonuses.maxHealth = maxHealth;
    return item;
}

Item makePotion(int32_t amount) {
    Item item;
    item.name = "Health Potion";
    item.category = ItemCategory::Consumable;
    item.amount = amount;
    return item;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Inventory
// ═══════════════════════════════════════════════════════════════════════════

TEST(InventoryTest, StacksMergeByName) {
    Inventory bag;
    bag.Add(makePotion(2));
    bag.Add(makePotion(3));
    EXPECT_EQ(bag.StackCount(), 1u);
    EXPECT_EQ(bag.CountOf("Health Potion"), 5);
}

TEST(InventoryTest, EmptyStacksAreIgnored) {
    Inventory bag;
    bag.Add(makePotion(0));
    EXPECT_EQ(bag.StackCount(), 0u);
}

TEST(InventoryTest, RemoveDropsExhaustedStack) {
    Inventory bag;
    bag.Add(makePotion(2));
    EXPECT_TRUE(bag.Remove("Health Potion"));
    EXPECT_EQ(bag.CountOf("Health Potion"), 1);
    EXPECT_TRUE(bag.Remove("Health Potion"));
    EXPECT_EQ(bag.Find("Health Potion"), nullptr);
    EXPECT_FALSE(bag.Remove("Health Potion"));
}

TEST(InventoryTest, GoldPurse) {
    Inventory bag;
    bag.AddGold(120);
    bag.AddGold(-50);
    EXPECT_EQ(bag.Gold(), 120);

    ASSERT_TRUE(bag.SpendGold(100).hasValue());
    EXPECT_EQ(bag.Gold(), 20);

    auto result = bag.SpendGold(21);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InsufficientGold);
    EXPECT_EQ(bag.Gold(), 20);
}

// ═══════════════════════════════════════════════════════════════════════════
// EquipmentSet
// ═══════════════════════════════════════════════════════════════════════════

TEST(EquipmentSetTest, EquipIntoEmptySlot) {
    EquipmentSet gear;
    auto result = gear.Equip(makeWeapon("Rusty Sword", 7.0f));
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().has_value());

    ASSERT_NE(gear.GetEquipped(EquipSlot::Weapon), nullptr);
    EXPECT_EQ(gear.GetEquipped(EquipSlot::Weapon)->name, "Rusty Sword");
    EXPECT_FLOAT_EQ(gear.WeaponDamage(), 7.0f);
    EXPECT_EQ(gear.EquippedCount(), 1u);
}

TEST(EquipmentSetTest, EquipReturnsDisplacedItem) {
    EquipmentSet gear;
    ASSERT_TRUE(gear.Equip(makeWeapon("Rusty Sword", 7.0f)).hasValue());
    auto result = gear.Equip(makeWeapon("Rare Blade", 20.0f));
    ASSERT_TRUE(result.hasValue());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(result.value()->name, "Rusty Sword");
    EXPECT_FLOAT_EQ(gear.WeaponDamage(), 20.0f);
    EXPECT_EQ(gear.EquippedCount(), 1u);
}

TEST(EquipmentSetTest, NonEquipmentIsRejected) {
    EquipmentSet gear;
    auto result = gear.Equip(makePotion(1));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ItemNotEquippable);
    EXPECT_EQ(gear.EquippedCount(), 0u);
}

TEST(EquipmentSetTest, BonusesAreRebuiltAfterEveryChange) {
    EquipmentSet gear;
    ASSERT_TRUE(gear.Equip(makeWeapon("Sword", 10.0f)).hasValue());
    ASSERT_TRUE(gear.Equip(makeArmor("Chainmail", 0.3f, 50.0f)).hasValue());

    EXPECT_FLOAT_EQ(gear.Bonuses().damage, 10.0f);
    EXPECT_FLOAT_EQ(gear.Bonuses().maxHealth, 50.0f);
    EXPECT_FLOAT_EQ(gear.DamageReduction(), 0.3f);

    ASSERT_TRUE(gear.Unequip(EquipSlot::Armor).hasValue());
    EXPECT_FLOAT_EQ(gear.Bonuses().maxHealth, 0.0f);
    EXPECT_FLOAT_EQ(gear.DamageReduction(), 0.0f);
    EXPECT_FLOAT_EQ(gear.Bonuses().damage, 10.0f);
}

TEST(EquipmentSetTest, DamageReductionIsClamped) {
    EquipmentSet gear;
    ASSERT_TRUE(gear.Equip(makeArmor("Cursed Plate", 1.7f)).hasValue());
    EXPECT_FLOAT_EQ(gear.DamageReduction(), 1.0f);
}

TEST(EquipmentSetTest, UnequipEmptySlotFails) {
    EquipmentSet gear;
    auto result = gear.Unequip(EquipSlot::Helmet);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SlotEmpty);
}

TEST(EquipmentSetTest, EquipFromInventorySwapsWithBag) {
    Inventory bag;
    EquipmentSet gear;
    bag.Add(makeWeapon("Sword", 10.0f));
    bag.Add(makeWeapon("Axe", 14.0f));

    ASSERT_TRUE(gear.EquipFromInventory("Sword", bag).hasValue());
    EXPECT_EQ(bag.Find("Sword"), nullptr);

    ASSERT_TRUE(gear.EquipFromInventory("Axe", bag).hasValue());
    EXPECT_EQ(gear.GetEquipped(EquipSlot::Weapon)->name, "Axe");
    EXPECT_EQ(bag.CountOf("Sword"), 1);
    EXPECT_EQ(bag.Find("Axe"), nullptr);
}

TEST(EquipmentSetTest, EquipFromInventoryRequiresTheItem) {
    Inventory bag;
    EquipmentSet gear;
    auto result = gear.EquipFromInventory("Sword", bag);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ItemNotFound);
}

TEST(EquipmentSetTest, FailedEquipLeavesBagUntouched) {
    Inventory bag;
    EquipmentSet gear;
    bag.Add(makePotion(1));
    auto result = gear.EquipFromInventory("Health Potion", bag);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(bag.CountOf("Health Potion"), 1);
}

TEST(EquipmentSetTest, UnequipToInventory) {
    Inventory bag;
    EquipmentSet gear;
    ASSERT_TRUE(gear.Equip(makeArmor("Chainmail", 0.2f)).hasValue());
    ASSERT_TRUE(gear.UnequipToInventory(EquipSlot::Armor, bag).hasValue());
    EXPECT_EQ(bag.CountOf("Chainmail"), 1);
    EXPECT_EQ(gear.EquippedCount(), 0u);
}
