#pragma once

/// @file inventory.hpp
/// @brief Inventory: the character's bag of item stacks and gold.

#include <cstdint>
#include <string_view>
#include <vector>

#include "arc/foundation/game_result.hpp"
#include "arc/game/equipment_types.hpp"

namespace arc::game {

/// Item stacks keyed by name, plus a gold purse.
class Inventory {
public:
    /// Add a stack, merging with an existing stack of the same name.
    /// Stacks with a non-positive amount are ignored.
    void Add(Item item);

    /// Take amount items from the named stack, dropping the stack when it
    /// runs out.
    /// @return false when no stack has that name.
    bool Remove(std::string_view name, int32_t amount = 1);

    [[nodiscard]] const Item* Find(std::string_view name) const;
    [[nodiscard]] int32_t CountOf(std::string_view name) const;
    [[nodiscard]] const std::vector<Item>& Items() const noexcept { return items_; }
    [[nodiscard]] std::size_t StackCount() const noexcept { return items_.size(); }

    [[nodiscard]] int64_t Gold() const noexcept { return gold_; }

    /// Non-positive amounts are ignored.
    void AddGold(int64_t amount);

    /// @return InsufficientGold (purse untouched) when amount exceeds Gold().
    foundation::GameResult<void> SpendGold(int64_t amount);

private:
    std::vector<Item> items_;
    int64_t gold_ = 0;
};

} // namespace arc::game
