/// @file inventory.cpp
/// @brief Inventory implementation.

#include "arc/game/inventory.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

void Inventory::Add(Item item) {
    if (item.amount <= 0) {
        return;
    }
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&](const Item& held) { return held.name == item.name; });
    if (it != items_.end()) {
        it->amount += item.amount;
        return;
    }
    items_.push_back(std::move(item));
}

bool Inventory::Remove(std::string_view name, int32_t amount) {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&](const Item& held) { return held.name == name; });
    if (it == items_.end()) {
        return false;
    }
    it->amount -= amount;
    if (it->amount <= 0) {
        items_.erase(it);
    }
    return true;
}

const Item* Inventory::Find(std::string_view name) const {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&](const Item& held) { return held.name == name; });
    return it != items_.end() ? &*it : nullptr;
}

int32_t Inventory::CountOf(std::string_view name) const {
    const auto* item = Find(name);
    return item != nullptr ? item->amount : 0;
}

void Inventory::AddGold(int64_t amount) {
    if (amount > 0) {
        gold_ += amount;
    }
}

GameResult<void> Inventory::SpendGold(int64_t amount) {
    if (amount < 0 || amount > gold_) {
        ARC_LOG_DEBUG(LogCategory::Equipment,
                      "cannot spend " + std::to_string(amount) + " gold, have " +
                          std::to_string(gold_));
        return GameResult<void>::err(GameError(ErrorCode::InsufficientGold,
                                               "not enough gold", amount));
    }
    gold_ -= amount;
    return GameResult<void>::ok();
}

} // namespace arc::game
