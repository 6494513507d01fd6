#pragma once

/// @file stat_types.hpp
/// @brief Stat identifiers and character state flags.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "arc/game/balance_types.hpp"

namespace arc::game {

/// Stats that temporary modifiers and equipment can adjust.
///
/// Health and mana are pools, not stats; their maxima are.
enum class StatKind : uint8_t {
    MaxHealth,
    MaxMana,
    Strength,
    Dexterity,
    Intelligence,
    MovementSpeed,
    AttackPower,
    COUNT
};

constexpr std::size_t kStatKindCount = static_cast<std::size_t>(StatKind::COUNT);

inline constexpr std::array<std::string_view, kStatKindCount> kStatKindNames = {
    "max_health", "max_mana", "strength", "dexterity",
    "intelligence", "movement_speed", "attack_power"};

constexpr std::string_view statKindName(StatKind stat) {
    return detail::nameOf(kStatKindNames, stat);
}

constexpr std::optional<StatKind> parseStatKind(std::string_view name) {
    return detail::parseByName<StatKind>(kStatKindNames, name);
}

/// Coarse character state, mirrored to animation and input layers.
struct CharacterFlags {
    bool isMoving = false;
    bool isAttacking = false;
    bool isUsingSkill = false;
    bool inWater = false;
    bool isInteracting = false;
};

} // namespace arc::game
