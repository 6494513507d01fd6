#pragma once

/// @file status_effect_types.hpp
/// @brief Status effect kinds and the per-kind record.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "arc/foundation/types.hpp"
#include "arc/game/balance_types.hpp"

namespace arc::game {

/// Discrete condition a character can be under.
///
/// COUNT is a sentinel used for array sizing.
enum class StatusKind : uint8_t {
    Slow,
    Stun,
    Burn,
    Poison,
    Freeze,
    COUNT
};

constexpr std::size_t kStatusKindCount = static_cast<std::size_t>(StatusKind::COUNT);

inline constexpr std::array<std::string_view, kStatusKindCount> kStatusKindNames = {
    "slow", "stun", "burn", "poison", "freeze"};

constexpr std::string_view statusKindName(StatusKind kind) {
    return detail::nameOf(kStatusKindNames, kind);
}

constexpr std::optional<StatusKind> parseStatusKind(std::string_view name) {
    return detail::parseByName<StatusKind>(kStatusKindNames, name);
}

/// True for kinds that deal periodic damage.
constexpr bool isDamageOverTime(StatusKind kind) {
    return kind == StatusKind::Burn || kind == StatusKind::Poison;
}

/// True for kinds that take away movement.
constexpr bool isImmobilizing(StatusKind kind) {
    return kind == StatusKind::Stun || kind == StatusKind::Freeze;
}

/// One active status effect.
///
/// Slow lives as a movement-speed scale in the StatBlock's modifier set;
/// immobilizers keep the canMove value they overwrote.
struct StatusEffect {
    StatusKind kind = StatusKind::Slow;
    float remaining = 0.0f;     ///< Seconds left.
    float intensity = 0.0f;     ///< 0-1.
    float tickDamage = 0.0f;    ///< Damage per tick before intensity (DOT only).
    float tickAccumulator = 0.0f;
    std::optional<bool> originalCanMove;         ///< Stun, Freeze
    std::optional<foundation::EffectHandle> visual;
};

} // namespace arc::game
