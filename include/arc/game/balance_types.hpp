#pragma once

/// @file balance_types.hpp
/// @brief Enumerations keyed by the balance tables.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace arc::game {

/// Difficulty setting chosen by the player.
///
/// COUNT is a sentinel used for array sizing.
enum class Difficulty : uint8_t {
    Basic,
    Medium,
    Hard,
    Hell,
    Inferno,
    COUNT
};

constexpr std::size_t kDifficultyCount = static_cast<std::size_t>(Difficulty::COUNT);

/// Item rarity tier, lowest first.
enum class ItemRarity : uint8_t {
    Common,
    Uncommon,
    Rare,
    Epic,
    Legendary,
    Mythic,
    COUNT
};

constexpr std::size_t kItemRarityCount = static_cast<std::size_t>(ItemRarity::COUNT);

/// Enemy strength class, applied on top of level and zone scaling.
enum class EnemyRank : uint8_t { Normal, Elite, Champion, Boss, COUNT };

constexpr std::size_t kEnemyRankCount = static_cast<std::size_t>(EnemyRank::COUNT);

/// World zone; each carries a flat difficulty multiplier.
enum class Zone : uint8_t {
    Forest,
    Ruins,
    Swamp,
    Mountains,
    DarkSanctum,
    HellfirePeaks,
    FrozenWastes,
    COUNT
};

constexpr std::size_t kZoneCount = static_cast<std::size_t>(Zone::COUNT);

/// How damage-over-time status effects schedule their ticks.
enum class DotMode : uint8_t {
    Stochastic,    ///< Bernoulli trial per update with p = delta * ticksPerSecond.
    FixedInterval  ///< Accumulator firing every 1 / ticksPerSecond seconds.
};

// ── Names (used as YAML keys and in log lines) ─────────────────────────────

inline constexpr std::array<std::string_view, kDifficultyCount> kDifficultyNames = {
    "basic", "medium", "hard", "hell", "inferno"};

inline constexpr std::array<std::string_view, kItemRarityCount> kItemRarityNames = {
    "common", "uncommon", "rare", "epic", "legendary", "mythic"};

inline constexpr std::array<std::string_view, kEnemyRankCount> kEnemyRankNames = {
    "normal", "elite", "champion", "boss"};

inline constexpr std::array<std::string_view, kZoneCount> kZoneNames = {
    "forest", "ruins", "swamp", "mountains",
    "dark_sanctum", "hellfire_peaks", "frozen_wastes"};

namespace detail {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> parseByName(const std::array<std::string_view, N>& names,
                                          std::string_view name) {
    for (std::size_t i = 0; i < N; ++i) {
        if (names[i] == name) {
            return static_cast<Enum>(i);
        }
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view nameOf(const std::array<std::string_view, N>& names, Enum value) {
    auto idx = static_cast<std::size_t>(value);
    return idx < N ? names[idx] : "unknown";
}

} // namespace detail

constexpr std::string_view difficultyName(Difficulty d) {
    return detail::nameOf(kDifficultyNames, d);
}
constexpr std::string_view itemRarityName(ItemRarity r) {
    return detail::nameOf(kItemRarityNames, r);
}
constexpr std::string_view enemyRankName(EnemyRank r) {
    return detail::nameOf(kEnemyRankNames, r);
}
constexpr std::string_view zoneName(Zone z) {
    return detail::nameOf(kZoneNames, z);
}

constexpr std::optional<Difficulty> parseDifficulty(std::string_view name) {
    return detail::parseByName<Difficulty>(kDifficultyNames, name);
}
constexpr std::optional<ItemRarity> parseItemRarity(std::string_view name) {
    return detail::parseByName<ItemRarity>(kItemRarityNames, name);
}
constexpr std::optional<EnemyRank> parseEnemyRank(std::string_view name) {
    return detail::parseByName<EnemyRank>(kEnemyRankNames, name);
}
constexpr std::optional<Zone> parseZone(std::string_view name) {
    return detail::parseByName<Zone>(kZoneNames, name);
}

} // namespace arc::game
