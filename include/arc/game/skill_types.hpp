#pragma once

/// @file skill_types.hpp
/// @brief Skill definitions, live skill instances and cast errors.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "arc/foundation/game_error.hpp"
#include "arc/foundation/types.hpp"
#include "arc/game/balance_types.hpp"
#include "arc/game/math_types.hpp"
#include "arc/game/stat_types.hpp"

namespace arc::game {

// ── Tags ───────────────────────────────────────────────────────────────────

/// Behaviour family of a skill; selects its visual effect strategy.
enum class SkillType : uint8_t {
    Ranged,
    Aoe,
    Multi,
    Buff,
    Heal,
    Summon,
    Wave,
    Mark,
    Teleport,
    Dash,
    Projectile,
    Control,
    COUNT
};

constexpr std::size_t kSkillTypeCount = static_cast<std::size_t>(SkillType::COUNT);

inline constexpr std::array<std::string_view, kSkillTypeCount> kSkillTypeNames = {
    "ranged", "aoe",  "multi",    "buff", "heal",       "summon",
    "wave",   "mark", "teleport", "dash", "projectile", "control"};

constexpr std::string_view skillTypeName(SkillType type) {
    return detail::nameOf(kSkillTypeNames, type);
}

constexpr std::optional<SkillType> parseSkillType(std::string_view name) {
    return detail::parseByName<SkillType>(kSkillTypeNames, name);
}

/// Where a skill sits in the loadout.
enum class SkillCategory : uint8_t {
    Primary,  ///< Basic attack, no mana cost.
    Normal,
    Custom    ///< Shown only when custom skills are enabled.
};

// ── Definitions ────────────────────────────────────────────────────────────

/// Timed stat boost granted to the caster on cast.
struct SkillBoost {
    StatKind stat = StatKind::AttackPower;
    float amount = 0.0f;
    float duration = 0.0f;
};

/// Static description of one skill. Immutable once registered.
struct SkillDefinition {
    foundation::SkillId id;
    std::string name;
    std::string description;
    SkillType type = SkillType::Ranged;
    SkillCategory category = SkillCategory::Normal;
    float damage = 0.0f;
    float manaCost = 0.0f;
    float cooldown = 0.0f;
    float range = 0.0f;      ///< 0 means untargeted (default sweep range).
    float radius = 0.0f;
    float duration = 0.0f;   ///< Lifetime of one live instance.
    float healing = 0.0f;    ///< Heal skills.
    int32_t hits = 1;        ///< Multi-hit skills.
    int32_t allyCount = 0;   ///< Summon skills.
    bool stationary = false; ///< Never moves the caster.
    std::string color;       ///< Visual color token, e.g. "#4169e1".
    std::optional<SkillBoost> boost;

    [[nodiscard]] bool IsPrimary() const noexcept { return category == SkillCategory::Primary; }
    [[nodiscard]] bool IsCustom() const noexcept { return category == SkillCategory::Custom; }
};

/// One live cast of a skill.
///
/// Carries its own copy of the definition so a later catalog change cannot
/// alter a cast already in flight.
struct SkillInstance {
    foundation::SkillInstanceId id;
    SkillDefinition definition;
    std::string variant;   ///< Skill-tree variant active at cast time; empty for base.
    float elapsed = 0.0f;
    Vector3 origin;        ///< Where the effect started.
    Vector3 position;      ///< Where the effect is now.
    Vector3 direction;
    float reach = 0.0f;    ///< Travel distance chosen at placement, where used.
    std::optional<foundation::TargetHandle> target;
    std::optional<foundation::EffectHandle> visual;

    [[nodiscard]] bool Expired() const noexcept { return elapsed >= definition.duration; }
};

// ── Cast results ───────────────────────────────────────────────────────────

/// Why a cast was refused.
enum class CastError : uint8_t {
    OnCooldown,
    InsufficientMana,
    InvalidSkillId,
    NoTargetFound,
    CasterDead
};

constexpr std::string_view castErrorName(CastError error) {
    switch (error) {
        case CastError::OnCooldown:       return "OnCooldown";
        case CastError::InsufficientMana: return "InsufficientMana";
        case CastError::InvalidSkillId:   return "InvalidSkillId";
        case CastError::NoTargetFound:    return "NoTargetFound";
        case CastError::CasterDead:       return "CasterDead";
    }
    return "Unknown";
}

/// Same failure expressed as a GameError.
[[nodiscard]] foundation::GameError toGameError(CastError error);

/// What a successful cast did.
struct CastOutcome {
    foundation::SkillInstanceId instance;
    std::optional<foundation::TargetHandle> target;
    bool teleported = false;
    Vector3 casterPosition;  ///< After any teleport.
    float healed = 0.0f;
};

} // namespace arc::game
