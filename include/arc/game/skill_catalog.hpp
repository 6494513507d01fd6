#pragma once

/// @file skill_catalog.hpp
/// @brief SkillCatalog: skill definitions and their shared cooldown timers.

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "arc/foundation/game_result.hpp"
#include "arc/game/skill_types.hpp"

namespace arc::game {

/// Ids of the skills in SkillCatalog::DefaultCatalog().
namespace skill_ids {

inline constexpr foundation::SkillId kFistOfThunder{1};
inline constexpr foundation::SkillId kDeadlyReach{2};
inline constexpr foundation::SkillId kWaveOfLight{3};
inline constexpr foundation::SkillId kShieldOfZen{4};
inline constexpr foundation::SkillId kBreathOfHeaven{5};
inline constexpr foundation::SkillId kWaveStrike{6};
inline constexpr foundation::SkillId kCycloneStrike{7};
inline constexpr foundation::SkillId kSevenSidedStrike{8};
inline constexpr foundation::SkillId kInnerSanctuary{9};
inline constexpr foundation::SkillId kMysticAllies{10};
inline constexpr foundation::SkillId kExplodingPalm{11};
inline constexpr foundation::SkillId kFlyingDragon{12};
inline constexpr foundation::SkillId kFlyingKick{13};
inline constexpr foundation::SkillId kImprisonedFists{14};
inline constexpr foundation::SkillId kBulPalm{15};
inline constexpr foundation::SkillId kBulBreathOfHeaven{16};
inline constexpr foundation::SkillId kBulShadowClone{17};

} // namespace skill_ids

/// Lookup table of skill definitions keyed by stable id.
///
/// Each entry owns one cooldown timer. The timer gates new casts of that
/// skill; live instances already in flight are unaffected by it.
///
/// Example:
/// @code
///   auto catalog = SkillCatalog::DefaultCatalog();
///   const auto* wave = catalog.FindByName("Wave of Light");
///   catalog.StartCooldown(wave->id);
///   catalog.UpdateCooldowns(0.1f);
/// @endcode
class SkillCatalog {
public:
    /// Add a definition.
    /// @return DuplicateSkill when the id or name is taken, InvalidArgument
    ///         for a null id or a negative / non-finite number.
    foundation::GameResult<void> Register(SkillDefinition definition);

    [[nodiscard]] const SkillDefinition* Find(foundation::SkillId id) const;
    [[nodiscard]] const SkillDefinition* FindByName(std::string_view name) const;

    /// Seconds until the skill can be cast again; 0 for unknown ids.
    [[nodiscard]] float CooldownRemaining(foundation::SkillId id) const;
    [[nodiscard]] bool IsReady(foundation::SkillId id) const;

    /// Set the timer to the skill's full cooldown.
    void StartCooldown(foundation::SkillId id);

    /// Clear the timer.
    void ResetCooldown(foundation::SkillId id);

    /// Count every timer down, stopping at zero.
    void UpdateCooldowns(float deltaTime);

    /// Definitions of one category, in registration order.
    [[nodiscard]] std::vector<const SkillDefinition*> ByCategory(SkillCategory category) const;

    /// Every definition, in registration order.
    [[nodiscard]] std::vector<const SkillDefinition*> All() const;

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

    /// The shipped skill set: two primary attacks, twelve normal skills and
    /// three custom skills.
    [[nodiscard]] static SkillCatalog DefaultCatalog();

private:
    struct Entry {
        SkillDefinition definition;
        float cooldownRemaining = 0.0f;
    };

    Entry* entryFor(foundation::SkillId id);
    [[nodiscard]] const Entry* entryFor(foundation::SkillId id) const;

    std::vector<Entry> entries_;
    std::unordered_map<foundation::SkillId, std::size_t> index_;
};

} // namespace arc::game
