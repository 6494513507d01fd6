#pragma once

/// @file active_skill_set.hpp
/// @brief ActiveSkillInstanceSet: skill casting and the live casts it spawns.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "arc/core/result.hpp"
#include "arc/foundation/signal.hpp"
#include "arc/game/balance_config.hpp"
#include "arc/game/collaborators.hpp"
#include "arc/game/skill_catalog.hpp"
#include "arc/game/stat_block.hpp"
#include "arc/game/visual_effect_strategy.hpp"

namespace arc::game {

using CastResult = Result<CastOutcome, CastError>;

/// Casts skills from a SkillCatalog and tracks every live instance.
///
/// Any number of instances of the same skill may be alive at once; the
/// catalog cooldown is the only thing that spaces casts out. Each instance
/// expires independently once its elapsed time reaches the skill duration,
/// and its visual handle is disposed before the instance is dropped.
///
/// Cast checks run in this order, and a failed check changes nothing:
///   unknown id -> dead caster -> catalog cooldown -> mana.
class ActiveSkillInstanceSet {
public:
    ActiveSkillInstanceSet(SkillCatalog& catalog, TargetingBalance balance,
                           const ITargetingCollaborator& targeting,
                           IRenderingCollaborator* rendering = nullptr,
                           INotificationCollaborator* notifier = nullptr,
                           const VisualEffectRegistry& strategies = VisualEffectRegistry::Default());

    /// Cast a skill from the loadout.
    ///
    /// Mana is spent and the cooldown started before targeting. A teleport
    /// skill that finds no target refunds the mana, clears the cooldown and
    /// fails with NoTargetFound; every other skill casts toward the caster's
    /// facing when nothing is in range.
    ///
    /// @param casterPosition Moved by a successful teleport.
    /// @param variant        Skill-tree variant recorded on the instance.
    CastResult Cast(foundation::SkillId id, StatBlock& caster, Vector3& casterPosition,
                    const Vector3& facing, std::string_view variant = {});

    /// Basic attack with a primary skill.
    ///
    /// Requires a live target within the skill's range (NoTargetFound
    /// otherwise, with nothing spent). A teleport skill closes the distance
    /// when the target is beyond the minimum teleport range; stationary
    /// skills never move the caster.
    CastResult CastPrimaryAttack(foundation::SkillId id, StatBlock& caster,
                                 Vector3& casterPosition, const Vector3& facing,
                                 std::string_view variant = {});

    /// Advance every instance, expire the finished ones and count the
    /// catalog cooldowns down.
    void Update(float deltaTime, const Vector3& casterPosition);

    /// Dispose and drop every instance.
    void Clear();

    [[nodiscard]] const std::vector<SkillInstance>& Instances() const noexcept {
        return instances_;
    }
    [[nodiscard]] std::size_t Count() const noexcept { return instances_.size(); }
    [[nodiscard]] std::size_t CountOf(foundation::SkillId id) const;

    [[nodiscard]] const SkillCatalog& Catalog() const noexcept { return catalog_; }

    /// Fired for every new instance after its visual was requested.
    [[nodiscard]] foundation::Signal<const SkillInstance&>& OnCast() noexcept { return onCast_; }

private:
    struct Target {
        foundation::TargetHandle handle;
        Vector3 position;
        float distance = 0.0f;
    };

    [[nodiscard]] std::optional<Target> findTarget(const Vector3& from, float range) const;
    [[nodiscard]] float searchRange(const SkillDefinition& def) const;
    bool teleportToward(const Target& target, float maxDistance, Vector3& casterPosition) const;
    void applySelfEffects(const SkillDefinition& def, StatBlock& caster, CastOutcome& outcome);
    void spawn(const SkillDefinition& def, std::string_view variant,
               const Vector3& casterPosition, const Vector3& facing,
               const std::optional<Target>& target, CastOutcome& outcome);
    void notify(std::string_view message);

    SkillCatalog& catalog_;
    TargetingBalance balance_;
    const ITargetingCollaborator& targeting_;
    IRenderingCollaborator* rendering_;
    INotificationCollaborator* notifier_;
    const VisualEffectRegistry& strategies_;

    std::vector<SkillInstance> instances_;
    uint64_t nextInstanceId_ = 1;
    foundation::Signal<const SkillInstance&> onCast_;
};

} // namespace arc::game
