#pragma once

/// @file visual_effect_strategy.hpp
/// @brief Per-skill-type placement and motion of a live skill's effect.
///
/// The rendering collaborator draws the effect; a strategy decides where it
/// is. ActiveSkillInstanceSet picks the strategy by the instance's
/// SkillType, calls Place() once when the cast succeeds and Advance() on
/// every update until the instance expires.

#include <array>
#include <memory>
#include <optional>

#include "arc/game/math_types.hpp"
#include "arc/game/skill_types.hpp"

namespace arc::game {

/// Positions one family of skill effects.
class VisualEffectStrategy {
public:
    virtual ~VisualEffectStrategy() = default;

    [[nodiscard]] virtual SkillType Type() const noexcept = 0;

    /// Set the starting position of a new instance. The instance's origin
    /// and direction are already filled in.
    virtual void Place(SkillInstance& instance, const Vector3& casterPosition,
                       const std::optional<Vector3>& targetPosition) const = 0;

    /// Move the effect after instance.elapsed has advanced.
    virtual void Advance(SkillInstance& instance, const Vector3& casterPosition) const = 0;
};

/// Fraction of the instance's lifetime already spent, in [0, 1].
[[nodiscard]] float lifetimeFraction(const SkillInstance& instance);

/// One strategy per SkillType.
///
/// The default-constructed registry holds the built-in strategy for every
/// type; Register() swaps one out.
class VisualEffectRegistry {
public:
    VisualEffectRegistry();

    /// Replace the strategy for strategy->Type(). Null is ignored.
    void Register(std::unique_ptr<VisualEffectStrategy> strategy);

    [[nodiscard]] const VisualEffectStrategy& For(SkillType type) const;

    /// Shared registry with the built-in strategies.
    static const VisualEffectRegistry& Default();

private:
    std::array<std::unique_ptr<VisualEffectStrategy>, kSkillTypeCount> strategies_;
};

/// Factory for the built-in strategy of a type.
[[nodiscard]] std::unique_ptr<VisualEffectStrategy> makeDefaultStrategy(SkillType type);

} // namespace arc::game
