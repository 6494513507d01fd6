/// @file visual_effect_strategy.cpp
/// @brief Built-in visual effect strategies.

#include "arc/game/visual_effect_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace arc::game {

namespace {

constexpr float kTwoPi = 6.28318530718f;

/// Point reach units ahead of the origin along the instance direction.
Vector3 ahead(const SkillInstance& instance, float reach) {
    return instance.origin + instance.direction * reach;
}

/// Target position when known, else a point ahead of the caster.
Vector3 anchorPoint(const SkillInstance& instance, const std::optional<Vector3>& target,
                    float fallbackReach) {
    return target ? *target : ahead(instance, fallbackReach);
}

// -- Travelling effects -------------------------------------------------------

/// Energy wave sent straight out to its full range.
class RangedStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Ranged; }

    void Place(SkillInstance& instance, const Vector3&,
               const std::optional<Vector3>&) const override {
        instance.position = instance.origin;
    }

    void Advance(SkillInstance& instance, const Vector3&) const override {
        instance.position = ahead(instance, instance.definition.range * lifetimeFraction(instance));
    }
};

/// Beam that extends to full range by mid-life and retracts afterwards.
class ProjectileStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Projectile; }

    void Place(SkillInstance& instance, const Vector3&,
               const std::optional<Vector3>&) const override {
        instance.position = instance.origin;
    }

    void Advance(SkillInstance& instance, const Vector3&) const override {
        float t = lifetimeFraction(instance);
        float extension = 1.0f - std::abs(1.0f - 2.0f * t);
        instance.position = ahead(instance, instance.definition.range * extension);
    }
};

/// Bell dropped on the target that sends a wave onward.
class WaveStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Wave; }

    void Place(SkillInstance& instance, const Vector3&,
               const std::optional<Vector3>& target) const override {
        instance.origin = anchorPoint(instance, target, instance.definition.radius);
        instance.position = instance.origin;
    }

    void Advance(SkillInstance& instance, const Vector3&) const override {
        instance.position = ahead(instance, instance.definition.radius * lifetimeFraction(instance));
    }
};

/// Caster-path effect sweeping toward the target, or full range without one.
class DashStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Dash; }

    void Place(SkillInstance& instance, const Vector3&,
               const std::optional<Vector3>& target) const override {
        instance.position = instance.origin;
        instance.reach = target ? std::min(instance.origin.DistanceTo(*target),
                                           instance.definition.range)
                                : instance.definition.range;
    }

    void Advance(SkillInstance& instance, const Vector3&) const override {
        instance.position = ahead(instance, instance.reach * lifetimeFraction(instance));
    }
};

// -- Caster-bound effects -----------------------------------------------------

/// Aura around the caster.
class BuffStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Buff; }

    void Place(SkillInstance& instance, const Vector3& caster,
               const std::optional<Vector3>&) const override {
        instance.position = caster;
    }

    void Advance(SkillInstance& instance, const Vector3& caster) const override {
        instance.position = caster;
    }
};

/// Healing pulse centred on the caster.
class HealStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Heal; }

    void Place(SkillInstance& instance, const Vector3& caster,
               const std::optional<Vector3>&) const override {
        instance.position = caster;
    }

    void Advance(SkillInstance& instance, const Vector3& caster) const override {
        instance.position = caster;
    }
};

/// Vortex that travels with the caster.
class AoeStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Aoe; }

    void Place(SkillInstance& instance, const Vector3& caster,
               const std::optional<Vector3>&) const override {
        instance.position = caster;
    }

    void Advance(SkillInstance& instance, const Vector3& caster) const override {
        instance.position = caster;
    }
};

/// Summoning circle left where the allies were called; allies roam from it.
class SummonStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Summon; }

    void Place(SkillInstance& instance, const Vector3& caster,
               const std::optional<Vector3>&) const override {
        instance.origin = caster;
        instance.position = caster;
    }

    void Advance(SkillInstance&, const Vector3&) const override {}
};

/// Impact at the caster's post-teleport position.
class TeleportStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Teleport; }

    void Place(SkillInstance& instance, const Vector3& caster,
               const std::optional<Vector3>&) const override {
        instance.origin = caster;
        instance.position = caster;
    }

    void Advance(SkillInstance&, const Vector3&) const override {}
};

// -- Target-bound effects -----------------------------------------------------

/// Mark placed on the target.
class MarkStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Mark; }

    void Place(SkillInstance& instance, const Vector3&,
               const std::optional<Vector3>& target) const override {
        instance.position = anchorPoint(instance, target, instance.definition.range * 0.5f);
    }

    void Advance(SkillInstance&, const Vector3&) const override {}
};

/// Strikes hopping around the anchor point, one position per hit.
class MultiStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Multi; }

    void Place(SkillInstance& instance, const Vector3& caster,
               const std::optional<Vector3>& target) const override {
        instance.origin = target ? *target : caster;
        instance.position = instance.origin;
    }

    void Advance(SkillInstance& instance, const Vector3&) const override {
        int32_t hits = std::max(1, instance.definition.hits);
        auto hit = std::min(hits - 1,
                            static_cast<int32_t>(lifetimeFraction(instance) *
                                                 static_cast<float>(hits)));
        float angle = kTwoPi * static_cast<float>(hit) / static_cast<float>(hits);
        float r = instance.definition.radius * 0.5f;
        instance.position = instance.origin +
                            Vector3(std::cos(angle) * r, 0.0f, std::sin(angle) * r);
    }
};

/// Fists travel out to the target area, then hold enemies in place there.
class ControlStrategy final : public VisualEffectStrategy {
public:
    SkillType Type() const noexcept override { return SkillType::Control; }

    void Place(SkillInstance& instance, const Vector3&,
               const std::optional<Vector3>&) const override {
        instance.position = instance.origin;
    }

    void Advance(SkillInstance& instance, const Vector3&) const override {
        const auto& def = instance.definition;
        float travelTime = std::min(def.duration, kTravelSeconds);
        float reach = travelTime > 0.0f
                          ? def.range * std::min(1.0f, instance.elapsed / travelTime)
                          : def.range;
        instance.position = ahead(instance, reach);
    }

private:
    static constexpr float kTravelSeconds = 1.0f / 3.0f;
};

} // namespace

float lifetimeFraction(const SkillInstance& instance) {
    float duration = instance.definition.duration;
    if (duration <= 0.0f) {
        return 1.0f;
    }
    return std::clamp(instance.elapsed / duration, 0.0f, 1.0f);
}

std::unique_ptr<VisualEffectStrategy> makeDefaultStrategy(SkillType type) {
    switch (type) {
        case SkillType::Ranged:     return std::make_unique<RangedStrategy>();
        case SkillType::Aoe:        return std::make_unique<AoeStrategy>();
        case SkillType::Multi:      return std::make_unique<MultiStrategy>();
        case SkillType::Buff:       return std::make_unique<BuffStrategy>();
        case SkillType::Heal:       return std::make_unique<HealStrategy>();
        case SkillType::Summon:     return std::make_unique<SummonStrategy>();
        case SkillType::Wave:       return std::make_unique<WaveStrategy>();
        case SkillType::Mark:       return std::make_unique<MarkStrategy>();
        case SkillType::Teleport:   return std::make_unique<TeleportStrategy>();
        case SkillType::Dash:       return std::make_unique<DashStrategy>();
        case SkillType::Projectile: return std::make_unique<ProjectileStrategy>();
        case SkillType::Control:    return std::make_unique<ControlStrategy>();
        case SkillType::COUNT:      break;
    }
    return std::make_unique<RangedStrategy>();
}

// ── VisualEffectRegistry ────────────────────────────────────────────────

VisualEffectRegistry::VisualEffectRegistry() {
    for (std::size_t i = 0; i < kSkillTypeCount; ++i) {
        strategies_[i] = makeDefaultStrategy(static_cast<SkillType>(i));
    }
}

void VisualEffectRegistry::Register(std::unique_ptr<VisualEffectStrategy> strategy) {
    if (!strategy) {
        return;
    }
    auto idx = static_cast<std::size_t>(strategy->Type());
    if (idx < kSkillTypeCount) {
        strategies_[idx] = std::move(strategy);
    }
}

const VisualEffectStrategy& VisualEffectRegistry::For(SkillType type) const {
    auto idx = static_cast<std::size_t>(type);
    return *strategies_[idx < kSkillTypeCount ? idx : 0];
}

const VisualEffectRegistry& VisualEffectRegistry::Default() {
    static const VisualEffectRegistry registry;
    return registry;
}

} // namespace arc::game
