/// @file active_skill_set.cpp
/// @brief ActiveSkillInstanceSet implementation.

#include "arc/game/active_skill_set.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SkillId;

namespace {

constexpr std::string_view kNoEnemyMessage = "No enemy in range";

void logRejected(const SkillDefinition* def, SkillId id, CastError error) {
    if (!foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Skill)) {
        return;
    }
    LogContext ctx;
    ctx.skillId = id;
    ctx.extra["reason"] = std::string(castErrorName(error));
    if (def != nullptr) {
        ctx.extra["skill"] = def->name;
    }
    foundation::GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Skill,
                                                      "cast rejected", ctx);
}

Vector3 facingOrForward(const Vector3& facing) {
    auto dir = facing.Flattened().Normalized();
    return dir.LengthSquared() > 0.0f ? dir : Vector3::Forward();
}

bool isFiniteVector(const Vector3& v) {
    return foundation::isFiniteNumber(v.x) && foundation::isFiniteNumber(v.y) &&
           foundation::isFiniteNumber(v.z);
}

} // namespace

ActiveSkillInstanceSet::ActiveSkillInstanceSet(SkillCatalog& catalog, TargetingBalance balance,
                                               const ITargetingCollaborator& targeting,
                                               IRenderingCollaborator* rendering,
                                               INotificationCollaborator* notifier,
                                               const VisualEffectRegistry& strategies)
    : catalog_(catalog),
      balance_(balance),
      targeting_(targeting),
      rendering_(rendering),
      notifier_(notifier),
      strategies_(strategies) {}

// ── Casting ─────────────────────────────────────────────────────────────

CastResult ActiveSkillInstanceSet::Cast(SkillId id, StatBlock& caster, Vector3& casterPosition,
                                        const Vector3& facing, std::string_view variant) {
    const auto* def = catalog_.Find(id);
    auto reject = [&](CastError error) {
        logRejected(def, id, error);
        return CastResult::err(error);
    };

    if (def == nullptr) {
        return reject(CastError::InvalidSkillId);
    }
    if (caster.IsDead()) {
        return reject(CastError::CasterDead);
    }
    if (!catalog_.IsReady(id)) {
        return reject(CastError::OnCooldown);
    }
    if (caster.Mana() < def->manaCost) {
        return reject(CastError::InsufficientMana);
    }

    const float manaBefore = caster.Mana();
    caster.SpendMana(def->manaCost);
    catalog_.StartCooldown(id);

    auto target = findTarget(casterPosition, searchRange(*def));

    CastOutcome outcome;
    if (def->type == SkillType::Teleport && !def->stationary) {
        if (!target) {
            // Only a teleport has nowhere to go without a target.
            caster.SetMana(manaBefore);
            catalog_.ResetCooldown(id);
            notify(kNoEnemyMessage);
            return reject(CastError::NoTargetFound);
        }
        outcome.teleported = teleportToward(*target, def->range, casterPosition);
    }

    applySelfEffects(*def, caster, outcome);
    spawn(*def, variant, casterPosition, facing, target, outcome);
    return CastResult::ok(std::move(outcome));
}

CastResult ActiveSkillInstanceSet::CastPrimaryAttack(SkillId id, StatBlock& caster,
                                                     Vector3& casterPosition,
                                                     const Vector3& facing,
                                                     std::string_view variant) {
    const auto* def = catalog_.Find(id);
    auto reject = [&](CastError error) {
        logRejected(def, id, error);
        return CastResult::err(error);
    };

    if (def == nullptr || !def->IsPrimary()) {
        return reject(CastError::InvalidSkillId);
    }
    if (caster.IsDead()) {
        return reject(CastError::CasterDead);
    }
    if (!catalog_.IsReady(id)) {
        return reject(CastError::OnCooldown);
    }
    if (caster.Mana() < def->manaCost) {
        return reject(CastError::InsufficientMana);
    }

    auto target = findTarget(casterPosition, searchRange(*def));
    if (!target) {
        notify(kNoEnemyMessage);
        return reject(CastError::NoTargetFound);
    }

    caster.SpendMana(def->manaCost);
    catalog_.StartCooldown(id);

    CastOutcome outcome;
    const bool inMelee = target->distance <= balance_.meleeRange;
    const bool tooClose = target->distance < balance_.minTeleportRange;
    if (def->type == SkillType::Teleport && !def->stationary && !inMelee && !tooClose) {
        outcome.teleported = teleportToward(*target, searchRange(*def), casterPosition);
    }

    spawn(*def, variant, casterPosition, facing, target, outcome);
    return CastResult::ok(std::move(outcome));
}

// ── Update ──────────────────────────────────────────────────────────────

void ActiveSkillInstanceSet::Update(float deltaTime, const Vector3& casterPosition) {
    deltaTime = foundation::sanitizeNonNegative(deltaTime, 0.0f, "skill delta");

    for (auto& instance : instances_) {
        instance.elapsed += deltaTime;
        if (instance.Expired()) {
            if (instance.visual && rendering_ != nullptr) {
                rendering_->DisposeVisualEffect(*instance.visual);
            }
            instance.visual.reset();
            continue;
        }
        strategies_.For(instance.definition.type).Advance(instance, casterPosition);
        if (instance.visual && rendering_ != nullptr) {
            rendering_->UpdateVisualEffect(*instance.visual, deltaTime);
        }
    }

    std::erase_if(instances_, [](const SkillInstance& instance) { return instance.Expired(); });
    catalog_.UpdateCooldowns(deltaTime);
}

void ActiveSkillInstanceSet::Clear() {
    if (rendering_ != nullptr) {
        for (const auto& instance : instances_) {
            if (instance.visual) {
                rendering_->DisposeVisualEffect(*instance.visual);
            }
        }
    }
    instances_.clear();
}

std::size_t ActiveSkillInstanceSet::CountOf(SkillId id) const {
    return static_cast<std::size_t>(
        std::count_if(instances_.begin(), instances_.end(),
                      [&](const SkillInstance& instance) { return instance.definition.id == id; }));
}

// ── Internals ───────────────────────────────────────────────────────────

std::optional<ActiveSkillInstanceSet::Target> ActiveSkillInstanceSet::findTarget(
    const Vector3& from, float range) const {
    auto handle = targeting_.FindNearestTarget(from, range);
    if (!handle || targeting_.IsDead(*handle)) {
        return std::nullopt;
    }
    Target target;
    target.handle = *handle;
    target.position = targeting_.GetPosition(*handle);
    if (!isFiniteVector(target.position)) {
        ARC_LOG_WARN(LogCategory::Skill, "target reported a non-finite position");
        return std::nullopt;
    }
    target.distance = from.DistanceTo(target.position);
    return target;
}

float ActiveSkillInstanceSet::searchRange(const SkillDefinition& def) const {
    return def.range > 0.0f ? def.range : balance_.defaultSweepRange;
}

bool ActiveSkillInstanceSet::teleportToward(const Target& target, float maxDistance,
                                            Vector3& casterPosition) const {
    auto direction = (target.position - casterPosition).Flattened().Normalized();
    float travel = std::min(target.distance - balance_.teleportStopDistance, maxDistance);
    if (travel <= 0.0f || direction.LengthSquared() <= 0.0f) {
        return false;
    }
    Vector3 destination = casterPosition + direction * travel;
    if (!isFiniteVector(destination)) {
        ARC_LOG_WARN(LogCategory::Skill, "teleport destination rejected");
        return false;
    }
    casterPosition = destination;
    return true;
}

void ActiveSkillInstanceSet::applySelfEffects(const SkillDefinition& def, StatBlock& caster,
                                              CastOutcome& outcome) {
    if (def.healing > 0.0f) {
        outcome.healed = caster.Heal(def.healing);
    }
    if (def.boost) {
        caster.Modifiers().AddBoost(caster, def.boost->stat, def.boost->amount,
                                    def.boost->duration);
    }
}

void ActiveSkillInstanceSet::spawn(const SkillDefinition& def, std::string_view variant,
                                   const Vector3& casterPosition, const Vector3& facing,
                                   const std::optional<Target>& target, CastOutcome& outcome) {
    SkillInstance instance;
    instance.id = foundation::SkillInstanceId(nextInstanceId_++);
    instance.definition = def;
    instance.variant = std::string(variant);
    instance.origin = casterPosition;
    instance.position = casterPosition;
    instance.direction = facingOrForward(facing);

    std::optional<Vector3> targetPosition;
    if (target) {
        instance.target = target->handle;
        targetPosition = target->position;
        auto toward = (target->position - casterPosition).Flattened().Normalized();
        if (toward.LengthSquared() > 0.0f) {
            instance.direction = toward;
        }
    }

    strategies_.For(def.type).Place(instance, casterPosition, targetPosition);
    if (rendering_ != nullptr) {
        instance.visual =
            rendering_->CreateVisualEffect(instance, instance.position, instance.direction);
    }

    outcome.instance = instance.id;
    outcome.target = instance.target;
    outcome.casterPosition = casterPosition;

    LogContext ctx;
    ctx.skillId = def.id;
    ctx.extra["skill"] = def.name;
    ctx.extra["teleported"] = outcome.teleported ? "true" : "false";
    if (!instance.variant.empty()) {
        ctx.extra["variant"] = instance.variant;
    }
    foundation::GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Skill,
                                                      "skill cast", ctx);

    instances_.push_back(std::move(instance));
    onCast_.emit(instances_.back());
}

void ActiveSkillInstanceSet::notify(std::string_view message) {
    if (notifier_ != nullptr) {
        notifier_->Notify(message);
    }
}

} // namespace arc::game
