/// @file status_effect_tracker.cpp
/// @brief StatusEffectTracker implementation.

#include "arc/game/status_effect_tracker.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::size_t indexOf(StatusKind kind) {
    return static_cast<std::size_t>(kind);
}

} // namespace

StatusEffectTracker::StatusEffectTracker(StatBlock& stats, StatusBalance balance,
                                         RandomSource random,
                                         IRenderingCollaborator* rendering)
    : stats_(stats),
      balance_(balance),
      random_(std::move(random)),
      rendering_(rendering) {}

bool StatusEffectTracker::Apply(StatusKind kind, float duration, float intensity,
                                float tickDamage) {
    duration = foundation::sanitizeNonNegative(duration, 0.0f, "status duration");
    if (duration <= 0.0f || kind == StatusKind::COUNT) {
        return false;
    }
    intensity = std::clamp(
        foundation::sanitizeFloat(intensity, 0.5f, "status intensity"), 0.0f, 1.0f);
    tickDamage = foundation::sanitizeNonNegative(tickDamage, 0.0f, "status tick damage");

    if (kind == StatusKind::Slow && intensity <= 0.0f) {
        intensity = balance_.defaultSlowIntensity;
    }
    if (tickDamage <= 0.0f) {
        if (kind == StatusKind::Burn) {
            tickDamage = balance_.burnTickDamage;
        } else if (kind == StatusKind::Poison) {
            tickDamage = balance_.poisonTickDamage;
        }
    }
    if (!isDamageOverTime(kind)) {
        tickDamage = 0.0f;
    }

    const auto& current = effects_[indexOf(kind)];
    if (current) {
        if (intensity <= current->intensity && duration <= current->remaining) {
            ARC_LOG_DEBUG(LogCategory::Status,
                          "weaker " + std::string(statusKindName(kind)) + " ignored");
            return true;
        }
        Remove(kind);
    }

    StatusEffect effect;
    effect.kind = kind;
    effect.remaining = duration;
    effect.intensity = intensity;
    effect.tickDamage = tickDamage;
    install(std::move(effect));
    return true;
}

bool StatusEffectTracker::Apply(std::string_view kindName, float duration, float intensity,
                                float tickDamage) {
    auto kind = parseStatusKind(kindName);
    if (!kind) {
        LogContext ctx;
        ctx.extra["kind"] = std::string(kindName);
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Status, "unknown status effect", ctx);
        return false;
    }
    return Apply(*kind, duration, intensity, tickDamage);
}

bool StatusEffectTracker::Remove(StatusKind kind) {
    if (kind == StatusKind::COUNT) {
        return false;
    }
    auto& slot = effects_[indexOf(kind)];
    if (!slot) {
        return false;
    }

    if (slot->visual && rendering_ != nullptr) {
        rendering_->DisposeVisualEffect(*slot->visual);
    }

    if (kind == StatusKind::Slow) {
        stats_.Modifiers().ClearScale(stats_, StatKind::MovementSpeed);
    }
    if (slot->originalCanMove && otherImmobilizer(kind) == nullptr) {
        stats_.SetCanMove(*slot->originalCanMove);
    }

    slot.reset();
    ARC_LOG_DEBUG(LogCategory::Status, std::string(statusKindName(kind)) + " removed");
    return true;
}

void StatusEffectTracker::Clear() {
    for (std::size_t i = 0; i < kStatusKindCount; ++i) {
        Remove(static_cast<StatusKind>(i));
    }
}

void StatusEffectTracker::Update(float deltaTime) {
    deltaTime = foundation::sanitizeNonNegative(deltaTime, 0.0f, "status delta");

    for (std::size_t i = 0; i < kStatusKindCount; ++i) {
        auto& slot = effects_[i];
        if (!slot) {
            continue;
        }
        slot->remaining -= deltaTime;
        if (slot->remaining <= 0.0f) {
            Remove(slot->kind);
            continue;
        }
        if (isDamageOverTime(slot->kind) && slot->tickDamage > 0.0f) {
            tick(*slot, deltaTime);
        }
    }
}

bool StatusEffectTracker::Has(StatusKind kind) const {
    return kind != StatusKind::COUNT && effects_[indexOf(kind)].has_value();
}

float StatusEffectTracker::RemainingDuration(StatusKind kind) const {
    return Has(kind) ? effects_[indexOf(kind)]->remaining : 0.0f;
}

float StatusEffectTracker::Intensity(StatusKind kind) const {
    return Has(kind) ? effects_[indexOf(kind)]->intensity : 0.0f;
}

std::vector<StatusEffect> StatusEffectTracker::All() const {
    std::vector<StatusEffect> active;
    for (const auto& slot : effects_) {
        if (slot) {
            active.push_back(*slot);
        }
    }
    return active;
}

std::size_t StatusEffectTracker::ActiveCount() const {
    return static_cast<std::size_t>(std::count_if(
        effects_.begin(), effects_.end(), [](const auto& slot) { return slot.has_value(); }));
}

// ── Internals ───────────────────────────────────────────────────────────

void StatusEffectTracker::install(StatusEffect effect) {
    if (effect.kind == StatusKind::Slow) {
        // Layered over active speed boosts; ClearScale() undoes only the slow.
        stats_.Modifiers().SetScale(stats_, StatKind::MovementSpeed, 1.0f - effect.intensity);
    }
    if (isImmobilizing(effect.kind)) {
        // A second immobilizer inherits the value the first one overwrote.
        auto* other = otherImmobilizer(effect.kind);
        effect.originalCanMove =
            other != nullptr ? (*other)->originalCanMove.value_or(true) : stats_.CanMove();
        stats_.SetCanMove(false);
    }
    if (rendering_ != nullptr) {
        effect.visual = rendering_->CreateStatusVisual(effect.kind, effect.remaining);
    }

    LogContext ctx;
    ctx.extra["kind"] = std::string(statusKindName(effect.kind));
    ctx.extra["duration"] = std::to_string(effect.remaining);
    ctx.extra["intensity"] = std::to_string(effect.intensity);
    foundation::GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Status,
                                                      "status applied", ctx);

    auto kind = effect.kind;
    effects_[indexOf(kind)] = std::move(effect);
}

void StatusEffectTracker::tick(StatusEffect& effect, float deltaTime) {
    if (stats_.IsDead() || balance_.dotTicksPerSecond <= 0.0f) {
        return;
    }
    float damage = effect.tickDamage * effect.intensity;

    if (balance_.dotMode == DotMode::Stochastic) {
        if (random_ && random_() < deltaTime * balance_.dotTicksPerSecond) {
            dealDamage(effect.kind, damage);
        }
        return;
    }

    float interval = 1.0f / balance_.dotTicksPerSecond;
    effect.tickAccumulator += deltaTime;
    auto kind = effect.kind;
    while (effect.tickAccumulator >= interval) {
        effect.tickAccumulator -= interval;
        dealDamage(kind, damage);
        // The damage handler may have killed the character and cleared us.
        if (!effects_[indexOf(kind)] || stats_.IsDead()) {
            return;
        }
    }
}

void StatusEffectTracker::dealDamage(StatusKind kind, float damage) {
    ARC_LOG_DEBUG(LogCategory::Status, std::string(statusKindName(kind)) + " dealt " +
                                           std::to_string(damage) + " damage");
    if (damageHandler_) {
        damageHandler_(kind, damage);
    } else {
        stats_.SetHealth(stats_.Health() - damage);
    }
}

std::optional<StatusEffect>* StatusEffectTracker::otherImmobilizer(StatusKind kind) {
    for (auto& slot : effects_) {
        if (slot && slot->kind != kind && isImmobilizing(slot->kind)) {
            return &slot;
        }
    }
    return nullptr;
}

} // namespace arc::game
