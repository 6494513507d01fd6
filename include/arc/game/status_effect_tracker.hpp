#pragma once

/// @file status_effect_tracker.hpp
/// @brief StatusEffectTracker: slow, stun, burn, poison and freeze on one
///        character.

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "arc/game/balance_config.hpp"
#include "arc/game/collaborators.hpp"
#include "arc/game/random_source.hpp"
#include "arc/game/stat_block.hpp"
#include "arc/game/status_effect_types.hpp"

namespace arc::game {

/// At most one record per kind.
///
/// Re-applying an active kind replaces the record only when the new effect
/// is strictly stronger or strictly longer; the old record is removed first
/// so whatever it changed is restored before the new one applies.
///
/// Burn and poison deal tickDamage * intensity per tick. With
/// DotMode::Stochastic each Update() ticks with probability
/// deltaTime * dotTicksPerSecond; with DotMode::FixedInterval ticks fire every
/// 1 / dotTicksPerSecond seconds of accumulated time.
class StatusEffectTracker {
public:
    /// Receives damage-over-time ticks. Without a handler the damage is
    /// subtracted from the StatBlock's health directly.
    using DamageHandler = std::function<void(StatusKind kind, float damage)>;

    StatusEffectTracker(StatBlock& stats, StatusBalance balance, RandomSource random,
                        IRenderingCollaborator* rendering = nullptr);

    /// Apply or strengthen an effect.
    ///
    /// intensity defaults to 0.5, so a bare slow halves movement speed; an
    /// intensity of 1 would stop the character outright. A slow applied with
    /// intensity <= 0 uses StatusBalance::defaultSlowIntensity instead.
    /// @return false when duration is not positive.
    bool Apply(StatusKind kind, float duration, float intensity = 0.5f,
               float tickDamage = 0.0f);

    /// Apply by name ("slow", "burn", ...).
    /// @return false (with a warning) for an unknown name.
    bool Apply(std::string_view kindName, float duration, float intensity = 0.5f,
               float tickDamage = 0.0f);

    /// End an effect early, restoring what it changed.
    /// @return false when the kind was not active.
    bool Remove(StatusKind kind);

    void Clear();

    /// Count down durations, expire finished effects and deal DOT ticks.
    void Update(float deltaTime);

    [[nodiscard]] bool Has(StatusKind kind) const;
    [[nodiscard]] float RemainingDuration(StatusKind kind) const;
    [[nodiscard]] float Intensity(StatusKind kind) const;
    [[nodiscard]] std::vector<StatusEffect> All() const;
    [[nodiscard]] std::size_t ActiveCount() const;

    void SetDamageHandler(DamageHandler handler) { damageHandler_ = std::move(handler); }

private:
    void install(StatusEffect effect);
    void tick(StatusEffect& effect, float deltaTime);
    void dealDamage(StatusKind kind, float damage);
    [[nodiscard]] std::optional<StatusEffect>* otherImmobilizer(StatusKind kind);

    StatBlock& stats_;
    StatusBalance balance_;
    RandomSource random_;
    IRenderingCollaborator* rendering_;
    DamageHandler damageHandler_;
    std::array<std::optional<StatusEffect>, kStatusKindCount> effects_{};
};

} // namespace arc::game
