#pragma once

/// @file temporary_modifier_set.hpp
/// @brief Time-bounded percentage modifiers layered over recorded baselines.

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "arc/game/stat_types.hpp"

namespace arc::game {

class StatBlock;

/// One active percentage boost.
struct TemporaryModifier {
    float amount = 0.0f;     ///< Fraction, e.g. 0.5 for +50 %.
    float remaining = 0.0f;  ///< Seconds left.
};

/// Buff/debuff bookkeeping for a StatBlock.
///
/// The first boost or scale on a stat records the stat's current value as
/// baseline. The live value is always recomputed from that baseline: each
/// active boost multiplies the running value by (1 + amount) in insertion
/// order, then the scale (1 unless a status effect set one) multiplies the
/// result. When the last boost has expired and no scale is set the stat
/// returns exactly to baseline and the record is dropped.
class TemporaryModifierSet {
public:
    /// Add a boost and re-apply the stat.
    void AddBoost(StatBlock& stats, StatKind stat, float amount, float durationSeconds);

    /// Set an untimed factor applied after the boosts, e.g. 0.6 for a 40 %
    /// slow. The owner clears it with ClearScale().
    void SetScale(StatBlock& stats, StatKind stat, float factor);

    /// Drop a stat's scale. No-op when none is set.
    void ClearScale(StatBlock& stats, StatKind stat);

    /// Recompute a stat from its baseline, active boosts and scale. No-op
    /// when the stat has no record.
    void ApplyBoosts(StatBlock& stats, StatKind stat) const;

    /// Age every boost; purge those at or below zero, restoring stats whose
    /// boost list became empty.
    void Update(StatBlock& stats, float deltaTime);

    /// Drop every boost. Scales stay in place.
    void Clear(StatBlock& stats);

    /// Move a stat's baseline by delta, e.g. after a level-up changed the
    /// underlying value while a boost was active.
    void ShiftBaseline(StatBlock& stats, StatKind stat, float delta);

    [[nodiscard]] bool HasBoost(StatKind stat) const;
    [[nodiscard]] std::size_t BoostCount(StatKind stat) const;
    [[nodiscard]] float Scale(StatKind stat) const;
    [[nodiscard]] std::optional<float> Baseline(StatKind stat) const;
    [[nodiscard]] bool Empty() const;

private:
    struct Record {
        float baseline = 0.0f;
        std::vector<TemporaryModifier> boosts;
        float scale = 1.0f;

        [[nodiscard]] bool Idle() const { return boosts.empty() && scale == 1.0f; }
    };

    std::optional<Record>& recordFor(StatBlock& stats, StatKind stat);
    void restoreIfIdle(StatBlock& stats, StatKind stat);

    std::array<std::optional<Record>, kStatKindCount> records_{};
};

} // namespace arc::game
