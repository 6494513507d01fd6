/// @file temporary_modifier_set.cpp
/// @brief TemporaryModifierSet implementation.

#include "arc/game/temporary_modifier_set.hpp"

#include <algorithm>
#include <string>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"
#include "arc/game/stat_block.hpp"

namespace arc::game {

using foundation::LogCategory;

namespace {

constexpr std::size_t indexOf(StatKind stat) {
    return static_cast<std::size_t>(stat);
}

} // namespace

void TemporaryModifierSet::AddBoost(StatBlock& stats, StatKind stat, float amount,
                                    float durationSeconds) {
    amount = foundation::sanitizeFloat(amount, 0.0f, "boost amount");
    durationSeconds =
        foundation::sanitizeNonNegative(durationSeconds, 0.0f, "boost duration");
    if (durationSeconds <= 0.0f) {
        return;
    }

    auto& record = recordFor(stats, stat);
    record->boosts.push_back({amount, durationSeconds});
    ApplyBoosts(stats, stat);

    ARC_LOG_DEBUG(LogCategory::Stats,
                  "boost added to " + std::string(statKindName(stat)) + ": " +
                      std::to_string(amount) + " for " +
                      std::to_string(durationSeconds) + "s");
}

void TemporaryModifierSet::SetScale(StatBlock& stats, StatKind stat, float factor) {
    factor = foundation::sanitizeNonNegative(factor, 1.0f, "modifier scale");
    auto& record = recordFor(stats, stat);
    record->scale = factor;
    ApplyBoosts(stats, stat);
}

void TemporaryModifierSet::ClearScale(StatBlock& stats, StatKind stat) {
    auto& record = records_[indexOf(stat)];
    if (!record) {
        return;
    }
    record->scale = 1.0f;
    ApplyBoosts(stats, stat);
    restoreIfIdle(stats, stat);
}

void TemporaryModifierSet::ApplyBoosts(StatBlock& stats, StatKind stat) const {
    const auto& record = records_[indexOf(stat)];
    if (!record) {
        return;
    }
    float value = record->baseline;
    for (const auto& boost : record->boosts) {
        value += value * boost.amount;
    }
    stats.Set(stat, value * record->scale);
}

void TemporaryModifierSet::Update(StatBlock& stats, float deltaTime) {
    deltaTime = foundation::sanitizeNonNegative(deltaTime, 0.0f, "modifier delta");

    for (std::size_t i = 0; i < kStatKindCount; ++i) {
        auto& record = records_[i];
        if (!record) {
            continue;
        }

        for (auto& boost : record->boosts) {
            boost.remaining -= deltaTime;
        }
        auto expired = std::remove_if(
            record->boosts.begin(), record->boosts.end(),
            [](const TemporaryModifier& boost) { return boost.remaining <= 0.0f; });
        if (expired == record->boosts.end()) {
            continue;
        }
        record->boosts.erase(expired, record->boosts.end());

        auto stat = static_cast<StatKind>(i);
        ApplyBoosts(stats, stat);
        restoreIfIdle(stats, stat);
    }
}

void TemporaryModifierSet::Clear(StatBlock& stats) {
    for (std::size_t i = 0; i < kStatKindCount; ++i) {
        auto& record = records_[i];
        if (!record) {
            continue;
        }
        auto stat = static_cast<StatKind>(i);
        record->boosts.clear();
        ApplyBoosts(stats, stat);
        restoreIfIdle(stats, stat);
    }
}

void TemporaryModifierSet::ShiftBaseline(StatBlock& stats, StatKind stat, float delta) {
    delta = foundation::sanitizeFloat(delta, 0.0f, "baseline delta");
    auto& record = records_[indexOf(stat)];
    if (!record) {
        stats.Set(stat, stats.Get(stat) + delta);
        return;
    }
    record->baseline = std::max(0.0f, record->baseline + delta);
    ApplyBoosts(stats, stat);
}

bool TemporaryModifierSet::HasBoost(StatKind stat) const {
    const auto& record = records_[indexOf(stat)];
    return record && !record->boosts.empty();
}

std::size_t TemporaryModifierSet::BoostCount(StatKind stat) const {
    const auto& record = records_[indexOf(stat)];
    return record ? record->boosts.size() : 0;
}

float TemporaryModifierSet::Scale(StatKind stat) const {
    const auto& record = records_[indexOf(stat)];
    return record ? record->scale : 1.0f;
}

std::optional<float> TemporaryModifierSet::Baseline(StatKind stat) const {
    const auto& record = records_[indexOf(stat)];
    if (!record) {
        return std::nullopt;
    }
    return record->baseline;
}

bool TemporaryModifierSet::Empty() const {
    return std::none_of(records_.begin(), records_.end(),
                        [](const auto& record) { return record.has_value(); });
}

// ── Internals ───────────────────────────────────────────────────────────

std::optional<TemporaryModifierSet::Record>& TemporaryModifierSet::recordFor(
    StatBlock& stats, StatKind stat) {
    auto& record = records_[indexOf(stat)];
    if (!record) {
        record = Record{stats.Get(stat), {}, 1.0f};
    }
    return record;
}

void TemporaryModifierSet::restoreIfIdle(StatBlock& stats, StatKind stat) {
    auto& record = records_[indexOf(stat)];
    if (!record || !record->Idle()) {
        return;
    }
    float baseline = record->baseline;
    record.reset();
    stats.Set(stat, baseline);
    ARC_LOG_DEBUG(LogCategory::Stats,
                  std::string(statKindName(stat)) + " restored to baseline");
}

} // namespace arc::game
