#pragma once

/// @file numeric_guard.hpp
/// @brief Validation of numeric inputs at stat and config boundaries.
///
/// NaN or infinite values reaching a stat field are replaced by a documented
/// fallback and reported as a warning under LogCategory::Stats; they never
/// propagate to callers as errors.

#include <string_view>

#include "arc/foundation/game_result.hpp"

namespace arc::foundation {

[[nodiscard]] constexpr bool isFiniteNumber(float value) noexcept {
    // NaN compares unequal to itself; infinities exceed the float range.
    return value == value && value <= 3.4028235e38f && value >= -3.4028235e38f;
}

/// @return value when finite, otherwise fallback (with a warning).
[[nodiscard]] float sanitizeFloat(float value, float fallback, std::string_view field);

/// @return value when finite and >= 0, otherwise fallback (with a warning).
[[nodiscard]] float sanitizeNonNegative(float value, float fallback,
                                        std::string_view field);

/// Strict variant for configuration input.
/// @return value, or InvalidNumericInput when not finite or below minimum.
[[nodiscard]] GameResult<float> requireFinite(float value, std::string_view field,
                                              float minimum = -3.4028235e38f);

} // namespace arc::foundation
