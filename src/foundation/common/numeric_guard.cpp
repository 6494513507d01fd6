/// @file numeric_guard.cpp
/// @brief Numeric guard implementation.

#include "arc/foundation/numeric_guard.hpp"

#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::foundation {

namespace {

void reportCoercion(std::string_view field, float value, float fallback) {
    LogContext ctx;
    ctx.extra["field"] = std::string(field);
    ctx.extra["rejected"] = std::to_string(value);
    ctx.extra["fallback"] = std::to_string(fallback);
    GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Stats,
                                          "invalid numeric input coerced", ctx);
}

} // namespace

float sanitizeFloat(float value, float fallback, std::string_view field) {
    if (isFiniteNumber(value)) {
        return value;
    }
    reportCoercion(field, value, fallback);
    return fallback;
}

float sanitizeNonNegative(float value, float fallback, std::string_view field) {
    if (isFiniteNumber(value) && value >= 0.0f) {
        return value;
    }
    reportCoercion(field, value, fallback);
    return fallback;
}

GameResult<float> requireFinite(float value, std::string_view field, float minimum) {
    if (!isFiniteNumber(value) || value < minimum) {
        return GameResult<float>::err(
            GameError(ErrorCode::InvalidNumericInput,
                      "invalid numeric value for " + std::string(field),
                      std::string(field)));
    }
    return GameResult<float>::ok(value);
}

} // namespace arc::foundation
