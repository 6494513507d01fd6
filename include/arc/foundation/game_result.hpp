#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias for operations reporting a GameError.

#include "arc/core/result.hpp"
#include "arc/foundation/game_error.hpp"

namespace arc::foundation {

/// Result specialized with GameError.
///
/// Example:
/// @code
///   GameResult<float> readMultiplier(const ConfigManager& cfg) {
///       auto value = cfg.get<float>("combat.crit_multiplier");
///       if (!value) {
///           return GameResult<float>::err(value.error());
///       }
///       return GameResult<float>::ok(value.value());
///   }
/// @endcode
template <typename T>
using GameResult = arc::Result<T, GameError>;

} // namespace arc::foundation
