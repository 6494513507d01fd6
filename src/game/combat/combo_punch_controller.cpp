/// @file combo_punch_controller.cpp
/// @brief ComboPunchController implementation.

#include "arc/game/combo_punch_controller.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/numeric_guard.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

ComboPunchController::ComboPunchController(ComboBalance balance)
    : balance_(std::move(balance)) {
    if (balance_.multipliers.empty()) {
        balance_.multipliers.push_back(1.0f);
    }
}

GameResult<PunchStep> ComboPunchController::TryPunch() {
    if (cooldown_ > 0.0f) {
        return GameResult<PunchStep>::err(
            GameError(ErrorCode::ComboOnCooldown, "punch on cooldown", cooldown_));
    }

    PunchStep landed;
    landed.step = step_;
    landed.multiplier = NextMultiplier();
    landed.isFinisher = static_cast<std::size_t>(step_) + 1 == StepCount();

    step_ = static_cast<int32_t>((static_cast<std::size_t>(step_) + 1) % StepCount());
    cooldown_ = balance_.cooldownSeconds;
    window_ = balance_.windowSeconds;

    ARC_LOG_DEBUG(LogCategory::Combat,
                  "combo step " + std::to_string(landed.step) + " x" +
                      std::to_string(landed.multiplier));
    return GameResult<PunchStep>::ok(landed);
}

void ComboPunchController::Update(float deltaTime) {
    deltaTime = foundation::sanitizeNonNegative(deltaTime, 0.0f, "combo delta");

    cooldown_ = std::max(0.0f, cooldown_ - deltaTime);
    if (window_ > 0.0f) {
        window_ -= deltaTime;
        if (window_ <= 0.0f) {
            window_ = 0.0f;
            if (step_ != 0) {
                ARC_LOG_DEBUG(LogCategory::Combat, "combo broken");
            }
            step_ = 0;
        }
    }
}

void ComboPunchController::Reset() {
    step_ = 0;
    cooldown_ = 0.0f;
    window_ = 0.0f;
}

float ComboPunchController::NextMultiplier() const {
    return balance_.multipliers[static_cast<std::size_t>(step_) % StepCount()];
}

} // namespace arc::game
