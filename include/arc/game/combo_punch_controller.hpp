#pragma once

/// @file combo_punch_controller.hpp
/// @brief ComboPunchController: the melee combo state machine.

#include <cstddef>
#include <cstdint>

#include "arc/foundation/game_result.hpp"
#include "arc/game/balance_config.hpp"

namespace arc::game {

/// One registered punch.
struct PunchStep {
    int32_t step = 0;          ///< Index into the combo multipliers.
    float multiplier = 1.0f;
    bool isFinisher = false;   ///< Last step; applies knockback.
};

/// Combo step, per-punch cooldown and combo window.
///
/// A punch lands only when the cooldown is zero. It uses the multiplier of
/// the current step, then advances the step (wrapping after the last) and
/// refills both the cooldown and the window. When the window runs out
/// before the next punch the combo breaks and the step returns to 0.
///
/// Example:
/// @code
///   ComboPunchController combo(balance.combo);
///   auto punch = combo.TryPunch();      // multiplier 1.0
///   combo.Update(0.5f);
///   punch = combo.TryPunch();           // multiplier 1.1
/// @endcode
class ComboPunchController {
public:
    explicit ComboPunchController(ComboBalance balance);

    /// Register a punch.
    /// @return The step that landed, or ComboOnCooldown.
    foundation::GameResult<PunchStep> TryPunch();

    void Update(float deltaTime);

    /// Break the combo and clear both timers.
    void Reset();

    [[nodiscard]] int32_t Step() const noexcept { return step_; }
    [[nodiscard]] std::size_t StepCount() const noexcept { return balance_.multipliers.size(); }
    [[nodiscard]] float CooldownRemaining() const noexcept { return cooldown_; }
    [[nodiscard]] float WindowRemaining() const noexcept { return window_; }
    [[nodiscard]] bool CanPunch() const noexcept { return cooldown_ <= 0.0f; }

    /// Multiplier the next punch would use.
    [[nodiscard]] float NextMultiplier() const;

    [[nodiscard]] const ComboBalance& Balance() const noexcept { return balance_; }

private:
    ComboBalance balance_;
    int32_t step_ = 0;
    float cooldown_ = 0.0f;
    float window_ = 0.0f;
};

} // namespace arc::game
