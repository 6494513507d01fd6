#pragma once

/// @file game_error.hpp
/// @brief Error object used with Result<T, GameError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "arc/foundation/error_code.hpp"

namespace arc::foundation {

/// Error code, readable message and optional type-erased context.
///
/// Context is used sparingly, e.g. the offending key of a rejected balance
/// override or the skill id of a failed lookup.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem range the code belongs to.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace arc::foundation
