#pragma once

/// @file game_logger.hpp
/// @brief GameLogger routing combat-core diagnostics to the kcenon logger.
///
/// Messages are tagged with a category, filtered against a per-category
/// runtime level and forwarded to the logger registered in kcenon's
/// GlobalLoggerRegistry. With no logger registered, output is dropped.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arc/foundation/game_result.hpp"
#include "arc/foundation/types.hpp"

namespace arc::foundation {

/// Log severity levels.
///
/// Maps one-to-one onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Library setup and utilities
    Config      = 1, ///< Balance tables and YAML overrides
    Stats       = 2, ///< StatBlock, modifiers and numeric guards
    Status      = 3, ///< Status effects
    Equipment   = 4, ///< Equipment and inventory
    Skill       = 5, ///< Skill casting and instances
    Combat      = 6, ///< Damage, death and revive
    Progression = 7  ///< Persisted loadout and settings
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Stats", "Status",
        "Equipment", "Skill", "Combat", "Progression"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.skillId = SkillId(4);
///   ctx.extra["mana"] = "20";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Skill,
///                         "cast rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<CharacterId> characterId;
    std::optional<SkillId> skillId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger over kcenon's logging interface.
///
/// Default levels:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Config      | Info          |
/// | Stats       | Info          |
/// | Status      | Debug         |
/// | Equipment   | Info          |
/// | Skill       | Debug         |
/// | Combat      | Debug         |
/// | Progression | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message. No-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by "{key=val, ...}" context fields.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    /// Process-wide logger used by the ARC_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arc::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name ARC_LOG Macros
/// @brief Logging macros with a compile-time floor and a runtime check.
///
/// Define ARC_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef ARC_MIN_LOG_LEVEL
    #define ARC_MIN_LOG_LEVEL 0
#endif

#define ARC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= ARC_MIN_LOG_LEVEL &&                      \
            ::arc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::arc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define ARC_LOG_DEBUG(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Debug, (cat), (msg))

#define ARC_LOG_INFO(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Info, (cat), (msg))

#define ARC_LOG_WARN(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Warning, (cat), (msg))

#define ARC_LOG_ERROR(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Error, (cat), (msg))

/// @}
