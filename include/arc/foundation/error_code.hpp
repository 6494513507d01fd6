#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat core.

#include <cstdint>
#include <string_view>

namespace arc::foundation {

/// Error codes grouped by subsystem.
///
/// Each subsystem owns a 256-value range (0x100) so the source of an error
/// can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,
    InvalidNumericInput = 0x0103,

    // Logger (0x0200 - 0x02FF)
    LoggerError = 0x0200,
    LoggerFlushFailed = 0x0201,

    // Serialization (0x0300 - 0x03FF)
    InvalidJsonData = 0x0300,
    UnsupportedSchemaVersion = 0x0301,

    // Combat (0x0400 - 0x04FF)
    TargetDead = 0x0400,
    CharacterDead = 0x0401,
    ComboOnCooldown = 0x0402,

    // Skill (0x0500 - 0x05FF)
    SkillOnCooldown = 0x0500,
    InsufficientMana = 0x0501,
    InvalidSkillId = 0x0502,
    NoTargetFound = 0x0503,
    DuplicateSkill = 0x0504,

    // Inventory (0x0600 - 0x06FF)
    ItemNotFound = 0x0600,
    ItemNotEquippable = 0x0601,
    ItemAlreadyEquipped = 0x0602,
    SlotEmpty = 0x0603,
    InsufficientGold = 0x0604,

    // Persistence (0x0700 - 0x07FF)
    RecordNotFound = 0x0700,
    RecordCorrupt = 0x0701,
    TierLocked = 0x0702,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Logger";
        case 0x0300: return "Serialization";
        case 0x0400: return "Combat";
        case 0x0500: return "Skill";
        case 0x0600: return "Inventory";
        case 0x0700: return "Persistence";
        default: return "Unknown";
    }
}

} // namespace arc::foundation
