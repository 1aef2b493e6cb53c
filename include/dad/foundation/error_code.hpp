#pragma once

/// @file error_code.hpp
/// @brief Error codes grouped by subsystem.

#include <cstdint>
#include <string_view>

namespace dad::foundation {

/// Error codes, one 0x100 range per subsystem so the origin of a failure
/// can be read off the value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // ECS (0x0300 - 0x03FF)
    EntityNotFound = 0x0300,
    ComponentNotFound = 0x0301,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,

    // Unit (0x0900 - 0x09FF)
    UnitNotRegistered = 0x0900,
    UnitFactoryMissing = 0x0901,
    UnitFactoryDuplicate = 0x0902,
    InvalidUnitCost = 0x0903,

    // Animation (0x0A00 - 0x0AFF)
    MissingIdleClip = 0x0A00,
    DuplicateIdleClip = 0x0A01,
    FrameCountExceedsGrid = 0x0A02,
    InvalidFrameGrid = 0x0A03,
    MissingSpriteSheet = 0x0A04,
    ChildSpawnFailed = 0x0A05,

    // Behavior (0x0B00 - 0x0BFF)
    EmptyRepertoire = 0x0B00,
    InitialBehaviorMissing = 0x0B01,
    DuplicateBehavior = 0x0B02,
    UnknownBehavior = 0x0B03,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Unit";
        case 0x0A00: return "Animation";
        case 0x0B00: return "Behavior";
        default: return "Unknown";
    }
}

} // namespace dad::foundation
