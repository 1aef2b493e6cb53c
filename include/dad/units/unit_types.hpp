#pragma once

/// @file unit_types.hpp
/// @brief Unit type enumeration, economic config and per-unit components.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dad::units {

/// Every spawnable unit type.  Acolyte, Warrior and Cat are summoned by
/// the player; Knight makes up the enemy waves.
enum class UnitType : uint8_t {
    Acolyte,
    Warrior,
    Cat,
    Knight,
    COUNT
};

inline constexpr std::size_t kUnitTypeCount = static_cast<std::size_t>(UnitType::COUNT);

inline constexpr std::array<UnitType, kUnitTypeCount> kAllUnitTypes = {
    UnitType::Acolyte, UnitType::Warrior, UnitType::Cat, UnitType::Knight
};

/// Lowercase name used in config keys ("units.<name>.cost") and logs.
constexpr std::string_view unitTypeName(UnitType type) {
    switch (type) {
        case UnitType::Acolyte: return "acolyte";
        case UnitType::Warrior: return "warrior";
        case UnitType::Cat:     return "cat";
        case UnitType::Knight:  return "knight";
        case UnitType::COUNT:   break;
    }
    return "unknown";
}

constexpr std::optional<UnitType> parseUnitType(std::string_view name) {
    for (auto type : kAllUnitTypes) {
        if (unitTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

/// Economic data consulted by the purchase UI before it requests a spawn.
struct UnitConfig {
    uint8_t cost = 0;

    constexpr bool operator==(const UnitConfig&) const = default;
};

/// Base stats a factory declares for its unit type.
struct StatProfile {
    float movementSpeed = 0.0f;
    int32_t maxHealth = 0;
    float visualScale = 1.0f;

    constexpr bool operator==(const StatProfile&) const = default;
};

/// Records which unit type an entity was spawned as.
struct UnitKind {
    UnitType type = UnitType::Acolyte;
};

/// Periodic mana income granted by support units.  The mana system
/// advances `elapsed` and pays out `amount` every `cooldown` seconds.
struct ManaGenerator {
    float cooldown = 1.0f;
    uint8_t amount = 0;
    float elapsed = 0.0f;

    constexpr bool operator==(const ManaGenerator&) const = default;
};

} // namespace dad::units
