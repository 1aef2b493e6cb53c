#pragma once

/// @file unit_registry.hpp
/// @brief UnitType -> UnitConfig lookup table.

#include "dad/foundation/config_manager.hpp"
#include "dad/foundation/game_result.hpp"
#include "dad/units/unit_types.hpp"

#include <array>
#include <cstdint>
#include <unordered_map>

namespace dad::units {

/// Read-only economic table with one UnitConfig per UnitType.
///
/// Construction is the only fallible step: it fails when a type has no
/// entry or a zero cost.  A successfully built registry answers Lookup()
/// for every UnitType.
class UnitTypeRegistry {
public:
    /// Built-in costs: Acolyte 40, Warrior 30, Cat 20, Knight 50.
    [[nodiscard]] static UnitTypeRegistry CreateDefault();

    /// Build from an explicit table.  Fails with UnitNotRegistered for a
    /// missing type and InvalidUnitCost for a zero cost.
    [[nodiscard]] static foundation::GameResult<UnitTypeRegistry> Create(
        const std::unordered_map<UnitType, UnitConfig>& entries);

    /// Build from `units.<name>.cost` keys.  A missing key, a non-integer
    /// value or a value above 255 fails.
    [[nodiscard]] static foundation::GameResult<UnitTypeRegistry> FromConfig(
        const foundation::ConfigManager& config);

    [[nodiscard]] const UnitConfig& Lookup(UnitType type) const;

    /// True when @p available mana covers the cost of @p type.
    [[nodiscard]] bool CanAfford(UnitType type, uint32_t available) const;

private:
    explicit UnitTypeRegistry(const std::array<UnitConfig, kUnitTypeCount>& configs)
        : configs_(configs) {}

    std::array<UnitConfig, kUnitTypeCount> configs_;
};

} // namespace dad::units
