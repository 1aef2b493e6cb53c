/// @file unit_registry.cpp
/// @brief UnitTypeRegistry construction and lookup.

#include "dad/units/unit_registry.hpp"

#include "dad/foundation/game_logger.hpp"

#include <cassert>
#include <limits>
#include <string>

namespace dad::units {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::array<UnitConfig, kUnitTypeCount> kDefaultConfigs = {{
    {40},  // Acolyte
    {30},  // Warrior
    {20},  // Cat
    {50},  // Knight
}};

std::string costKey(UnitType type) {
    return "units." + std::string(unitTypeName(type)) + ".cost";
}

} // namespace

UnitTypeRegistry UnitTypeRegistry::CreateDefault() {
    return UnitTypeRegistry(kDefaultConfigs);
}

GameResult<UnitTypeRegistry> UnitTypeRegistry::Create(
    const std::unordered_map<UnitType, UnitConfig>& entries) {
    std::array<UnitConfig, kUnitTypeCount> configs{};

    for (auto type : kAllUnitTypes) {
        auto it = entries.find(type);
        if (it == entries.end()) {
            return GameResult<UnitTypeRegistry>::err(GameError(
                ErrorCode::UnitNotRegistered,
                "no unit config for " + std::string(unitTypeName(type)), type));
        }
        if (it->second.cost == 0) {
            return GameResult<UnitTypeRegistry>::err(GameError(
                ErrorCode::InvalidUnitCost,
                "unit cost must be positive: " + std::string(unitTypeName(type)), type));
        }
        configs[static_cast<std::size_t>(type)] = it->second;
    }

    return GameResult<UnitTypeRegistry>::ok(UnitTypeRegistry(configs));
}

GameResult<UnitTypeRegistry> UnitTypeRegistry::FromConfig(
    const foundation::ConfigManager& config) {
    std::unordered_map<UnitType, UnitConfig> entries;

    for (auto type : kAllUnitTypes) {
        const auto key = costKey(type);
        auto cost = config.get<unsigned int>(key);
        if (!cost) {
            return GameResult<UnitTypeRegistry>::err(cost.error());
        }
        if (cost.value() > std::numeric_limits<uint8_t>::max()) {
            return GameResult<UnitTypeRegistry>::err(GameError(
                ErrorCode::ConfigInvalidValue,
                key + " out of range: " + std::to_string(cost.value()), type));
        }
        entries.emplace(type, UnitConfig{static_cast<uint8_t>(cost.value())});
    }

    auto registry = Create(entries);
    if (registry) {
        DAD_LOG_INFO(LogCategory::Config, "unit costs loaded from configuration");
    }
    return registry;
}

const UnitConfig& UnitTypeRegistry::Lookup(UnitType type) const {
    assert(static_cast<std::size_t>(type) < kUnitTypeCount && "UnitType out of range");
    return configs_[static_cast<std::size_t>(type)];
}

bool UnitTypeRegistry::CanAfford(UnitType type, uint32_t available) const {
    return available >= Lookup(type).cost;
}

} // namespace dad::units
