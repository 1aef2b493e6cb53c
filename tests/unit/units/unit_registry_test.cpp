#include <gtest/gtest.h>

#include <unordered_map>

#include "dad/foundation/config_manager.hpp"
#include "dad/units/unit_registry.hpp"

using namespace dad::units;
using dad::foundation::ConfigManager;
using dad::foundation::ErrorCode;

namespace {

std::unordered_map<UnitType, UnitConfig> fullTable() {
    return {
        {UnitType::Acolyte, {40}},
        {UnitType::Warrior, {30}},
        {UnitType::Cat, {20}},
        {UnitType::Knight, {50}},
    };
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// UnitType helpers
// ═══════════════════════════════════════════════════════════════════════════

TEST(UnitTypeTest, NamesRoundTrip) {
    for (auto type : kAllUnitTypes) {
        auto parsed = parseUnitType(unitTypeName(type));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, type);
    }
    EXPECT_FALSE(parseUnitType("dragon").has_value());
    EXPECT_FALSE(parseUnitType("Acolyte").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// UnitTypeRegistry
// ═══════════════════════════════════════════════════════════════════════════

TEST(UnitTypeRegistryTest, DefaultCosts) {
    auto registry = UnitTypeRegistry::CreateDefault();
    EXPECT_EQ(registry.Lookup(UnitType::Acolyte).cost, 40);
    EXPECT_EQ(registry.Lookup(UnitType::Warrior).cost, 30);
    EXPECT_EQ(registry.Lookup(UnitType::Cat).cost, 20);
    EXPECT_EQ(registry.Lookup(UnitType::Knight).cost, 50);
}

TEST(UnitTypeRegistryTest, EveryTypeHasPositiveCost) {
    auto registry = UnitTypeRegistry::CreateDefault();
    for (auto type : kAllUnitTypes) {
        EXPECT_GT(registry.Lookup(type).cost, 0) << unitTypeName(type);
    }
}

TEST(UnitTypeRegistryTest, CreateFromCompleteTable) {
    auto table = fullTable();
    table[UnitType::Cat] = UnitConfig{25};

    auto registry = UnitTypeRegistry::Create(table);
    ASSERT_TRUE(registry.hasValue());
    EXPECT_EQ(registry.value().Lookup(UnitType::Cat).cost, 25);
}

TEST(UnitTypeRegistryTest, CreateRejectsMissingEntry) {
    auto table = fullTable();
    table.erase(UnitType::Warrior);

    auto registry = UnitTypeRegistry::Create(table);
    ASSERT_TRUE(registry.hasError());
    EXPECT_EQ(registry.error().code(), ErrorCode::UnitNotRegistered);
    ASSERT_NE(registry.error().context<UnitType>(), nullptr);
    EXPECT_EQ(*registry.error().context<UnitType>(), UnitType::Warrior);
}

TEST(UnitTypeRegistryTest, CreateRejectsZeroCost) {
    auto table = fullTable();
    table[UnitType::Knight] = UnitConfig{0};

    auto registry = UnitTypeRegistry::Create(table);
    ASSERT_TRUE(registry.hasError());
    EXPECT_EQ(registry.error().code(), ErrorCode::InvalidUnitCost);
}

TEST(UnitTypeRegistryTest, CanAfford) {
    auto registry = UnitTypeRegistry::CreateDefault();
    EXPECT_TRUE(registry.CanAfford(UnitType::Acolyte, 40));
    EXPECT_TRUE(registry.CanAfford(UnitType::Acolyte, 1000));
    EXPECT_FALSE(registry.CanAfford(UnitType::Acolyte, 39));
    EXPECT_TRUE(registry.CanAfford(UnitType::Cat, 20));
    EXPECT_FALSE(registry.CanAfford(UnitType::Knight, 0));
}

// ═══════════════════════════════════════════════════════════════════════════
// UnitTypeRegistry::FromConfig
// ═══════════════════════════════════════════════════════════════════════════

TEST(UnitTypeRegistryConfigTest, LoadsCostsFromYaml) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
units:
  acolyte: { cost: 45 }
  warrior: { cost: 30 }
  cat:     { cost: 15 }
  knight:  { cost: 60 }
)"));

    auto registry = UnitTypeRegistry::FromConfig(config);
    ASSERT_TRUE(registry.hasValue());
    EXPECT_EQ(registry.value().Lookup(UnitType::Acolyte).cost, 45);
    EXPECT_EQ(registry.value().Lookup(UnitType::Cat).cost, 15);
    EXPECT_EQ(registry.value().Lookup(UnitType::Knight).cost, 60);
}

TEST(UnitTypeRegistryConfigTest, MissingKeyFails) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
units:
  acolyte: { cost: 40 }
  warrior: { cost: 30 }
  cat:     { cost: 20 }
)"));

    auto registry = UnitTypeRegistry::FromConfig(config);
    ASSERT_TRUE(registry.hasError());
    EXPECT_EQ(registry.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST(UnitTypeRegistryConfigTest, OutOfRangeCostFails) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
units:
  acolyte: { cost: 40 }
  warrior: { cost: 300 }
  cat:     { cost: 20 }
  knight:  { cost: 50 }
)"));

    auto registry = UnitTypeRegistry::FromConfig(config);
    ASSERT_TRUE(registry.hasError());
    EXPECT_EQ(registry.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(UnitTypeRegistryConfigTest, NonNumericCostFails) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
units:
  acolyte: { cost: cheap }
  warrior: { cost: 30 }
  cat:     { cost: 20 }
  knight:  { cost: 50 }
)"));

    auto registry = UnitTypeRegistry::FromConfig(config);
    ASSERT_TRUE(registry.hasError());
    EXPECT_EQ(registry.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(UnitTypeRegistryConfigTest, ZeroCostFails) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
units:
  acolyte: { cost: 40 }
  warrior: { cost: 30 }
  cat:     { cost: 0 }
  knight:  { cost: 50 }
)"));

    auto registry = UnitTypeRegistry::FromConfig(config);
    ASSERT_TRUE(registry.hasError());
    EXPECT_EQ(registry.error().code(), ErrorCode::InvalidUnitCost);
}
