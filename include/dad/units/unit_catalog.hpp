#pragma once

/// @file unit_catalog.hpp
/// @brief Closed set of unit factories, resolved by UnitType.

#include "dad/foundation/game_result.hpp"
#include "dad/units/unit_factory.hpp"
#include "dad/units/unit_types.hpp"

#include <array>
#include <memory>

namespace dad::units {

/// Holds at most one IUnitFactory per UnitType.
///
/// Filled during startup, then shared read-only with the spawner as
/// `std::shared_ptr<const UnitCatalog>`.  Validate() must succeed before
/// the catalog is handed out.
class UnitCatalog {
public:
    UnitCatalog() = default;

    UnitCatalog(const UnitCatalog&) = delete;
    UnitCatalog& operator=(const UnitCatalog&) = delete;
    UnitCatalog(UnitCatalog&&) noexcept = default;
    UnitCatalog& operator=(UnitCatalog&&) noexcept = default;

    /// Catalog with the four built-in factories.
    [[nodiscard]] static UnitCatalog CreateDefault();

    /// Take ownership of @p factory under its GetUnitType().
    ///
    /// Fails with InvalidArgument for a null factory and with
    /// UnitFactoryDuplicate when the type already has one.
    foundation::GameResult<void> Register(std::unique_ptr<IUnitFactory> factory);

    /// Factory for @p type, or nullptr when none is registered.
    [[nodiscard]] const IUnitFactory* Find(UnitType type) const noexcept;

    /// Every UnitType has a factory and every factory's data is well formed.
    [[nodiscard]] foundation::GameResult<void> Validate() const;

    [[nodiscard]] std::size_t Size() const noexcept;

private:
    std::array<std::unique_ptr<IUnitFactory>, kUnitTypeCount> factories_{};
};

} // namespace dad::units
