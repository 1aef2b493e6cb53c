#pragma once

/// @file arena_session.hpp
/// @brief Startup wiring: configuration to a ready-to-use spawner.

#include "dad/foundation/config_manager.hpp"
#include "dad/foundation/game_result.hpp"
#include "dad/game/animation_spawner.hpp"
#include "dad/units/arena_world.hpp"
#include "dad/units/unit_catalog.hpp"
#include "dad/units/unit_registry.hpp"
#include "dad/units/unit_spawner.hpp"

#include <memory>

namespace dad::app {

/// Owns one arena level's world together with the immutable unit data.
///
/// Create() performs every startup check in order:
///   1. `logging.<category>` levels (optional keys);
///   2. unit costs from `units.<name>.cost`;
///   3. catalog validation.
/// Any defect aborts creation and is returned unchanged.
class ArenaSession {
    struct Token {};

public:
    [[nodiscard]] static foundation::GameResult<std::unique_ptr<ArenaSession>> Create(
        const foundation::ConfigManager& config);

    /// Use Create(); the token keeps construction inside this class.
    ArenaSession(Token token, units::UnitTypeRegistry registry,
                 std::shared_ptr<const units::UnitCatalog> catalog);

    ArenaSession(const ArenaSession&) = delete;
    ArenaSession& operator=(const ArenaSession&) = delete;

    [[nodiscard]] units::ArenaWorld& World() noexcept { return world_; }
    [[nodiscard]] const units::UnitTypeRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const units::UnitCatalog& Catalog() const noexcept { return *catalog_; }
    [[nodiscard]] units::UnitSpawner& Spawner() noexcept { return spawner_; }

private:
    units::UnitTypeRegistry registry_;
    std::shared_ptr<const units::UnitCatalog> catalog_;
    units::ArenaWorld world_;
    game::AnimatedChildSpawner animations_;
    units::UnitSpawner spawner_;
};

/// Apply every `logging.<category>` key present in @p config to the
/// global GameLogger.  Fails with ConfigInvalidValue on an unknown level.
foundation::GameResult<void> ApplyLogLevels(const foundation::ConfigManager& config);

} // namespace dad::app
