#pragma once

/// @file unit_spawner.hpp
/// @brief Turns a (UnitType, Team, position) request into a live unit.

#include "dad/ecs/entity.hpp"
#include "dad/foundation/game_result.hpp"
#include "dad/game/animation_spawner.hpp"
#include "dad/game/components.hpp"
#include "dad/game/math_types.hpp"
#include "dad/units/arena_world.hpp"
#include "dad/units/unit_catalog.hpp"
#include "dad/units/unit_types.hpp"

#include <memory>

namespace dad::units {

/// Spawn orchestrator.
///
/// Spawn() resolves the factory for the requested type, validates its
/// data and only then writes the entity in one uninterrupted pass:
///
/// 1. base bundle: Movement, zero Velocity, full Health, CurrentAnimation
///    (Idle), Transform at (x, y, kUnitDrawLayer) scaled by visualScale,
///    Cleanup tag, UnitKind;
/// 2. TeamMember from the caller;
/// 3. CurrentBehavior and SupportedBehaviors, plus one presence marker
///    per repertoire entry;
/// 4. type extras (ManaGenerator);
/// 5. one animation child per clip through the IAnimationSpawner.
///
/// Either every step completes or no entity exists afterwards.  The
/// spawner does not check affordability; that is the purchase flow's job
/// (see UnitTypeRegistry::CanAfford).
class UnitSpawner {
public:
    UnitSpawner(ArenaWorld& world,
                std::shared_ptr<const UnitCatalog> catalog,
                game::IAnimationSpawner& animations);

    /// @return The new unit, or an error (UnitFactoryMissing, a validation
    ///         code, InvalidArgument for a non-finite position,
    ///         ChildSpawnFailed) with nothing created.
    foundation::GameResult<ecs::Entity> Spawn(UnitType type, game::Team team,
                                              game::Vector2 position);

private:
    ArenaWorld& world_;
    std::shared_ptr<const UnitCatalog> catalog_;
    game::IAnimationSpawner& animations_;
};

} // namespace dad::units
