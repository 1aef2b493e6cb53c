#pragma once

/// @file arena_world.hpp
/// @brief Entity store plus every component storage a unit uses.

#include "dad/ecs/component_storage.hpp"
#include "dad/ecs/entity.hpp"
#include "dad/ecs/entity_manager.hpp"
#include "dad/game/animation_components.hpp"
#include "dad/game/behavior_components.hpp"
#include "dad/game/components.hpp"
#include "dad/units/unit_types.hpp"

#include <cstddef>
#include <tuple>

namespace dad::units {

/// The arena's entity world.
///
/// Owns the EntityManager and one ComponentStorage per unit component.
/// Every storage is registered with the manager, so destroying a unit
/// drops all of its components and its animation children.  Storages are
/// addressed by type:
///
/// @code
///   auto& health = world.Storage<game::Health>();
///   if (auto* h = health.TryGet(unit)) { ... }
/// @endcode
///
/// Not copyable or movable: the manager keeps pointers to the storages.
class ArenaWorld {
public:
    ArenaWorld();

    ArenaWorld(const ArenaWorld&) = delete;
    ArenaWorld& operator=(const ArenaWorld&) = delete;
    ArenaWorld(ArenaWorld&&) = delete;
    ArenaWorld& operator=(ArenaWorld&&) = delete;

    [[nodiscard]] ecs::EntityManager& Entities() noexcept { return entities_; }
    [[nodiscard]] const ecs::EntityManager& Entities() const noexcept { return entities_; }

    template <typename T>
    [[nodiscard]] ecs::ComponentStorage<T>& Storage() noexcept {
        return std::get<ecs::ComponentStorage<T>>(storages_);
    }

    template <typename T>
    [[nodiscard]] const ecs::ComponentStorage<T>& Storage() const noexcept {
        return std::get<ecs::ComponentStorage<T>>(storages_);
    }

    /// True when @p entity carries the presence marker for @p kind.
    [[nodiscard]] bool HasBehaviorMarker(ecs::Entity entity, game::BehaviorKind kind) const;

    /// Number of spawned units (entities with a UnitKind), children excluded.
    [[nodiscard]] std::size_t UnitCount() const noexcept;

    /// Destroy every entity tagged Cleanup, with its descendants.
    ///
    /// @return Number of tagged entities destroyed.
    std::size_t TeardownLevel();

private:
    ecs::EntityManager entities_;
    std::tuple<
        ecs::ComponentStorage<game::Transform>,
        ecs::ComponentStorage<game::Movement>,
        ecs::ComponentStorage<game::Velocity>,
        ecs::ComponentStorage<game::Health>,
        ecs::ComponentStorage<game::TeamMember>,
        ecs::ComponentStorage<game::Cleanup>,
        ecs::ComponentStorage<game::CurrentAnimation>,
        ecs::ComponentStorage<game::SpriteAnimation>,
        ecs::ComponentStorage<UnitKind>,
        ecs::ComponentStorage<ManaGenerator>,
        ecs::ComponentStorage<game::CurrentBehavior>,
        ecs::ComponentStorage<game::SupportedBehaviors>,
        ecs::ComponentStorage<game::IdleBehavior>,
        ecs::ComponentStorage<game::MoveToOriginBehavior>,
        ecs::ComponentStorage<game::WanderBehavior>,
        ecs::ComponentStorage<game::ChaseBehavior>,
        ecs::ComponentStorage<game::FleeBehavior>,
        ecs::ComponentStorage<game::AttackBehavior>,
        ecs::ComponentStorage<game::DeadBehavior>>
        storages_;
};

} // namespace dad::units
