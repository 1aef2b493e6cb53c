#pragma once

/// @file animation_spawner.hpp
/// @brief Instantiation of a unit's animation child entities.

#include "dad/ecs/component_storage.hpp"
#include "dad/ecs/entity.hpp"
#include "dad/ecs/entity_manager.hpp"
#include "dad/game/animation_components.hpp"
#include "dad/game/components.hpp"

#include <vector>

namespace dad::game {

/// Creates one visual child entity per clip under a parent unit.
///
/// The spawn path hands over the clip list once; implementations must not
/// keep references to it.
class IAnimationSpawner {
public:
    virtual ~IAnimationSpawner() = default;

    /// @return The created children, in the order of @p clips.
    virtual std::vector<ecs::Entity> InstantiateChildren(
        ecs::Entity parent, const std::vector<AnimationClipSpec>& clips) = 0;
};

/// Default IAnimationSpawner backed by the entity store.
///
/// Each child gets a SpriteAnimation (copy of the clip, frame 0) and an
/// identity local Transform.  Only the Idle clip starts visible.
class AnimatedChildSpawner final : public IAnimationSpawner {
public:
    AnimatedChildSpawner(ecs::EntityManager& entities,
                         ecs::ComponentStorage<SpriteAnimation>& animations,
                         ecs::ComponentStorage<Transform>& transforms);

    std::vector<ecs::Entity> InstantiateChildren(
        ecs::Entity parent, const std::vector<AnimationClipSpec>& clips) override;

private:
    ecs::EntityManager& entities_;
    ecs::ComponentStorage<SpriteAnimation>& animations_;
    ecs::ComponentStorage<Transform>& transforms_;
};

} // namespace dad::game
