/// @file animation_spawner.cpp
/// @brief AnimatedChildSpawner implementation.

#include "dad/game/animation_spawner.hpp"

#include "dad/foundation/game_logger.hpp"

#include <string>

namespace dad::game {

AnimatedChildSpawner::AnimatedChildSpawner(
    ecs::EntityManager& entities,
    ecs::ComponentStorage<SpriteAnimation>& animations,
    ecs::ComponentStorage<Transform>& transforms)
    : entities_(entities), animations_(animations), transforms_(transforms) {}

std::vector<ecs::Entity> AnimatedChildSpawner::InstantiateChildren(
    ecs::Entity parent, const std::vector<AnimationClipSpec>& clips) {
    std::vector<ecs::Entity> children;
    children.reserve(clips.size());

    for (const auto& clip : clips) {
        auto child = entities_.CreateChild(parent);
        if (!child.isValid()) {
            DAD_LOG_ERROR(foundation::LogCategory::Animation,
                          "cannot attach animation clip to dead entity " +
                              std::to_string(parent.raw));
            break;
        }

        SpriteAnimation anim;
        anim.clip = clip;
        anim.visible = clip.kind == AnimationKind::Idle;
        animations_.Add(child, std::move(anim));
        transforms_.Add(child, Transform{});
        children.push_back(child);
    }

    return children;
}

} // namespace dad::game
