#pragma once

/// @file animation_components.hpp
/// @brief Animation state on units and on their clip child entities.

#include "dad/game/animation_types.hpp"

#include <cstdint>

namespace dad::game {

/// Animation the unit wants shown; the playback engine switches the
/// visible child to the clip of this kind.
struct CurrentAnimation {
    AnimationKind kind = AnimationKind::Idle;
};

/// Playback state of one clip, stored on a child of the unit.
struct SpriteAnimation {
    AnimationClipSpec clip;
    uint32_t frame = 0;
    float frameTimer = 0.0f;
    bool visible = false;
};

} // namespace dad::game
