#pragma once

/// @file animation_types.hpp
/// @brief Sprite-sheet clip descriptors declared per unit type.

#include "dad/game/math_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dad::game {

enum class AnimationKind : uint8_t {
    Idle,
    Walk,
    Death,
    Attack
};

constexpr std::string_view animationKindName(AnimationKind kind) {
    switch (kind) {
        case AnimationKind::Idle:   return "Idle";
        case AnimationKind::Walk:   return "Walk";
        case AnimationKind::Death:  return "Death";
        case AnimationKind::Attack: return "Attack";
    }
    return "Unknown";
}

/// One clip cut from a sprite sheet laid out as a columns x rows grid of
/// frameSize cells.  The first frameCount cells, row-major, are played.
struct AnimationClipSpec {
    std::string spriteSheet;   ///< Asset path relative to the asset root.
    Vector2 frameSize;         ///< Cell size in pixels.
    uint32_t columns = 0;
    uint32_t rows = 0;
    uint32_t frameCount = 0;
    AnimationKind kind = AnimationKind::Idle;
    bool loops = false;
    bool attackTriggered = false;  ///< Played when an attack lands, not by state.

    /// Number of cells in the grid.
    [[nodiscard]] constexpr uint32_t GridCapacity() const noexcept { return columns * rows; }

    bool operator==(const AnimationClipSpec&) const = default;
};

} // namespace dad::game
