#pragma once

/// @file components.hpp
/// @brief Base components carried by every spawned unit.
///
/// Plain data structs stored in ComponentStorage<T>.  Movement, Velocity
/// and Health are read and written by collaborators outside this library
/// (velocity integrator, combat, death handling); the spawn path only
/// initialises them.

#include "dad/game/math_types.hpp"

#include <cstdint>
#include <string_view>

namespace dad::game {

/// z coordinate given to every spawned unit's translation.
inline constexpr float kUnitDrawLayer = 0.0f;

struct Transform {
    Vector3 position;
    Quaternion rotation;
    Vector3 scale = Vector3::One();
};

/// Top movement speed in world units per second.
struct Movement {
    float speed = 0.0f;
};

struct Velocity {
    Vector2 value;
};

struct Health {
    int32_t current = 0;
    int32_t max = 0;

    [[nodiscard]] bool IsDead() const noexcept { return current <= 0; }
};

enum class Team : uint8_t {
    Player,
    Enemy
};

constexpr std::string_view teamName(Team team) {
    switch (team) {
        case Team::Player: return "Player";
        case Team::Enemy:  return "Enemy";
    }
    return "Unknown";
}

struct TeamMember {
    Team team = Team::Player;
};

/// Marks entities removed by level teardown.
struct Cleanup {};

} // namespace dad::game
