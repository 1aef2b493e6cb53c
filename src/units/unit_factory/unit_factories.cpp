/// @file unit_factories.cpp
/// @brief Static data of the built-in unit types.

#include "dad/units/unit_factory.hpp"

#include <string>
#include <utility>

namespace dad::units {

using game::AnimationClipSpec;
using game::AnimationKind;
using game::BehaviorKind;
using game::BehaviorRepertoire;

namespace {

AnimationClipSpec clip(std::string sheet, float width, float height,
                       uint32_t columns, uint32_t rows, uint32_t frames,
                       AnimationKind kind) {
    AnimationClipSpec spec;
    spec.spriteSheet = std::move(sheet);
    spec.frameSize = {width, height};
    spec.columns = columns;
    spec.rows = rows;
    spec.frameCount = frames;
    spec.kind = kind;
    // Idle and Walk cycle; Death holds its last frame; Attack plays once
    // per landed hit.
    spec.loops = kind == AnimationKind::Idle || kind == AnimationKind::Walk;
    spec.attackTriggered = kind == AnimationKind::Attack;
    return spec;
}

} // namespace

// ── Acolyte ──────────────────────────────────────────────────────────

StatProfile AcolyteFactory::GetStatProfile() const {
    return {75.0f, 50, 0.8f};
}

BehaviorRepertoire AcolyteFactory::GetBehaviorRepertoire() const {
    return {BehaviorKind::Idle,
            {{BehaviorKind::Idle, 5},
             {BehaviorKind::Flee, 10},
             {BehaviorKind::Dead, 15}}};
}

std::vector<AnimationClipSpec> AcolyteFactory::GetAnimationClips() const {
    // The acolyte has no walk sheet; it shuffles using the idle frames.
    return {
        clip("acolyte/acolyte_idle.png", 80.0f, 80.0f, 3, 4, 9, AnimationKind::Idle),
        clip("acolyte/acolyte_idle.png", 80.0f, 80.0f, 3, 4, 9, AnimationKind::Walk),
        clip("acolyte/acolyte_death.png", 80.0f, 80.0f, 3, 4, 9, AnimationKind::Death),
    };
}

std::optional<ManaGenerator> AcolyteFactory::GetManaGenerator() const {
    return ManaGenerator{1.0f, 5, 0.0f};
}

// ── Warrior ──────────────────────────────────────────────────────────

StatProfile WarriorFactory::GetStatProfile() const {
    return {200.0f, 255, 1.8f};
}

BehaviorRepertoire WarriorFactory::GetBehaviorRepertoire() const {
    return game::DefaultRepertoire();
}

std::vector<AnimationClipSpec> WarriorFactory::GetAnimationClips() const {
    return {
        clip("warrior/warrior_idle.png", 96.0f, 96.0f, 21, 1, 20, AnimationKind::Idle),
        clip("warrior/warrior_walk.png", 96.0f, 96.0f, 11, 1, 10, AnimationKind::Walk),
        clip("warrior/warrior_death.png", 96.0f, 96.0f, 36, 1, 35, AnimationKind::Death),
        clip("warrior/warrior_attack.png", 96.0f, 96.0f, 33, 1, 32, AnimationKind::Attack),
    };
}

// ── Cat ──────────────────────────────────────────────────────────────

StatProfile CatFactory::GetStatProfile() const {
    return {300.0f, 125, 1.4f};
}

BehaviorRepertoire CatFactory::GetBehaviorRepertoire() const {
    return game::DefaultRepertoire();
}

std::vector<AnimationClipSpec> CatFactory::GetAnimationClips() const {
    return {
        clip("cat/cat_idle.png", 96.0f, 96.0f, 10, 1, 9, AnimationKind::Idle),
        clip("cat/cat_walk.png", 96.0f, 96.0f, 8, 1, 7, AnimationKind::Walk),
        clip("cat/cat_death.png", 96.0f, 96.0f, 18, 1, 17, AnimationKind::Death),
        clip("cat/cat_attack.png", 96.0f, 96.0f, 27, 1, 26, AnimationKind::Attack),
    };
}

// ── Knight ───────────────────────────────────────────────────────────

StatProfile KnightFactory::GetStatProfile() const {
    return {250.0f, 90, 1.5f};
}

BehaviorRepertoire KnightFactory::GetBehaviorRepertoire() const {
    return {BehaviorKind::MoveToOrigin,
            {{BehaviorKind::Wander, 3},
             {BehaviorKind::MoveToOrigin, 5},
             {BehaviorKind::Chase, 10},
             {BehaviorKind::Attack, 15},
             {BehaviorKind::Dead, 20}}};
}

std::vector<AnimationClipSpec> KnightFactory::GetAnimationClips() const {
    return {
        clip("enemy/enemy_idle.png", 64.0f, 64.0f, 12, 1, 11, AnimationKind::Idle),
        clip("enemy/enemy_move.png", 96.0f, 64.0f, 8, 1, 7, AnimationKind::Walk),
        clip("enemy/enemy_death.png", 96.0f, 64.0f, 15, 1, 14, AnimationKind::Death),
        clip("enemy/enemy_attack.png", 144.0f, 64.0f, 22, 1, 21, AnimationKind::Attack),
    };
}

} // namespace dad::units
