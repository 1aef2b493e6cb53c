/// @file unit_validation.cpp
/// @brief Repertoire and animation clip checks.

#include "dad/units/unit_validation.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <utility>

namespace dad::units {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using game::AnimationKind;
using game::BehaviorKind;

namespace {

GameResult<void> fail(ErrorCode code, std::string message) {
    return GameResult<void>::err(GameError(code, std::move(message)));
}

std::string clipLabel(std::size_t index, const game::AnimationClipSpec& clip) {
    return "clip #" + std::to_string(index) + " (" +
        std::string(game::animationKindName(clip.kind)) + ")";
}

} // namespace

GameResult<void> ValidateRepertoire(const game::BehaviorRepertoire& repertoire) {
    if (repertoire.entries.empty()) {
        return fail(ErrorCode::EmptyRepertoire, "behavior repertoire has no entries");
    }

    std::array<bool, game::kBehaviorKindCount> seen{};
    for (const auto& entry : repertoire.entries) {
        const auto idx = static_cast<std::size_t>(entry.kind);
        if (idx >= game::kBehaviorKindCount) {
            return fail(ErrorCode::UnknownBehavior,
                        "unknown behavior kind " + std::to_string(idx));
        }
        if (seen[idx]) {
            return fail(ErrorCode::DuplicateBehavior,
                        "behavior " + std::string(game::behaviorKindName(entry.kind)) +
                            " listed more than once");
        }
        seen[idx] = true;
    }

    if (!repertoire.Contains(repertoire.initialBehavior)) {
        return fail(ErrorCode::InitialBehaviorMissing,
                    "initial behavior " +
                        std::string(game::behaviorKindName(repertoire.initialBehavior)) +
                        " is not in the repertoire");
    }
    return GameResult<void>::ok();
}

GameResult<void> ValidateAnimationClips(const std::vector<game::AnimationClipSpec>& clips) {
    std::size_t idleClips = 0;

    for (std::size_t i = 0; i < clips.size(); ++i) {
        const auto& clip = clips[i];

        if (clip.spriteSheet.empty()) {
            return fail(ErrorCode::MissingSpriteSheet, clipLabel(i, clip) + " has no sprite sheet");
        }
        if (clip.columns == 0 || clip.rows == 0 || clip.frameCount == 0 ||
            !(clip.frameSize.x > 0.0f) || !(clip.frameSize.y > 0.0f)) {
            return fail(ErrorCode::InvalidFrameGrid, clipLabel(i, clip) + " has an empty frame grid");
        }

        // 64-bit product: a hand-typed grid must not wrap around.
        const uint64_t capacity = static_cast<uint64_t>(clip.columns) * clip.rows;
        if (clip.frameCount > capacity) {
            return fail(ErrorCode::FrameCountExceedsGrid,
                        clipLabel(i, clip) + " declares " + std::to_string(clip.frameCount) +
                            " frames but the grid holds " + std::to_string(capacity));
        }

        if (clip.kind == AnimationKind::Idle) {
            ++idleClips;
        }
    }

    if (idleClips == 0) {
        return fail(ErrorCode::MissingIdleClip, "no Idle animation clip");
    }
    if (idleClips > 1) {
        return fail(ErrorCode::DuplicateIdleClip,
                    std::to_string(idleClips) + " Idle animation clips");
    }
    return GameResult<void>::ok();
}

GameResult<void> ValidateFactory(const IUnitFactory& factory) {
    const auto type = factory.GetUnitType();

    auto check = ValidateRepertoire(factory.GetBehaviorRepertoire());
    if (check) {
        check = ValidateAnimationClips(factory.GetAnimationClips());
    }
    if (!check) {
        const auto& cause = check.error();
        return GameResult<void>::err(GameError(
            cause.code(), std::string(unitTypeName(type)) + ": " + std::string(cause.message()),
            type));
    }
    return GameResult<void>::ok();
}

} // namespace dad::units
