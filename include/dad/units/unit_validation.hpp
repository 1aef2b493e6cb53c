#pragma once

/// @file unit_validation.hpp
/// @brief Authoring checks for factory-provided unit data.
///
/// Malformed repertoires or clip lists are authoring defects.  They are
/// reported as errors, never clamped or patched up, and the spawn path
/// runs these checks before it touches the entity store.

#include "dad/foundation/game_result.hpp"
#include "dad/game/animation_types.hpp"
#include "dad/game/behavior_types.hpp"
#include "dad/units/unit_factory.hpp"

#include <vector>

namespace dad::units {

/// Fails with EmptyRepertoire, UnknownBehavior, DuplicateBehavior or
/// InitialBehaviorMissing.  Equal weights on different kinds are legal.
foundation::GameResult<void> ValidateRepertoire(const game::BehaviorRepertoire& repertoire);

/// Fails with MissingSpriteSheet, InvalidFrameGrid, FrameCountExceedsGrid,
/// MissingIdleClip or DuplicateIdleClip.
foundation::GameResult<void> ValidateAnimationClips(
    const std::vector<game::AnimationClipSpec>& clips);

/// Run both checks on the data of @p factory.  The error message is
/// prefixed with the unit name and carries the UnitType as context.
foundation::GameResult<void> ValidateFactory(const IUnitFactory& factory);

} // namespace dad::units
