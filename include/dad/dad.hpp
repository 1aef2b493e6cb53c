#pragma once

/// @file dad.hpp
/// @brief Convenience header pulling in the public unit spawn API.

#include "dad/version.hpp"
#include "dad/core/result.hpp"

#include "dad/foundation/config_manager.hpp"
#include "dad/foundation/game_logger.hpp"
#include "dad/foundation/game_result.hpp"

#include "dad/ecs/entity_manager.hpp"
#include "dad/ecs/query.hpp"

#include "dad/game/animation_spawner.hpp"
#include "dad/game/behavior_components.hpp"
#include "dad/game/components.hpp"

#include "dad/units/arena_world.hpp"
#include "dad/units/unit_catalog.hpp"
#include "dad/units/unit_registry.hpp"
#include "dad/units/unit_spawner.hpp"
#include "dad/units/unit_validation.hpp"

#include "dad/app/arena_session.hpp"
