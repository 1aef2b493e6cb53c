#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>: Result specialised with GameError.

#include "dad/core/result.hpp"
#include "dad/foundation/game_error.hpp"

namespace dad::foundation {

/// Return type of every fallible operation in the unit core.
///
/// @code
///   GameResult<void> checkCost(uint8_t cost) {
///       if (cost == 0) {
///           return GameResult<void>::err(
///               GameError(ErrorCode::InvalidUnitCost, "cost must be positive"));
///       }
///       return GameResult<void>::ok();
///   }
/// @endcode
template <typename T>
using GameResult = dad::Result<T, GameError>;

} // namespace dad::foundation
