#pragma once

/// @file behavior_components.hpp
/// @brief Components the AI loop reads to pick a unit's behavior.
///
/// A spawned unit holds its full weighted list in SupportedBehaviors and,
/// in addition, one empty marker component per listed kind.  The markers
/// let a system ask "may this unit Chase?" with a single storage Has()
/// instead of scanning the list.  The spawn path writes both; they always
/// describe the same set.

#include "dad/game/behavior_types.hpp"

#include <type_traits>
#include <vector>

namespace dad::game {

/// Behavior currently driving the unit.
struct CurrentBehavior {
    BehaviorKind kind = BehaviorKind::Idle;
};

/// Weighted list of every behavior legal for the unit.
struct SupportedBehaviors {
    std::vector<BehaviorEntry> entries;
};

// Presence markers, one per BehaviorKind.
struct IdleBehavior {};
struct MoveToOriginBehavior {};
struct WanderBehavior {};
struct ChaseBehavior {};
struct FleeBehavior {};
struct AttackBehavior {};
struct DeadBehavior {};

/// Invoke @p visitor with std::type_identity<Marker>{} for the marker type
/// matching @p kind.
///
/// @return false if @p kind names no behavior (visitor not called).
template <typename Visitor>
bool VisitBehaviorMarker(BehaviorKind kind, Visitor&& visitor) {
    switch (kind) {
        case BehaviorKind::Idle:         visitor(std::type_identity<IdleBehavior>{}); return true;
        case BehaviorKind::MoveToOrigin: visitor(std::type_identity<MoveToOriginBehavior>{}); return true;
        case BehaviorKind::Wander:       visitor(std::type_identity<WanderBehavior>{}); return true;
        case BehaviorKind::Chase:        visitor(std::type_identity<ChaseBehavior>{}); return true;
        case BehaviorKind::Flee:         visitor(std::type_identity<FleeBehavior>{}); return true;
        case BehaviorKind::Attack:       visitor(std::type_identity<AttackBehavior>{}); return true;
        case BehaviorKind::Dead:         visitor(std::type_identity<DeadBehavior>{}); return true;
        case BehaviorKind::COUNT:        break;
    }
    return false;
}

} // namespace dad::game
