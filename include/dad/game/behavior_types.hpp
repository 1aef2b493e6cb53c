#pragma once

/// @file behavior_types.hpp
/// @brief Behavior vocabulary shared with the AI decision loop.
///
/// The AI loop owns what each behavior does per tick.  This header only
/// names the behaviors and describes which ones a unit may use and how
/// strongly each is weighted.

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace dad::game {

enum class BehaviorKind : uint8_t {
    Idle,
    MoveToOrigin,  ///< Walk toward the defended origin point.
    Wander,
    Chase,
    Flee,
    Attack,
    Dead,
    COUNT
};

inline constexpr std::size_t kBehaviorKindCount =
    static_cast<std::size_t>(BehaviorKind::COUNT);

constexpr std::string_view behaviorKindName(BehaviorKind kind) {
    switch (kind) {
        case BehaviorKind::Idle:         return "Idle";
        case BehaviorKind::MoveToOrigin: return "MoveToOrigin";
        case BehaviorKind::Wander:       return "Wander";
        case BehaviorKind::Chase:        return "Chase";
        case BehaviorKind::Flee:         return "Flee";
        case BehaviorKind::Attack:       return "Attack";
        case BehaviorKind::Dead:         return "Dead";
        case BehaviorKind::COUNT:        break;
    }
    return "Unknown";
}

/// One legal behavior and its priority weight.  Higher weights win; ties
/// are resolved by the AI loop.
struct BehaviorEntry {
    BehaviorKind kind = BehaviorKind::Idle;
    int32_t priority = 0;

    constexpr bool operator==(const BehaviorEntry&) const = default;
};

/// The behaviors a unit may use plus the one active right after spawn.
struct BehaviorRepertoire {
    BehaviorKind initialBehavior = BehaviorKind::Idle;
    std::vector<BehaviorEntry> entries;

    [[nodiscard]] bool Contains(BehaviorKind kind) const {
        return std::any_of(entries.begin(), entries.end(),
                           [kind](const BehaviorEntry& e) { return e.kind == kind; });
    }

    [[nodiscard]] std::optional<int32_t> PriorityOf(BehaviorKind kind) const {
        for (const auto& e : entries) {
            if (e.kind == kind) {
                return e.priority;
            }
        }
        return std::nullopt;
    }

    bool operator==(const BehaviorRepertoire&) const = default;
};

/// Weight of the single entry in DefaultRepertoire().
inline constexpr int32_t kDefaultIdlePriority = 1;

/// Repertoire for unit types without special behaviors: Idle only.
inline BehaviorRepertoire DefaultRepertoire() {
    return BehaviorRepertoire{BehaviorKind::Idle, {{BehaviorKind::Idle, kDefaultIdlePriority}}};
}

} // namespace dad::game
