#pragma once

/// @file entity.hpp
/// @brief Entity handle for the unit entity store.
///
/// A 32-bit handle: 24-bit slot index plus an 8-bit generation.  The
/// generation is bumped every time a slot is recycled, so a handle kept
/// by an AI or animation system after its unit died is detectably stale.

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>

namespace dad::ecs {

struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kIdMask - 1;

    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    /// Slot index (0 .. kMaxId).
    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    /// Slot generation (0 .. 255).
    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace dad::ecs

template <>
struct std::hash<dad::ecs::Entity> {
    std::size_t operator()(const dad::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
