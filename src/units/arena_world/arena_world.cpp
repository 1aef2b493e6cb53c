/// @file arena_world.cpp
/// @brief ArenaWorld storage wiring and level teardown.

#include "dad/units/arena_world.hpp"

#include "dad/ecs/query.hpp"
#include "dad/foundation/game_logger.hpp"

#include <string>

namespace dad::units {

using foundation::LogCategory;

ArenaWorld::ArenaWorld() {
    std::apply([this](auto&... storage) { (entities_.RegisterStorage(&storage), ...); },
               storages_);
}

bool ArenaWorld::HasBehaviorMarker(ecs::Entity entity, game::BehaviorKind kind) const {
    bool present = false;
    game::VisitBehaviorMarker(kind, [&](auto marker) {
        using Marker = typename decltype(marker)::type;
        present = Storage<Marker>().Has(entity);
    });
    return present;
}

std::size_t ArenaWorld::UnitCount() const noexcept {
    return Storage<UnitKind>().Size();
}

std::size_t ArenaWorld::TeardownLevel() {
    // Query handles carry no generation; Destroy needs the live one.
    const auto tagged = ecs::Query<game::Cleanup>(Storage<game::Cleanup>()).Collect();

    std::size_t destroyed = 0;
    for (auto slot : tagged) {
        auto entity = entities_.HandleAt(slot.id());
        if (!entities_.IsAlive(entity)) {
            continue;
        }
        entities_.Destroy(entity);
        ++destroyed;
    }

    DAD_LOG_DEBUG(LogCategory::Core,
                  "level teardown destroyed " + std::to_string(destroyed) + " entities");
    return destroyed;
}

} // namespace dad::units
