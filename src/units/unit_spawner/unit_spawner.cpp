/// @file unit_spawner.cpp
/// @brief UnitSpawner implementation.

#include "dad/units/unit_spawner.hpp"

#include "dad/foundation/game_logger.hpp"
#include "dad/units/unit_validation.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace dad::units {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

GameResult<ecs::Entity> rejected(UnitType type, const GameError& cause) {
    auto error = GameError(cause.code(),
                           std::string(unitTypeName(type)) + ": " + std::string(cause.message()),
                           type);
    DAD_LOG_WARN(LogCategory::Spawn, "spawn rejected: " + std::string(error.message()));
    return GameResult<ecs::Entity>::err(std::move(error));
}

} // namespace

UnitSpawner::UnitSpawner(ArenaWorld& world,
                         std::shared_ptr<const UnitCatalog> catalog,
                         game::IAnimationSpawner& animations)
    : world_(world), catalog_(std::move(catalog)), animations_(animations) {}

GameResult<ecs::Entity> UnitSpawner::Spawn(UnitType type, game::Team team,
                                           game::Vector2 position) {
    const auto* factory = catalog_ ? catalog_->Find(type) : nullptr;
    if (factory == nullptr) {
        return rejected(type, GameError(ErrorCode::UnitFactoryMissing, "no unit factory"));
    }
    if (!position.IsFinite()) {
        return rejected(type, GameError(ErrorCode::InvalidArgument, "non-finite spawn position"));
    }

    // ── Compute and validate before touching the world ──────────────────
    const auto stats = factory->GetStatProfile();
    auto repertoire = factory->GetBehaviorRepertoire();
    const auto clips = factory->GetAnimationClips();
    const auto mana = factory->GetManaGenerator();

    if (auto check = ValidateRepertoire(repertoire); !check) {
        return rejected(type, check.error());
    }
    if (auto check = ValidateAnimationClips(clips); !check) {
        return rejected(type, check.error());
    }

    auto& entities = world_.Entities();
    auto entity = entities.Create();

    // ── Base bundle ─────────────────────────────────────────────────────
    world_.Storage<game::Movement>().Add(entity, stats.movementSpeed);
    world_.Storage<game::Velocity>().Add(entity, game::Vector2::Zero());
    world_.Storage<game::Health>().Add(entity, stats.maxHealth, stats.maxHealth);
    world_.Storage<game::CurrentAnimation>().Add(entity);

    game::Transform transform;
    transform.position = game::Vector3(position, game::kUnitDrawLayer);
    transform.scale = game::Vector3::Splat(stats.visualScale);
    world_.Storage<game::Transform>().Add(entity, std::move(transform));

    world_.Storage<game::Cleanup>().Add(entity);
    world_.Storage<UnitKind>().Add(entity, type);
    world_.Storage<game::TeamMember>().Add(entity, team);

    // ── Behaviors ───────────────────────────────────────────────────────
    world_.Storage<game::CurrentBehavior>().Add(entity, repertoire.initialBehavior);
    for (const auto& entry : repertoire.entries) {
        game::VisitBehaviorMarker(entry.kind, [&](auto marker) {
            using Marker = typename decltype(marker)::type;
            world_.Storage<Marker>().Add(entity);
        });
    }
    world_.Storage<game::SupportedBehaviors>().Add(entity, std::move(repertoire.entries));

    // ── Extras ──────────────────────────────────────────────────────────
    if (mana) {
        world_.Storage<ManaGenerator>().Add(entity, *mana);
    }

    // ── Animation children ──────────────────────────────────────────────
    auto children = animations_.InstantiateChildren(entity, clips);
    const auto strays = std::count_if(children.begin(), children.end(), [&](ecs::Entity child) {
        return entities.ParentOf(child) != entity;
    });
    if (children.size() != clips.size() || strays != 0) {
        entities.Destroy(entity);
        for (auto child : children) {
            entities.Destroy(child);
        }
        return rejected(type, GameError(ErrorCode::ChildSpawnFailed,
                                        "animation spawner created " +
                                            std::to_string(children.size()) + " of " +
                                            std::to_string(clips.size()) + " clips, " +
                                            std::to_string(strays) + " not parented to the unit"));
    }

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Spawn)) {
        LogContext ctx;
        ctx.entity = entity.raw;
        ctx.unit = std::string(unitTypeName(type));
        ctx.team = std::string(game::teamName(team));
        ctx.extra["x"] = std::to_string(position.x);
        ctx.extra["y"] = std::to_string(position.y);
        ctx.extra["behavior"] =
            std::string(game::behaviorKindName(world_.Storage<game::CurrentBehavior>().Get(entity).kind));
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Spawn, "unit spawned", ctx);
    }

    return GameResult<ecs::Entity>::ok(entity);
}

} // namespace dad::units
