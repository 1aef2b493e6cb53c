#pragma once

/// @file unit_factory.hpp
/// @brief Per-type unit composition factories.
///
/// Each unit type supplies its static data through IUnitFactory: base
/// stats, behavior repertoire and animation clips.  Queries take no input,
/// have no side effects and return equal values on every call, so callers
/// may cache them freely.  New unit types are added by writing another
/// implementation and registering it in the UnitCatalog; the spawn path
/// does not change.

#include "dad/game/animation_types.hpp"
#include "dad/game/behavior_types.hpp"
#include "dad/units/unit_types.hpp"

#include <optional>
#include <vector>

namespace dad::units {

class IUnitFactory {
public:
    virtual ~IUnitFactory() = default;

    /// Unit type this factory builds.
    [[nodiscard]] virtual UnitType GetUnitType() const = 0;

    [[nodiscard]] virtual StatProfile GetStatProfile() const = 0;

    /// Legal behaviors with weights, plus the behavior active at spawn.
    /// Types without special behaviors return game::DefaultRepertoire().
    [[nodiscard]] virtual game::BehaviorRepertoire GetBehaviorRepertoire() const = 0;

    /// Clips in instantiation order; exactly one must be an Idle clip.
    [[nodiscard]] virtual std::vector<game::AnimationClipSpec> GetAnimationClips() const = 0;

    /// Mana income for support units; nullopt for everyone else.
    [[nodiscard]] virtual std::optional<ManaGenerator> GetManaGenerator() const {
        return std::nullopt;
    }
};

/// Support unit: slow, fragile, grants mana, flees instead of fighting.
class AcolyteFactory final : public IUnitFactory {
public:
    [[nodiscard]] UnitType GetUnitType() const override { return UnitType::Acolyte; }
    [[nodiscard]] StatProfile GetStatProfile() const override;
    [[nodiscard]] game::BehaviorRepertoire GetBehaviorRepertoire() const override;
    [[nodiscard]] std::vector<game::AnimationClipSpec> GetAnimationClips() const override;
    [[nodiscard]] std::optional<ManaGenerator> GetManaGenerator() const override;
};

/// Melee brawler with the largest health pool.
class WarriorFactory final : public IUnitFactory {
public:
    [[nodiscard]] UnitType GetUnitType() const override { return UnitType::Warrior; }
    [[nodiscard]] StatProfile GetStatProfile() const override;
    [[nodiscard]] game::BehaviorRepertoire GetBehaviorRepertoire() const override;
    [[nodiscard]] std::vector<game::AnimationClipSpec> GetAnimationClips() const override;
};

/// Fast skirmisher.
class CatFactory final : public IUnitFactory {
public:
    [[nodiscard]] UnitType GetUnitType() const override { return UnitType::Cat; }
    [[nodiscard]] StatProfile GetStatProfile() const override;
    [[nodiscard]] game::BehaviorRepertoire GetBehaviorRepertoire() const override;
    [[nodiscard]] std::vector<game::AnimationClipSpec> GetAnimationClips() const override;
};

/// Armored enemy attacker.  Marches on the origin, escalating through
/// chase and attack when it meets defenders.
class KnightFactory final : public IUnitFactory {
public:
    [[nodiscard]] UnitType GetUnitType() const override { return UnitType::Knight; }
    [[nodiscard]] StatProfile GetStatProfile() const override;
    [[nodiscard]] game::BehaviorRepertoire GetBehaviorRepertoire() const override;
    [[nodiscard]] std::vector<game::AnimationClipSpec> GetAnimationClips() const override;
};

} // namespace dad::units
