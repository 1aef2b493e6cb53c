#include <gtest/gtest.h>

#include <memory>

#include "dad/game/animation_spawner.hpp"
#include "dad/units/arena_world.hpp"
#include "dad/units/unit_catalog.hpp"
#include "dad/units/unit_spawner.hpp"

using namespace dad::units;
using namespace dad::game;
using dad::ecs::Entity;

class ArenaWorldTest : public ::testing::Test {
protected:
    ArenaWorld world_;
    AnimatedChildSpawner animations_{world_.Entities(),
                                     world_.Storage<SpriteAnimation>(),
                                     world_.Storage<Transform>()};
    UnitSpawner spawner_{world_,
                         std::make_shared<const UnitCatalog>(UnitCatalog::CreateDefault()),
                         animations_};
};

TEST_F(ArenaWorldTest, StoragesAreRegisteredWithManager) {
    auto e = world_.Entities().Create();
    world_.Storage<Health>().Add(e, 10, 10);
    world_.Storage<FleeBehavior>().Add(e);

    world_.Entities().Destroy(e);
    EXPECT_EQ(world_.Storage<Health>().Size(), 0u);
    EXPECT_EQ(world_.Storage<FleeBehavior>().Size(), 0u);
}

TEST_F(ArenaWorldTest, HasBehaviorMarkerPerKind) {
    auto e = world_.Entities().Create();
    world_.Storage<WanderBehavior>().Add(e);

    EXPECT_TRUE(world_.HasBehaviorMarker(e, BehaviorKind::Wander));
    EXPECT_FALSE(world_.HasBehaviorMarker(e, BehaviorKind::Attack));
    EXPECT_FALSE(world_.HasBehaviorMarker(e, BehaviorKind::COUNT));
}

TEST_F(ArenaWorldTest, TeardownRemovesUnitsAndChildren) {
    ASSERT_TRUE(spawner_.Spawn(UnitType::Acolyte, Team::Player, {0.0f, 0.0f}));
    ASSERT_TRUE(spawner_.Spawn(UnitType::Warrior, Team::Player, {10.0f, 0.0f}));
    ASSERT_TRUE(spawner_.Spawn(UnitType::Knight, Team::Enemy, {400.0f, 0.0f}));
    ASSERT_EQ(world_.UnitCount(), 3u);
    ASSERT_EQ(world_.Entities().Count(), 3u + 3u + 4u + 4u);

    auto destroyed = world_.TeardownLevel();

    EXPECT_EQ(destroyed, 3u);
    EXPECT_EQ(world_.Entities().Count(), 0u);
    EXPECT_EQ(world_.UnitCount(), 0u);
    EXPECT_EQ(world_.Storage<SpriteAnimation>().Size(), 0u);
    EXPECT_EQ(world_.Storage<Transform>().Size(), 0u);
}

TEST_F(ArenaWorldTest, TeardownKeepsUntaggedEntities) {
    auto persistent = world_.Entities().Create();
    world_.Storage<Transform>().Add(persistent);
    ASSERT_TRUE(spawner_.Spawn(UnitType::Cat, Team::Player, {0.0f, 0.0f}));

    EXPECT_EQ(world_.TeardownLevel(), 1u);
    EXPECT_TRUE(world_.Entities().IsAlive(persistent));
    EXPECT_EQ(world_.Entities().Count(), 1u);
}

TEST_F(ArenaWorldTest, TeardownOfEmptyLevel) {
    EXPECT_EQ(world_.TeardownLevel(), 0u);
}

TEST_F(ArenaWorldTest, SlotsAreReusedAfterTeardown) {
    auto first = spawner_.Spawn(UnitType::Cat, Team::Player, {0.0f, 0.0f});
    ASSERT_TRUE(first);
    world_.TeardownLevel();

    auto second = spawner_.Spawn(UnitType::Cat, Team::Player, {0.0f, 0.0f});
    ASSERT_TRUE(second);
    EXPECT_FALSE(world_.Entities().IsAlive(first.value()));
    EXPECT_TRUE(world_.Entities().IsAlive(second.value()));
    EXPECT_EQ(world_.Entities().Capacity(), 5u);
}
