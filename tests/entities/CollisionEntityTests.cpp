/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionEntityTests
#include <boost/test/unit_test.hpp>

#include "../common/TestWorld.hpp"
#include "core/Errors.hpp"
#include "core/SimulationContext.hpp"
#include "entities/CollisionEntity.hpp"
#include "entities/PhysicsProp.hpp"
#include "managers/ChunkManager.hpp"
#include "managers/EntityManager.hpp"
#include <memory>

using namespace StrataEngine;
using namespace StrataEngine::TestWorld;

namespace {
constexpr float DT = 1.0f / 60.0f;
const float FLOOR_TOP = 15.0f * TILE;
} // namespace

class CollisionEntityFixture {
public:
    CollisionEntityFixture() : catalog(makeCatalog()), config(makeConfig()), entities(config) {
        // Stone floor in chunk 0, ice floor in chunk 1, a stone wall at column 10 of chunk 0
        RawChunk stone = floorChunk('1');
        for (int y = 0; y < TILES_PER_SIDE - 1; ++y) {
            put(*stone.middleground, 10, y, '1');
        }
        RawChunkMap raw{{ChunkCoord{0, 0}, stone}, {ChunkCoord{1, 0}, floorChunk('3')}};
        chunks = std::make_unique<ChunkManager>(catalog, raw, config);
        chunks->update(Vector2D(0.0f, 0.0f));

        context.chunks = chunks.get();
        context.entities = &entities;
        context.config = &config;
    }

    ~CollisionEntityFixture() { entities.clear(); }

    // Box standing on the floor with its centre at x
    std::shared_ptr<CollisionEntity> spawnOnFloor(float x, float size = 40.0f) {
        auto entity = entities.spawn<CollisionEntity>(context, Vector2D(x, 0.0f), Vector2D(size, size));
        FloatRect rect = entity->getRect();
        rect.setBottom(FLOOR_TOP);
        entity->setPosition(rect.center());
        return entity;
    }

    void step(Entity& entity, int frames) {
        for (int i = 0; i < frames; ++i) {
            entity.update(DT);
        }
    }

protected:
    TileCatalog catalog;
    SimulationConfig config;
    EntityManager entities;
    std::unique_ptr<ChunkManager> chunks;
    SimulationContext context;
};

BOOST_FIXTURE_TEST_SUITE(CollisionEntityTestSuite, CollisionEntityFixture)

BOOST_AUTO_TEST_CASE(TestContextIsRequired) {
    SimulationContext empty;
    BOOST_CHECK_THROW(Entity(empty, Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f)), ConfigurationError);

    SimulationContext noChunks = context;
    noChunks.chunks = nullptr;
    BOOST_CHECK_NO_THROW(Entity(noChunks, Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f)));
    BOOST_CHECK_THROW(CollisionEntity(noChunks, Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f)),
                      ConfigurationError);
}

BOOST_AUTO_TEST_CASE(TestUniqueIDs) {
    auto a = entities.spawn<Entity>(context, Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    auto b = entities.spawn<Entity>(context, Vector2D(0.0f, 0.0f), Vector2D(10.0f, 10.0f));
    BOOST_CHECK_NE(a->getID(), b->getID());
    BOOST_CHECK_NE(a->getID(), 0u);
}

BOOST_AUTO_TEST_CASE(TestFallingEntityLandsExactlyOnFloor) {
    // Centred on floor tile 4 so it lands on exactly one tile
    auto entity = entities.spawn<CollisionEntity>(context, Vector2D(4.5f * TILE, 500.0f), Vector2D(40.0f, 40.0f));
    BOOST_CHECK(!entity->isOnGround());

    int frames = 0;
    while (!entity->isOnGround() && frames < 240) {
        entity->update(DT);
        ++frames;
    }

    BOOST_REQUIRE(entity->isOnGround());
    BOOST_CHECK_EQUAL(entity->getRect().bottom(), FLOOR_TOP);
    BOOST_CHECK_EQUAL(entity->getVelocity(), Vector2D(0.0f, 0.0f));
    BOOST_CHECK_EQUAL(entity->getTileContacts()[ContactSide::Bottom].size(), 1u);

    // Resting: no gravity build-up, no drift
    step(*entity, 30);
    BOOST_CHECK(entity->isOnGround());
    BOOST_CHECK_EQUAL(entity->getRect().bottom(), FLOOR_TOP);
    BOOST_CHECK_EQUAL(entity->getVelocity(), Vector2D(0.0f, 0.0f));
}

BOOST_AUTO_TEST_CASE(TestGravityAcceleratesInAir) {
    auto entity = entities.spawn<CollisionEntity>(context, Vector2D(200.0f, 100.0f), Vector2D(40.0f, 40.0f));
    entity->update(DT);
    BOOST_CHECK_CLOSE(entity->getVelocity().getY(), config.gravity() * DT, 0.01f);
    BOOST_CHECK_GT(entity->getPosition().getY(), 100.0f);
    BOOST_CHECK(!entity->getTileContacts().has(ContactSide::Any));
}

BOOST_AUTO_TEST_CASE(TestVelocityIsClampedPerAxis) {
    auto entity = entities.spawn<CollisionEntity>(context, Vector2D(200.0f, 100.0f), Vector2D(40.0f, 40.0f));

    entity->setVelocity(Vector2D(10000.0f, -10000.0f));
    BOOST_CHECK_EQUAL(entity->getVelocity(), Vector2D(config.maxVelocityX, -config.maxVelocityY));

    entity->setVelocity(Vector2D(0.0f, 0.0f));
    entity->accelerate(Vector2D(0.0f, 1000.0f), 10.0f);
    BOOST_CHECK_EQUAL(entity->getVelocity().getY(), config.maxVelocityY);
    BOOST_CHECK_EQUAL(entity->getVelocity().getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestFloorFrictionSlowsHorizontalMotion) {
    auto onStone = spawnOnFloor(200.0f);
    auto onIce = spawnOnFloor(CHUNK + 200.0f);
    // Settle both so the floor contact is known
    step(*onStone, 1);
    step(*onIce, 1);
    BOOST_REQUIRE(onStone->isOnGround());
    BOOST_REQUIRE(onIce->isOnGround());

    onStone->setVelocity(Vector2D(300.0f, 0.0f));
    onIce->setVelocity(Vector2D(300.0f, 0.0f));
    step(*onStone, 1);
    step(*onIce, 1);

    BOOST_CHECK_CLOSE(onStone->getTileFriction(ContactSide::Bottom), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(onIce->getTileFriction(ContactSide::Bottom), 0.1f, 0.001f);
    BOOST_CHECK_CLOSE(onStone->getVelocity().getX(), 300.0f - config.frictionMultiplier * DT, 0.01f);
    BOOST_CHECK_CLOSE(onIce->getVelocity().getX(), 300.0f - config.frictionMultiplier * 0.1f * DT, 0.01f);

    // Deceleration stops at zero instead of reversing
    step(*onStone, 1);
    BOOST_CHECK_EQUAL(onStone->getVelocity().getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestNoFrictionInAir) {
    auto entity = entities.spawn<CollisionEntity>(context, Vector2D(200.0f, 100.0f), Vector2D(40.0f, 40.0f));
    entity->setVelocity(Vector2D(300.0f, 0.0f));
    entity->update(DT);
    BOOST_CHECK_EQUAL(entity->getVelocity().getX(), 300.0f);
}

BOOST_AUTO_TEST_CASE(TestNegligibleVelocityIsZeroed) {
    auto entity = spawnOnFloor(200.0f);
    step(*entity, 1);

    entity->setVelocity(Vector2D(8.0f, 0.0f));
    entity->update(DT);
    BOOST_CHECK_EQUAL(entity->getVelocity(), Vector2D(0.0f, 0.0f));
}

BOOST_AUTO_TEST_CASE(TestWallStopsHorizontalMotion) {
    const float wallLeft = 10.0f * TILE;
    auto entity = spawnOnFloor(wallLeft - 30.0f);
    entity->setVelocity(Vector2D(3000.0f, 0.0f));

    entity->update(DT);
    BOOST_CHECK_EQUAL(entity->getRect().right(), wallLeft);
    BOOST_CHECK(entity->getTileContacts().has(ContactSide::Right));
    BOOST_CHECK_EQUAL(entity->getVelocity().getX(), 0.0f);
    BOOST_CHECK(entity->isOnGround());
}

BOOST_AUTO_TEST_CASE(TestCeilingStopsUpwardMotion) {
    // Top slab at (5, 13) covers y 624..648; the box starts just below it
    chunks->addTile(ChunkCoord{0, 0}, TilePos{5, 13}, '4');
    auto entity = entities.spawn<CollisionEntity>(context, Vector2D(5.5f * TILE, 660.0f), Vector2D(20.0f, 20.0f));

    entity->setVelocity(Vector2D(0.0f, -1200.0f));
    entity->update(DT);
    BOOST_CHECK(entity->getTileContacts().has(ContactSide::Top));
    BOOST_CHECK_EQUAL(entity->getRect().top(), 13.0f * TILE + TILE / 2.0f);
    BOOST_CHECK_EQUAL(entity->getVelocity().getY(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestTileHelpers) {
    auto entity = entities.spawn<CollisionEntity>(context, Vector2D(0.0f, 0.0f), Vector2D(40.0f, 40.0f));
    entity->snapToTile(WorldTile{4, 14});
    BOOST_CHECK_EQUAL(entity->getPosition().getX(), 4.5f * TILE);
    BOOST_CHECK_EQUAL(entity->getRect().bottom(), FLOOR_TOP);
    BOOST_CHECK_EQUAL(entity->getOccupyingTile(), (WorldTile{4, 14}));

    entity->setVelocity(Vector2D(100.0f, 100.0f));
    entity->teleport(Vector2D(-100.0f, -100.0f));
    BOOST_CHECK_EQUAL(entity->getPosition(), Vector2D(-100.0f, -100.0f));
    BOOST_CHECK_EQUAL(entity->getVelocity(), Vector2D(0.0f, 0.0f));
    BOOST_CHECK_EQUAL(entity->getOccupyingTile(), (WorldTile{-3, -2}));
}

BOOST_AUTO_TEST_CASE(TestCollidingEntities) {
    auto a = entities.spawn<Entity>(context, Vector2D(0.0f, 0.0f), Vector2D(20.0f, 20.0f));
    auto b = entities.spawn<Entity>(context, Vector2D(15.0f, 0.0f), Vector2D(20.0f, 20.0f));
    auto c = entities.spawn<Entity>(context, Vector2D(20.0f, 0.0f), Vector2D(20.0f, 20.0f));

    const auto hits = a->getCollidingEntities();
    BOOST_REQUIRE_EQUAL(hits.size(), 1u);
    BOOST_CHECK(hits[0] == b);

    BOOST_CHECK_EQUAL(b->getCollidingEntities().size(), 2u);
    BOOST_CHECK_EQUAL(a->getCollidingEntities(FloatRect(100.0f, 100.0f, 5.0f, 5.0f)).size(), 0u);
    BOOST_CHECK(c->isAlive());
}

BOOST_AUTO_TEST_CASE(TestApplyField) {
    auto entity = entities.spawn<Entity>(context, Vector2D(0.0f, 0.0f), Vector2D(20.0f, 20.0f));
    BOOST_CHECK(entity->applyField("velocity_x", EntityValue(12.5f)));
    BOOST_CHECK(entity->applyField("velocity_y", EntityValue(-3)));
    BOOST_CHECK_EQUAL(entity->getVelocity(), Vector2D(12.5f, -3.0f));

    BOOST_CHECK(!entity->applyField("velocity_x", EntityValue(std::string("fast"))));
    BOOST_CHECK(!entity->applyField("health", EntityValue(10)));
}

BOOST_AUTO_TEST_CASE(TestKillRemovesFromManager) {
    auto entity = entities.spawn<Entity>(context, Vector2D(0.0f, 0.0f), Vector2D(20.0f, 20.0f));
    BOOST_CHECK(entities.contains(entity->getID()));

    entity->kill();
    BOOST_CHECK(!entity->isAlive());
    BOOST_CHECK(!entities.contains(entity->getID()));

    // Killing again is a no-op
    BOOST_CHECK_NO_THROW(entity->kill());
    BOOST_CHECK(entities.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PhysicsPropTestSuite, CollisionEntityFixture)

BOOST_AUTO_TEST_CASE(TestImmediateKill) {
    auto prop = entities.spawn<PhysicsProp>(context, Vector2D(200.0f, 100.0f), Vector2D(40.0f, 40.0f));
    BOOST_CHECK_EQUAL(prop->getDrawLevel(), 1);
    prop->kill();
    BOOST_CHECK(!prop->isAlive());
    BOOST_CHECK(entities.empty());
}

BOOST_AUTO_TEST_CASE(TestDelayedKill) {
    auto prop = entities.spawn<PhysicsProp>(context, Vector2D(200.0f, 100.0f), Vector2D(40.0f, 40.0f), 0.5f);
    prop->kill();
    BOOST_CHECK(prop->isDying());
    BOOST_CHECK(prop->isAlive());
    BOOST_CHECK_CLOSE(prop->getRemainingDeathTime(), 0.5f, 0.001f);

    // Keeps falling while the timer runs
    const Vector2D focus(200.0f, 300.0f);
    for (int i = 0; i < 20; ++i) {
        entities.update(DT, focus);
    }
    BOOST_CHECK(prop->isAlive());
    BOOST_CHECK_GT(prop->getPosition().getY(), 100.0f);

    for (int i = 0; i < 20; ++i) {
        entities.update(DT, focus);
    }
    BOOST_CHECK(!prop->isAlive());
    BOOST_CHECK(entities.empty());
}

BOOST_AUTO_TEST_CASE(TestEntityData) {
    auto prop = entities.spawn<PhysicsProp>(context, Vector2D(200.0f, 100.0f), Vector2D(40.0f, 30.0f), 2.0f);

    auto resting = prop->getEntityData();
    BOOST_REQUIRE(resting.has_value());
    BOOST_CHECK_EQUAL(resting->className, "PhysicsProp");
    const std::vector<EntityValue> args{200.0f, 100.0f, 40.0f, 30.0f, 2.0f};
    BOOST_CHECK(resting->initArgs == args);
    BOOST_CHECK(resting->changedFields.empty());

    prop->setVelocity(Vector2D(50.0f, 0.0f));
    auto moving = prop->getEntityData();
    BOOST_REQUIRE_EQUAL(moving->changedFields.size(), 1u);
    BOOST_CHECK_EQUAL(moving->changedFields[0].first, "velocity_x");
    BOOST_CHECK(moving->changedFields[0].second == EntityValue(50.0f));

    // Plain entities are not persisted
    auto plain = entities.spawn<Entity>(context, Vector2D(0.0f, 0.0f), Vector2D(20.0f, 20.0f));
    BOOST_CHECK(!plain->getEntityData().has_value());
}

BOOST_AUTO_TEST_SUITE_END()
