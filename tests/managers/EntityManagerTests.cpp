/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityManagerTests
#include <boost/test/unit_test.hpp>

#include "../common/TestWorld.hpp"
#include "core/SimulationContext.hpp"
#include "entities/Entity.hpp"
#include "entities/PhysicsProp.hpp"
#include "managers/ChunkManager.hpp"
#include "managers/EntityManager.hpp"
#include <memory>
#include <vector>

using namespace StrataEngine;
using namespace StrataEngine::TestWorld;

namespace {

// Counts its updates and drifts right at 1 unit per second
class CountingEntity : public Entity {
public:
    CountingEntity(const SimulationContext& context, const Vector2D& position)
        : Entity(context, position, Vector2D(20.0f, 20.0f)) {
        m_velocity = Vector2D(1.0f, 0.0f);
    }

    void update(float deltaTime) override {
        ++updates;
        Entity::update(deltaTime);
    }

    int updates{0};
};

// Removes its target from the manager when updated
class KillerEntity : public CountingEntity {
public:
    KillerEntity(const SimulationContext& context, const Vector2D& position, EntityPtr target)
        : CountingEntity(context, position), m_target(std::move(target)) {}

    void update(float deltaTime) override {
        CountingEntity::update(deltaTime);
        if (m_target) {
            m_target->kill();
        }
    }

private:
    EntityPtr m_target;
};

} // namespace

class EntityManagerFixture {
public:
    EntityManagerFixture() : config(makeConfig()), manager(config) {
        context.entities = &manager;
        context.config = &config;
    }

    ~EntityManagerFixture() { manager.clear(); }

    std::shared_ptr<CountingEntity> spawnAt(float x, float y) {
        return manager.spawn<CountingEntity>(context, Vector2D(x, y));
    }

protected:
    SimulationConfig config;
    EntityManager manager;
    SimulationContext context;
    const Vector2D origin{0.0f, 0.0f};
};

BOOST_FIXTURE_TEST_SUITE(EntityManagerTestSuite, EntityManagerFixture)

BOOST_AUTO_TEST_CASE(TestAddAndRemove) {
    auto entity = spawnAt(0.0f, 0.0f);
    BOOST_CHECK_EQUAL(manager.size(), 1u);
    BOOST_CHECK(manager.find(entity->getID()) == entity);

    BOOST_CHECK(!manager.add(entity));
    BOOST_CHECK(!manager.add(nullptr));
    BOOST_CHECK_EQUAL(manager.size(), 1u);

    BOOST_CHECK(manager.remove(entity));
    BOOST_CHECK(!entity->isAlive());
    BOOST_CHECK(!manager.remove(entity));
    BOOST_CHECK(!manager.remove(entity->getID()));
    BOOST_CHECK(manager.empty());
    BOOST_CHECK(manager.find(entity->getID()) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestProximityWindowHorizontal) {
    auto nearby = spawnAt(800.0f, 0.0f);
    auto distant = spawnAt(1000.0f, 0.0f);
    auto edge = spawnAt(-900.0f, 0.0f);

    const size_t updated = manager.update(1.0f, origin);

    BOOST_CHECK_EQUAL(updated, 2u);
    BOOST_CHECK_EQUAL(nearby->updates, 1);
    BOOST_CHECK_EQUAL(nearby->getPosition().getX(), 801.0f);
    BOOST_CHECK_EQUAL(edge->updates, 1);

    // Frozen, not removed
    BOOST_CHECK_EQUAL(distant->updates, 0);
    BOOST_CHECK_EQUAL(distant->getPosition().getX(), 1000.0f);
    BOOST_CHECK(manager.contains(distant->getID()));
}

BOOST_AUTO_TEST_CASE(TestKillWhenOutOfRangeAtWindowEdge) {
    auto nearby = spawnAt(800.0f, 0.0f);
    nearby->setKillWhenOutOfRange(true);
    auto transient = spawnAt(1000.0f, 0.0f);
    transient->setKillWhenOutOfRange(true);
    auto distant = spawnAt(1000.0f, 0.0f);

    BOOST_CHECK_EQUAL(manager.update(1.0f, origin), 1u);

    BOOST_CHECK_EQUAL(nearby->updates, 1);
    BOOST_CHECK(manager.contains(nearby->getID()));

    BOOST_CHECK_EQUAL(transient->updates, 0);
    BOOST_CHECK(!transient->isAlive());
    BOOST_CHECK(!manager.contains(transient->getID()));

    BOOST_CHECK_EQUAL(distant->updates, 0);
    BOOST_CHECK(manager.contains(distant->getID()));
    BOOST_CHECK_EQUAL(manager.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestProximityWindowVertical) {
    auto nearby = spawnAt(0.0f, 400.0f);
    auto distant = spawnAt(0.0f, -500.0f);

    manager.update(1.0f, origin);
    BOOST_CHECK_EQUAL(nearby->updates, 1);
    BOOST_CHECK_EQUAL(distant->updates, 0);

    // The window follows the focus
    manager.update(1.0f, Vector2D(0.0f, -500.0f));
    BOOST_CHECK_EQUAL(nearby->updates, 1);
    BOOST_CHECK_EQUAL(distant->updates, 1);
}

BOOST_AUTO_TEST_CASE(TestAlwaysUpdateAndKillWhenOutOfRange) {
    auto always = spawnAt(5000.0f, 0.0f);
    always->setAlwaysUpdate(true);
    auto transient = spawnAt(-5000.0f, 0.0f);
    transient->setKillWhenOutOfRange(true);
    auto frozen = spawnAt(0.0f, 5000.0f);

    BOOST_CHECK_EQUAL(manager.update(1.0f, origin), 1u);
    BOOST_CHECK_EQUAL(always->updates, 1);
    BOOST_CHECK(!transient->isAlive());
    BOOST_CHECK_EQUAL(transient->updates, 0);
    BOOST_CHECK(frozen->isAlive());
    BOOST_CHECK_EQUAL(manager.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestKillDepth) {
    auto sinking = spawnAt(0.0f, config.killDepth + 100.0f);
    sinking->setAlwaysUpdate(true);
    auto safe = spawnAt(0.0f, config.killDepth - 100.0f);

    manager.update(1.0f, origin);
    BOOST_CHECK(!sinking->isAlive());
    BOOST_CHECK_EQUAL(sinking->updates, 0);
    BOOST_CHECK(safe->isAlive());
    BOOST_CHECK_EQUAL(manager.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestEntitiesRemovedDuringPassAreSkipped) {
    auto victim = std::make_shared<CountingEntity>(context, Vector2D(10.0f, 0.0f));
    auto killer = manager.spawn<KillerEntity>(context, Vector2D(0.0f, 0.0f), victim);
    manager.add(victim);

    BOOST_CHECK_EQUAL(manager.update(1.0f, origin), 1u);
    BOOST_CHECK_EQUAL(killer->updates, 1);
    BOOST_CHECK_EQUAL(victim->updates, 0);
    BOOST_CHECK(!victim->isAlive());
    BOOST_CHECK_EQUAL(manager.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestDrawOrderIsStableByLevel) {
    auto a = spawnAt(0.0f, 0.0f);
    auto b = spawnAt(0.0f, 0.0f);
    auto c = spawnAt(0.0f, 0.0f);
    auto d = spawnAt(0.0f, 0.0f);
    a->setDrawLevel(2);
    b->setDrawLevel(0);
    c->setDrawLevel(1);
    d->setDrawLevel(0);

    const std::vector<EntityPtr> expected{b, d, c, a};
    const std::vector<EntityPtr> order = manager.getDrawOrder();
    BOOST_CHECK(order == expected);

    // No renderer: nothing to draw into
    BOOST_CHECK_NO_THROW(manager.render(nullptr, origin));
}

BOOST_AUTO_TEST_CASE(TestBulkMotion) {
    auto a = spawnAt(0.0f, 0.0f);
    auto b = spawnAt(100.0f, 100.0f);

    manager.moveAll(Vector2D(10.0f, -5.0f));
    BOOST_CHECK_EQUAL(a->getPosition(), Vector2D(10.0f, -5.0f));
    BOOST_CHECK_EQUAL(b->getPosition(), Vector2D(110.0f, 95.0f));

    manager.accelerateAll(Vector2D(0.0f, 20.0f), 0.5f);
    BOOST_CHECK_EQUAL(a->getVelocity(), Vector2D(1.0f, 10.0f));
    BOOST_CHECK_EQUAL(b->getVelocity(), Vector2D(1.0f, 10.0f));
}

BOOST_AUTO_TEST_CASE(TestEntityDataSkipsDyingAndUnsaved) {
    TileCatalog catalog = makeCatalog();
    ChunkManager chunks(catalog, RawChunkMap{}, config);
    SimulationContext physical = context;
    physical.chunks = &chunks;

    spawnAt(0.0f, 0.0f);
    manager.spawn<PhysicsProp>(physical, Vector2D(10.0f, 20.0f), Vector2D(30.0f, 30.0f));
    auto dying = manager.spawn<PhysicsProp>(physical, Vector2D(50.0f, 20.0f), Vector2D(30.0f, 30.0f), 1.0f);
    dying->kill();
    BOOST_REQUIRE(dying->isDying());

    const std::vector<EntityData> data = manager.getEntityData();
    BOOST_REQUIRE_EQUAL(data.size(), 1u);
    BOOST_CHECK_EQUAL(data[0].className, "PhysicsProp");
    BOOST_CHECK(data[0].initArgs[0] == EntityValue(10.0f));

    manager.clear();
}

BOOST_AUTO_TEST_CASE(TestClearMarksEntitiesDead) {
    auto a = spawnAt(0.0f, 0.0f);
    auto b = spawnAt(0.0f, 0.0f);
    manager.clear();
    BOOST_CHECK(manager.empty());
    BOOST_CHECK(!a->isAlive());
    BOOST_CHECK(!b->isAlive());
}

BOOST_AUTO_TEST_SUITE_END()
