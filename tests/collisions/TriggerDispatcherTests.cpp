/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TriggerDispatcherTests
#include <boost/test/unit_test.hpp>

#include "collisions/Collider.hpp"
#include "collisions/PhysicsWorld.hpp"
#include "collisions/TriggerDispatcher.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"
#include "../mocks/MockTriggerListener.hpp"
#include <memory>

using namespace Traverse;

struct TriggerFixture {
    PhysicsWorld world;
    MockTriggerListener playerListener;
    MockTriggerListener zoneListener;

    Entity player{"Player"};
    Entity zone{"Zone"};
    BoxCollider* playerBox{nullptr};
    BoxCollider* zoneBox{nullptr};
    std::unique_ptr<TriggerDispatcher> dispatcher;

    TriggerFixture() {
        player.setPosition(Vector2D(0.0f, 0.0f));
        playerBox = &player.addCollider<BoxCollider>(10.0f, 10.0f);
        player.registerColliders(world);
        player.addTriggerListener(playerListener);

        zone.setPosition(Vector2D(100.0f, 0.0f));
        zoneBox = &zone.addCollider<BoxCollider>(20.0f, 20.0f);
        zoneBox->setTrigger(true);
        zone.registerColliders(world);
        zone.addTriggerListener(zoneListener);

        dispatcher = std::make_unique<TriggerDispatcher>(player, world);
    }

    ~TriggerFixture() {
        dispatcher.reset();
    }
};

BOOST_FIXTURE_TEST_SUITE(TriggerDispatcherTestSuite, TriggerFixture)

BOOST_AUTO_TEST_CASE(TestNoOverlapNoEvents)
{
    dispatcher->update();
    BOOST_CHECK(playerListener.events.empty());
    BOOST_CHECK(zoneListener.events.empty());
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestEnterStayExitSequence)
{
    player.setPosition(Vector2D(95.0f, 0.0f));
    dispatcher->update();

    BOOST_REQUIRE_EQUAL(playerListener.events.size(), 1u);
    BOOST_CHECK_EQUAL(playerListener.events[0].phase, TriggerPhase::Enter);
    BOOST_CHECK_EQUAL(playerListener.events[0].other, zoneBox);
    BOOST_CHECK_EQUAL(playerListener.events[0].local, playerBox);

    // The other side hears about it with the roles swapped
    BOOST_REQUIRE_EQUAL(zoneListener.events.size(), 1u);
    BOOST_CHECK_EQUAL(zoneListener.events[0].phase, TriggerPhase::Enter);
    BOOST_CHECK_EQUAL(zoneListener.events[0].other, playerBox);
    BOOST_CHECK_EQUAL(zoneListener.events[0].local, zoneBox);

    BOOST_CHECK(dispatcher->isPairActive(playerBox, zoneBox));
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 1u);

    dispatcher->update();
    BOOST_REQUIRE_EQUAL(playerListener.events.size(), 2u);
    BOOST_CHECK_EQUAL(playerListener.events[1].phase, TriggerPhase::Stay);
    BOOST_CHECK_EQUAL(zoneListener.count(TriggerPhase::Stay), 1u);

    player.setPosition(Vector2D(0.0f, 0.0f));
    dispatcher->update();
    BOOST_REQUIRE_EQUAL(playerListener.events.size(), 3u);
    BOOST_CHECK_EQUAL(playerListener.events[2].phase, TriggerPhase::Exit);
    BOOST_CHECK_EQUAL(playerListener.events[2].other, zoneBox);
    BOOST_CHECK_EQUAL(zoneListener.count(TriggerPhase::Exit), 1u);
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 0u);

    // Nothing further once apart
    dispatcher->update();
    BOOST_CHECK_EQUAL(playerListener.events.size(), 3u);
}

BOOST_AUTO_TEST_CASE(TestSolidPairsAreIgnored)
{
    Entity wall("Wall");
    wall.setPosition(Vector2D(6.0f, 0.0f));
    wall.addCollider<BoxCollider>(10.0f, 10.0f);
    wall.registerColliders(world);

    dispatcher->update();
    BOOST_CHECK(playerListener.events.empty());
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestLocalTriggerAgainstSolidNeighbor)
{
    auto& sensor = player.addCollider<CircleCollider>(8.0f);
    sensor.setTrigger(true);
    world.addCollider(sensor);

    Entity crate("Crate");
    crate.setPosition(Vector2D(0.0f, 12.0f));
    auto& crateBox = crate.addCollider<BoxCollider>(10.0f, 10.0f);
    crate.registerColliders(world);

    dispatcher->update();

    // The solid player box does not reach the crate; the sensor does
    BOOST_REQUIRE_EQUAL(playerListener.events.size(), 1u);
    BOOST_CHECK_EQUAL(playerListener.events[0].phase, TriggerPhase::Enter);
    BOOST_CHECK_EQUAL(playerListener.events[0].other, &crateBox);
    BOOST_CHECK_EQUAL(playerListener.events[0].local, &sensor);
}

BOOST_AUTO_TEST_CASE(TestExitsFireAfterEntersInPreviousOrder)
{
    Entity zoneA("ZoneA");
    zoneA.setPosition(Vector2D(0.0f, 50.0f));
    auto& boxA = zoneA.addCollider<BoxCollider>(20.0f, 20.0f);
    boxA.setTrigger(true);
    zoneA.registerColliders(world);

    Entity zoneB("ZoneB");
    zoneB.setPosition(Vector2D(15.0f, 50.0f));
    auto& boxB = zoneB.addCollider<BoxCollider>(20.0f, 20.0f);
    boxB.setTrigger(true);
    zoneB.registerColliders(world);

    player.setPosition(Vector2D(7.0f, 50.0f));
    dispatcher->update();
    BOOST_REQUIRE_EQUAL(playerListener.events.size(), 2u);
    BOOST_CHECK_EQUAL(playerListener.events[0].other, &boxA);
    BOOST_CHECK_EQUAL(playerListener.events[1].other, &boxB);

    playerListener.clear();
    player.setPosition(Vector2D(100.0f, 0.0f));
    dispatcher->update();

    BOOST_REQUIRE_EQUAL(playerListener.events.size(), 3u);
    BOOST_CHECK_EQUAL(playerListener.events[0].phase, TriggerPhase::Enter);
    BOOST_CHECK_EQUAL(playerListener.events[0].other, zoneBox);
    BOOST_CHECK_EQUAL(playerListener.events[1].phase, TriggerPhase::Exit);
    BOOST_CHECK_EQUAL(playerListener.events[1].other, &boxA);
    BOOST_CHECK_EQUAL(playerListener.events[2].phase, TriggerPhase::Exit);
    BOOST_CHECK_EQUAL(playerListener.events[2].other, &boxB);
}

BOOST_AUTO_TEST_CASE(TestDestroyedNeighborDropsPairSilently)
{
    auto doomed = std::make_unique<Entity>("Doomed");
    doomed->setPosition(Vector2D(0.0f, 0.0f));
    doomed->addCollider<BoxCollider>(6.0f, 6.0f).setTrigger(true);
    doomed->registerColliders(world);

    dispatcher->update();
    BOOST_REQUIRE_EQUAL(playerListener.count(TriggerPhase::Enter), 1u);

    doomed.reset();
    dispatcher->update();
    BOOST_CHECK_EQUAL(playerListener.count(TriggerPhase::Exit), 0u);
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestRemovedListenerIsNotNotified)
{
    BOOST_CHECK(player.removeTriggerListener(playerListener));
    BOOST_CHECK(!player.removeTriggerListener(playerListener));

    player.setPosition(Vector2D(95.0f, 0.0f));
    dispatcher->update();
    BOOST_CHECK(playerListener.events.empty());
    BOOST_CHECK_EQUAL(zoneListener.count(TriggerPhase::Enter), 1u);
}

BOOST_AUTO_TEST_CASE(TestUnplacedEntityHasNoPairs)
{
    player.setPosition(Vector2D::NaN());
    dispatcher->update();
    BOOST_CHECK(playerListener.events.empty());
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestResetForgetsPairsWithoutExit)
{
    player.setPosition(Vector2D(95.0f, 0.0f));
    dispatcher->update();
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 1u);

    dispatcher->reset();
    BOOST_CHECK_EQUAL(dispatcher->getActivePairCount(), 0u);
    BOOST_CHECK_EQUAL(playerListener.count(TriggerPhase::Exit), 0u);

    // Still overlapping, so the next update reports a fresh enter
    dispatcher->update();
    BOOST_CHECK_EQUAL(playerListener.count(TriggerPhase::Enter), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
