/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityPoolTests
#include <boost/test/unit_test.hpp>

#include "managers/EntityPool.hpp"

#include <set>
#include <string>
#include <vector>

using namespace PopEngine;

struct PoolFixture {
    EntityPools pools;
};

BOOST_FIXTURE_TEST_SUITE(EntityPoolTests, PoolFixture)

// Test that a released record is handed out again instead of allocating
BOOST_AUTO_TEST_CASE(TestReleasedRecordIsReused)
{
    Enemy& first = pools.acquireEnemy();
    first.sizeLevel = 1;
    first.velocityX = 123.0f;
    const Enemy* address = &first;

    BOOST_CHECK(pools.release(first));

    Enemy& second = pools.acquireEnemy();
    BOOST_CHECK_EQUAL(&second, address);
    BOOST_CHECK_EQUAL(pools.getEnemyStats().total, 1u);

    // Reused records come back with default fields
    BOOST_CHECK_EQUAL(second.sizeLevel, 3);
    BOOST_CHECK_EQUAL(second.velocityX, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestIdsAreUnique)
{
    std::set<std::string> ids;
    std::vector<Projectile*> live;
    for (int i = 0; i < 20; ++i) {
        Projectile& p = pools.acquireProjectile();
        ids.insert(p.id);
        live.push_back(&p);
    }
    for (auto* p : live) {
        pools.release(*p);
    }
    for (int i = 0; i < 20; ++i) {
        ids.insert(pools.acquireProjectile().id);
    }

    BOOST_CHECK_EQUAL(ids.size(), 40u);
    BOOST_CHECK(ids.count("projectile_1") == 1);
}

// Test that releasing twice is a harmless no-op
BOOST_AUTO_TEST_CASE(TestDoubleReleaseIsIgnored)
{
    Enemy& enemy = pools.acquireEnemy();

    BOOST_CHECK(pools.release(enemy));
    BOOST_CHECK(!pools.release(enemy));

    PoolStats stats = pools.getEnemyStats();
    BOOST_CHECK_EQUAL(stats.inUse, 0u);
    BOOST_CHECK_EQUAL(stats.available, 1u);
}

BOOST_AUTO_TEST_CASE(TestForeignRecordIsIgnored)
{
    Enemy stranger;
    stranger.id = "enemy_999";

    BOOST_CHECK(!pools.release(stranger));
    BOOST_CHECK_EQUAL(pools.getEnemyStats().available, 0u);
}

// Test that inUse + available always equals total
BOOST_AUTO_TEST_CASE(TestCountsAreConserved)
{
    std::vector<Enemy*> live;
    for (int round = 0; round < 5; ++round) {
        for (int i = 0; i < 7; ++i) {
            live.push_back(&pools.acquireEnemy());
        }
        for (int i = 0; i < 4 && !live.empty(); ++i) {
            pools.release(*live.back());
            live.pop_back();
        }

        PoolStats stats = pools.getEnemyStats();
        BOOST_CHECK_EQUAL(stats.inUse + stats.available, stats.total);
        BOOST_CHECK_EQUAL(stats.inUse, live.size());
        BOOST_CHECK(stats.total <= stats.peakInUse);
    }
}

BOOST_AUTO_TEST_CASE(TestReleaseAll)
{
    for (int i = 0; i < 5; ++i) {
        pools.acquireEnemy();
        pools.acquireProjectile();
    }

    pools.releaseAll();

    BOOST_CHECK_EQUAL(pools.getEnemyStats().inUse, 0u);
    BOOST_CHECK_EQUAL(pools.getEnemyStats().available, 5u);
    BOOST_CHECK_EQUAL(pools.getProjectileStats().inUse, 0u);
    BOOST_CHECK_EQUAL(pools.getProjectileStats().peakInUse, 5u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ObjectPoolTests)

BOOST_AUTO_TEST_CASE(TestPrefixAndInUseTracking)
{
    ObjectPool<MysteryTarget> pool("target");
    MysteryTarget& t = pool.acquire();

    BOOST_CHECK_EQUAL(t.id, "target_1");
    BOOST_CHECK(pool.isInUse(t));

    pool.release(t);
    BOOST_CHECK(!pool.isInUse(t));
}

BOOST_AUTO_TEST_SUITE_END()
