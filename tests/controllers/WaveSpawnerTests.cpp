/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WaveSpawnerTests
#include <boost/test/unit_test.hpp>

#include "controllers/WaveSpawner.hpp"
#include "managers/EntityPool.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using namespace PopEngine;

namespace {
EnemySpawnDefinition makeDefinition(EnemyType type, int sizeLevel, int count, float interval) {
    EnemySpawnDefinition def;
    def.type = type;
    def.sizeLevel = sizeLevel;
    def.count = count;
    def.spawnIntervalSeconds = interval;
    return def;
}

Wave makeWave(const char* id, float start, float duration, SpawnPattern pattern) {
    Wave wave;
    wave.id = id;
    wave.startOffsetSeconds = start;
    wave.durationSeconds = duration;
    wave.spawnPattern = pattern;
    return wave;
}

size_t countEvents(const EventList& events, EventKind kind) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                             [kind](const SimulationEvent& e) { return e.kind == kind; }));
}
} // namespace

struct SpawnerFixture {
    SpawnerFixture() : config(resolve(BasePhysicsConfig{}, LevelOverrides{})), rng(1234) {}

    // Advance the level clock by dt and run the spawner
    void step(float dt) {
        elapsed += dt;
        spawner.update(dt, elapsed, area, pools, enemies, events, rng);
    }

    void run(float seconds, float dt) {
        const int ticks = static_cast<int>(std::lround(seconds / dt));
        for (int i = 0; i < ticks; ++i) {
            step(dt);
        }
    }

    EffectiveConfig config;
    PlayArea area{400.0f, 600.0f};
    EntityPools pools;
    std::vector<Enemy*> enemies;
    EventList events;
    std::mt19937 rng;
    WaveSpawner spawner;
    float elapsed{0.0f};
};

BOOST_FIXTURE_TEST_SUITE(WaveTimelineTests, SpawnerFixture)

// Test Pending -> Active -> Finished on the level clock
BOOST_AUTO_TEST_CASE(TestWaveStateMachine)
{
    Wave wave = makeWave("w1", 1.0f, 2.0f, SpawnPattern::Random);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 1, 10.0f));
    spawner.configure({wave}, config);

    step(0.5f);
    BOOST_CHECK(spawner.getWaveState(0) == WaveState::Pending);

    step(0.5f);
    BOOST_CHECK(spawner.getWaveState(0) == WaveState::Active);
    BOOST_CHECK_EQUAL(countEvents(events, EventKind::WaveStarted), 1u);

    step(1.5f);
    BOOST_CHECK(spawner.getWaveState(0) == WaveState::Active);

    step(0.6f);
    BOOST_CHECK(spawner.getWaveState(0) == WaveState::Finished);
    BOOST_CHECK_EQUAL(countEvents(events, EventKind::WaveFinished), 1u);
    BOOST_CHECK(spawner.allWavesFinished());

    // Finished never goes back
    step(0.1f);
    BOOST_CHECK(spawner.getWaveState(0) == WaveState::Finished);
    BOOST_CHECK_EQUAL(countEvents(events, EventKind::WaveFinished), 1u);
}

// Test that a clock jump past the whole window finishes the wave without spawning
BOOST_AUTO_TEST_CASE(TestSkippedWindowFinishesImmediately)
{
    Wave wave = makeWave("late", 0.5f, 0.5f, SpawnPattern::Random);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 5, 0.0f));
    spawner.configure({wave}, config);

    step(2.0f);

    BOOST_CHECK(spawner.getWaveState(0) == WaveState::Finished);
    BOOST_CHECK_EQUAL(countEvents(events, EventKind::WaveStarted), 0u);
    BOOST_CHECK(enemies.empty());
}

BOOST_AUTO_TEST_CASE(TestNoWavesIsFinished)
{
    spawner.configure({}, config);
    BOOST_CHECK(spawner.allWavesFinished());
    BOOST_CHECK_EQUAL(spawner.getWaveCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SpawnCountTests, SpawnerFixture)

// Test that a wave long enough for its definitions spawns exactly count of each
BOOST_AUTO_TEST_CASE(TestWaveSpawnsExactCount)
{
    Wave wave = makeWave("w", 0.0f, 10.0f, SpawnPattern::TwoPoint);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 3, 0.5f));
    wave.enemies.push_back(makeDefinition(EnemyType::Fast, 2, 2, 1.0f));
    spawner.configure({wave}, config);

    run(11.0f, 1.0f / 60.0f);

    BOOST_CHECK(spawner.getWaveState(0) == WaveState::Finished);
    BOOST_CHECK_EQUAL(spawner.getWaveSpawnTotal(0), 5);
    BOOST_CHECK_EQUAL(spawner.getTotalSpawned(), 5);
    BOOST_CHECK_EQUAL(enemies.size(), 5u);
    BOOST_CHECK_EQUAL(countEvents(events, EventKind::EnemySpawned), 5u);
    BOOST_CHECK_EQUAL(std::count_if(enemies.begin(), enemies.end(),
                                    [](const Enemy* e) { return e->type == EnemyType::Fast; }),
                      2);
}

// Test that each definition runs on its own timer
BOOST_AUTO_TEST_CASE(TestDefinitionTimersAreIndependent)
{
    Wave wave = makeWave("w", 0.0f, 30.0f, SpawnPattern::Random);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 100, 1.0f));
    wave.enemies.push_back(makeDefinition(EnemyType::Fast, 3, 100, 0.25f));
    spawner.configure({wave}, config);

    run(2.05f, 0.05f);

    const int slow = spawner.getSpawnedCount(0, 0);
    const int quick = spawner.getSpawnedCount(0, 1);
    BOOST_CHECK(slow >= 1 && slow <= 2);
    BOOST_CHECK(quick >= 6 && quick <= 8);
}

// Test that at most one enemy per definition appears in a single tick
BOOST_AUTO_TEST_CASE(TestOneSpawnPerDefinitionPerTick)
{
    Wave wave = makeWave("w", 0.0f, 10.0f, SpawnPattern::Random);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 10, 0.1f));
    spawner.configure({wave}, config);

    step(1.0f / 30.0f);
    step(0.5f);

    BOOST_CHECK(spawner.getSpawnedCount(0, 0) <= 2);
}

BOOST_AUTO_TEST_CASE(TestZeroSpawnRateDisablesSpawning)
{
    LevelOverrides overrides;
    overrides.spawnRateMultiplier = 0.0f;
    config = resolve(BasePhysicsConfig{}, overrides);

    Wave wave = makeWave("w", 0.0f, 5.0f, SpawnPattern::Random);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 3, 0.0f));
    spawner.configure({wave}, config);

    run(3.0f, 0.1f);
    BOOST_CHECK(enemies.empty());
}

// Test that doubling the spawn rate halves the effective interval
BOOST_AUTO_TEST_CASE(TestSpawnRateShortensInterval)
{
    LevelOverrides overrides;
    overrides.spawnRateMultiplier = 2.0f;
    config = resolve(BasePhysicsConfig{}, overrides);

    Wave wave = makeWave("w", 0.0f, 30.0f, SpawnPattern::Random);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 100, 1.0f));
    spawner.configure({wave}, config);

    run(2.05f, 0.05f);
    const int spawned = spawner.getSpawnedCount(0, 0);
    BOOST_CHECK(spawned >= 3 && spawned <= 4);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SpawnPlacementTests, SpawnerFixture)

// Test that fixed patterns cycle through their column fractions
BOOST_AUTO_TEST_CASE(TestPatternColumns)
{
    Wave wave = makeWave("cols", 0.0f, 10.0f, SpawnPattern::EvenColumns);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 3, 0.0f));
    spawner.configure({wave}, config);

    step(0.01f);
    step(0.01f);
    step(0.01f);

    BOOST_REQUIRE_EQUAL(enemies.size(), 3u);
    const float expectedCentres[] = {100.0f, 200.0f, 300.0f};
    for (size_t i = 0; i < 3; ++i) {
        const Enemy& e = *enemies[i];
        BOOST_CHECK_CLOSE(e.x + e.width * 0.5f, expectedCentres[i], 0.01f);
        BOOST_CHECK_CLOSE(e.y, area.height * config.spawnHeights[i], 0.01f);
    }

    // Left third heads right, right third heads left
    BOOST_CHECK(enemies[0]->velocityX > 0.0f);
    BOOST_CHECK(enemies[2]->velocityX < 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSpawnedEnemyFields)
{
    Wave wave = makeWave("w", 0.0f, 10.0f, SpawnPattern::Random);
    EnemySpawnDefinition def = makeDefinition(EnemyType::Strong, 2, 1, 0.0f);
    def.movementType = MovementType::PhysicsHeavy;
    def.splitBehavior.splitInto = 4;
    wave.enemies.push_back(def);
    spawner.configure({wave}, config);

    step(0.01f);

    BOOST_REQUIRE_EQUAL(enemies.size(), 1u);
    const Enemy& e = *enemies[0];
    BOOST_CHECK_EQUAL(e.type, EnemyType::Strong);
    BOOST_CHECK_EQUAL(e.sizeLevel, 2);
    BOOST_CHECK_EQUAL(e.split.splitInto, 4);
    BOOST_CHECK_CLOSE(e.width, 58.0f * 0.85f, 0.01f);
    BOOST_CHECK_EQUAL(e.width, e.height);
    BOOST_CHECK(std::abs(e.velocityX) >= config.minHorizontalVelocity);
    // Heavy launch: (40 + [0, 5]) * 1.3
    BOOST_CHECK(e.velocityY >= 52.0f && e.velocityY <= 58.5f);

    // Random pattern stays within 15% of the centre line
    const float centre = e.x + e.width * 0.5f;
    BOOST_CHECK(std::abs(centre - area.width * 0.5f) <= area.width * 0.15f + 0.01f);
}

// Test that a slower level spawns slower enemies from the same random draws
BOOST_AUTO_TEST_CASE(TestEnemySpeedMultiplierSlowsSpawns)
{
    LevelOverrides slow;
    slow.enemySpeedMultiplier = 0.5f;
    const EffectiveConfig slowConfig = resolve(BasePhysicsConfig{}, slow);

    Wave wave = makeWave("w", 0.0f, 10.0f, SpawnPattern::TwoPoint);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 1, 0.0f));

    auto firstSpawnSpeed = [&](const EffectiveConfig& cfg) {
        EntityPools localPools;
        std::vector<Enemy*> spawned;
        EventList localEvents;
        std::mt19937 localRng(99);
        WaveSpawner localSpawner;
        localSpawner.configure({wave}, cfg);
        localSpawner.update(0.01f, 0.01f, area, localPools, spawned, localEvents, localRng);
        BOOST_REQUIRE_EQUAL(spawned.size(), 1u);
        return std::abs(spawned[0]->velocityX);
    };

    const float normalSpeed = firstSpawnSpeed(config);
    const float slowSpeed = firstSpawnSpeed(slowConfig);

    BOOST_CHECK(normalSpeed >= config.minHorizontalVelocity);
    BOOST_CHECK(slowSpeed >= slowConfig.minHorizontalVelocity);
    BOOST_CHECK(slowSpeed < normalSpeed);
}

BOOST_AUTO_TEST_CASE(TestSmallEnemiesSpawnFaster)
{
    auto firstSpawnSpeed = [&](int sizeLevel) {
        Wave wave = makeWave("w", 0.0f, 10.0f, SpawnPattern::TwoPoint);
        wave.enemies.push_back(makeDefinition(EnemyType::Basic, sizeLevel, 1, 0.0f));

        EntityPools localPools;
        std::vector<Enemy*> spawned;
        EventList localEvents;
        std::mt19937 localRng(7);
        WaveSpawner localSpawner;
        localSpawner.configure({wave}, config);
        localSpawner.update(0.01f, 0.01f, area, localPools, spawned, localEvents, localRng);
        BOOST_REQUIRE_EQUAL(spawned.size(), 1u);
        return std::abs(spawned[0]->velocityX);
    };

    // (120 +/- 30) * 80 / 64 for small against (120 +/- 30) * 50 / 64 for large
    const float smallSpeed = firstSpawnSpeed(1);
    const float largeSpeed = firstSpawnSpeed(3);
    BOOST_CHECK(smallSpeed > largeSpeed);
    BOOST_CHECK(smallSpeed >= 112.0f);
}

// Test that enemies always spawn fully inside the play area
BOOST_AUTO_TEST_CASE(TestSpawnClampedInsideArea)
{
    area.width = 120.0f;
    Wave wave = makeWave("edges", 0.0f, 10.0f, SpawnPattern::FivePointSpread);
    wave.enemies.push_back(makeDefinition(EnemyType::Basic, 3, 5, 0.0f));
    spawner.configure({wave}, config);

    for (int i = 0; i < 5; ++i) {
        step(0.01f);
    }

    BOOST_REQUIRE_EQUAL(enemies.size(), 5u);
    for (const Enemy* e : enemies) {
        BOOST_CHECK(e->x >= 0.0f);
        BOOST_CHECK(e->x + e->width <= area.width + 0.01f);
    }
}

BOOST_AUTO_TEST_SUITE_END()
