/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE HeadlessRunnerTests
#include <boost/test/unit_test.hpp>

#include "core/HeadlessRunner.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace PopEngine;

namespace {
Avatar makeAvatar(float x) {
    Avatar a;
    a.x = x;
    a.y = 540.0f;
    a.width = 40.0f;
    a.height = 40.0f;
    return a;
}

Enemy makeEnemy(float centreX, float size = 40.0f) {
    Enemy e;
    e.x = centreX - size * 0.5f;
    e.y = 200.0f;
    e.width = size;
    e.height = size;
    return e;
}

Projectile makeProjectile(float centreX) {
    Projectile p;
    p.x = centreX - 5.0f;
    p.y = 300.0f;
    p.width = 10.0f;
    p.height = 10.0f;
    return p;
}
} // namespace

struct AutopilotFixture {
    PlayArea area{400.0f, 600.0f};
    AutopilotConfig config;
};

BOOST_FIXTURE_TEST_SUITE(AutopilotTests, AutopilotFixture)

BOOST_AUTO_TEST_CASE(TestShootsEnemyOverhead)
{
    Avatar avatar = makeAvatar(180.0f);
    std::vector<Enemy> enemies{makeEnemy(230.0f)};

    AutopilotAction action = decideAutopilot(avatar, enemies, {}, area, config);
    BOOST_CHECK(action.kind == AutopilotAction::Kind::Shoot);
}

// Test that it holds fire while a shot is already rising in the lane
BOOST_AUTO_TEST_CASE(TestHoldsFireWhenLaneBusy)
{
    Avatar avatar = makeAvatar(180.0f);
    std::vector<Enemy> enemies{makeEnemy(230.0f)};
    std::vector<Projectile> projectiles{makeProjectile(235.0f)};

    AutopilotAction action = decideAutopilot(avatar, enemies, projectiles, area, config);

    BOOST_CHECK(action.kind == AutopilotAction::Kind::Move);
    // Enemy is to the right, so it dodges left
    BOOST_CHECK(action.x < avatar.x);
}

BOOST_AUTO_TEST_CASE(TestDriftsTowardCentre)
{
    Avatar left = makeAvatar(30.0f);
    AutopilotAction action = decideAutopilot(left, {}, {}, area, config);
    BOOST_CHECK(action.kind == AutopilotAction::Kind::Move);
    BOOST_CHECK_CLOSE(action.x, 45.0f, 0.01f);

    Avatar centred = makeAvatar(180.0f);
    action = decideAutopilot(centred, {}, {}, area, config);
    BOOST_CHECK(action.kind == AutopilotAction::Kind::Idle);
}

// Test that moves stay inside the edge margins
BOOST_AUTO_TEST_CASE(TestMovesRespectEdges)
{
    Avatar avatar = makeAvatar(30.0f);
    std::vector<Enemy> enemies{makeEnemy(100.0f)};
    std::vector<Projectile> projectiles{makeProjectile(100.0f)};

    AutopilotAction action = decideAutopilot(avatar, enemies, projectiles, area, config);

    BOOST_CHECK(action.kind == AutopilotAction::Kind::Move);
    BOOST_CHECK(action.x >= config.edgeMargin);
    BOOST_CHECK(action.x <= area.width - avatar.width - config.edgeMargin);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(HeadlessRunTests)

BOOST_AUTO_TEST_CASE(TestEmptyLevelClears)
{
    SimulationDriver driver(PlayArea{400.0f, 600.0f});
    LevelDescriptor level;
    level.id = "empty";
    BOOST_REQUIRE(driver.loadLevel(level));

    HeadlessRunner runner(driver);
    HeadlessReport report = runner.run(5.0f);

    BOOST_CHECK(report.outcome == SessionOutcome::Cleared);
    BOOST_CHECK_EQUAL(report.score, 0);
    BOOST_CHECK_EQUAL(report.stats.ticks, 1u);
}

BOOST_AUTO_TEST_CASE(TestNotStartedWithoutLevel)
{
    SimulationDriver driver(PlayArea{400.0f, 600.0f});
    HeadlessRunner runner(driver);

    HeadlessReport report = runner.run(1.0f);
    BOOST_CHECK(report.outcome == SessionOutcome::NotStarted);
    BOOST_CHECK_EQUAL(std::string(sessionOutcomeName(report.outcome)), "not started");
}

// Test that a non-finite session length is refused without starting the driver
BOOST_AUTO_TEST_CASE(TestRejectsNonFiniteLength)
{
    SimulationDriver driver(PlayArea{400.0f, 600.0f});
    LevelDescriptor level;
    level.id = "empty";
    BOOST_REQUIRE(driver.loadLevel(level));

    HeadlessRunner runner(driver);
    HeadlessReport report = runner.run(std::numeric_limits<float>::quiet_NaN());
    BOOST_CHECK(report.outcome == SessionOutcome::NotStarted);

    report = runner.run(std::numeric_limits<float>::infinity());
    BOOST_CHECK(report.outcome == SessionOutcome::NotStarted);
    BOOST_CHECK_EQUAL(driver.getState(), SimulationState::Idle);

    report = runner.run(1.0f);
    BOOST_CHECK(report.outcome == SessionOutcome::Cleared);
}

// Test that a session with a wave still running reports a time out
BOOST_AUTO_TEST_CASE(TestTimesOut)
{
    SimulationDriver driver(PlayArea{400.0f, 600.0f});
    LevelDescriptor level;
    level.id = "long";
    Wave wave;
    wave.id = "quiet";
    wave.startOffsetSeconds = 100.0f;
    wave.durationSeconds = 10.0f;
    level.waves.push_back(wave);
    BOOST_REQUIRE(driver.loadLevel(level));

    HeadlessRunner runner(driver);
    HeadlessReport report = runner.run(1.0f);

    BOOST_CHECK(report.outcome == SessionOutcome::TimedOut);
    BOOST_CHECK_CLOSE(report.elapsedSeconds, 1.0f, 5.0f);
}

BOOST_AUTO_TEST_SUITE_END()
