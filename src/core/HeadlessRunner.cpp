/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/HeadlessRunner.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace PopEngine {

namespace {
float centerOf(const Entity& e) {
    return e.x + e.width * 0.5f;
}

const Enemy* closestWithin(const std::vector<Enemy>& enemies, float x, float threshold) {
    const Enemy* best = nullptr;
    float bestDistance = threshold;
    for (const auto& enemy : enemies) {
        const float distance = std::abs(centerOf(enemy) - x);
        if (distance <= bestDistance) {
            best = &enemy;
            bestDistance = distance;
        }
    }
    return best;
}
} // namespace

const char* sessionOutcomeName(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::NotStarted: return "not started";
        case SessionOutcome::Cleared:    return "cleared";
        case SessionOutcome::AvatarHit:  return "avatar hit";
        case SessionOutcome::TimedOut:   return "timed out";
    }
    return "unknown";
}

AutopilotAction decideAutopilot(const Avatar& avatar, const std::vector<Enemy>& enemies,
                                const std::vector<Projectile>& projectiles, const PlayArea& area,
                                const AutopilotConfig& config) {
    const float self = centerOf(avatar);
    const float minX = config.edgeMargin;
    const float maxX = std::max(minX, area.width - avatar.width - config.edgeMargin);

    if (const Enemy* target = closestWithin(enemies, self, config.shootThreshold)) {
        const float lane = centerOf(*target);
        const bool laneBusy = std::any_of(projectiles.begin(), projectiles.end(),
                                          [&](const Projectile& p) {
                                              return std::abs(centerOf(p) - lane) <= config.laneWidth;
                                          });
        if (!laneBusy) {
            return AutopilotAction{AutopilotAction::Kind::Shoot, avatar.x};
        }
    }

    if (const Enemy* threat = closestWithin(enemies, self, config.avoidThreshold)) {
        const float step = centerOf(*threat) > self ? -config.dodgeStep : config.dodgeStep;
        return AutopilotAction{AutopilotAction::Kind::Move,
                               std::clamp(avatar.x + step, minX, maxX)};
    }

    const float middle = area.width * 0.5f;
    const float zoneHalf = area.width * config.centerBias * 0.5f;
    if (self < middle - zoneHalf) {
        const float x = std::min(middle - avatar.width * 0.5f, avatar.x + config.centerStep);
        return AutopilotAction{AutopilotAction::Kind::Move, std::clamp(x, minX, maxX)};
    }
    if (self > middle + zoneHalf) {
        const float x = std::max(middle - avatar.width * 0.5f, avatar.x - config.centerStep);
        return AutopilotAction{AutopilotAction::Kind::Move, std::clamp(x, minX, maxX)};
    }
    return AutopilotAction{};
}

HeadlessRunner::HeadlessRunner(SimulationDriver& driver, AutopilotConfig config)
    : m_driver(driver), m_config(config) {}

HeadlessReport HeadlessRunner::run(float maxSeconds, float tickSeconds) {
    HeadlessReport report;
    if (!(tickSeconds > 0.0f) || !std::isfinite(tickSeconds)) {
        tickSeconds = 1.0f / 60.0f;
    }
    const double tickCount =
        std::ceil(static_cast<double>(maxSeconds) / static_cast<double>(tickSeconds));
    if (!std::isfinite(maxSeconds) || maxSeconds < 0.0f ||
        tickCount >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        HEADLESS_ERROR(std::format("Invalid session length {} seconds", maxSeconds));
        return report;
    }
    if (!m_driver.start()) {
        HEADLESS_ERROR("Cannot start session: driver not idle or no level loaded");
        return report;
    }

    report.outcome = SessionOutcome::TimedOut;
    const auto maxTicks = static_cast<uint64_t>(tickCount);

    for (uint64_t i = 0; i < maxTicks; ++i) {
        AutopilotAction action =
            decideAutopilot(m_driver.getAvatar(), m_driver.getEnemies(), m_driver.getProjectiles(),
                            m_driver.getPlayArea(), m_config);
        switch (action.kind) {
            case AutopilotAction::Kind::Shoot:
                m_driver.fireProjectile();
                break;
            case AutopilotAction::Kind::Move:
                m_driver.setAvatarX(action.x);
                break;
            case AutopilotAction::Kind::Idle:
                break;
        }

        TickResult result = m_driver.tick(tickSeconds);
        if (result.avatarHit) {
            report.outcome = SessionOutcome::AvatarHit;
            break;
        }
        if (result.levelCleared) {
            report.outcome = SessionOutcome::Cleared;
            break;
        }
    }

    report.score = m_driver.getScore();
    report.elapsedSeconds = m_driver.getLevelElapsed();
    report.stats = m_driver.getStats();

    HEADLESS_INFO(std::format("Level '{}': {} after {:.1f}s, score {}, accuracy {:.0f}% ({} shots)",
                              m_driver.getLevelId(), sessionOutcomeName(report.outcome),
                              report.elapsedSeconds, report.score,
                              report.stats.accuracy() * 100.0f, report.stats.shotsFired));
    return report;
}

} // namespace PopEngine
