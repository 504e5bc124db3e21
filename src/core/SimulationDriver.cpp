/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationDriver.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <numbers>

namespace PopEngine {

namespace {
constexpr float MULTI_SHOT_SPREAD_DEGREES = 30.0f;
}

const char* simulationStateName(SimulationState state) {
    switch (state) {
        case SimulationState::Idle:       return "Idle";
        case SimulationState::Running:    return "Running";
        case SimulationState::Terminated: return "Terminated";
    }
    return "Unknown";
}

SimulationDriver::SimulationDriver(PlayArea area, BasePhysicsConfig base, uint32_t seed)
    : m_area(area),
      m_base(std::move(base)),
      m_config(resolve(m_base, LevelOverrides{})),
      m_seed(seed),
      m_rng(seed),
      m_physics(m_config),
      m_collisions(m_config) {
    placeAvatar((m_area.width - m_config.avatarSize) * 0.5f);
}

bool SimulationDriver::loadLevel(const LevelDescriptor& level) {
    if (m_state != SimulationState::Idle) {
        SIMULATION_WARN(std::format("loadLevel('{}') ignored while {}", level.id,
                                    simulationStateName(m_state)));
        return false;
    }

    clearSession();
    m_level = level;
    m_config = m_configCache.get(level.id, m_base, level.overrides);
    m_spawner.configure(m_level->waves, m_config);
    placeAvatar((m_area.width - m_config.avatarSize) * 0.5f);

    SIMULATION_INFO(std::format("Level '{}' loaded: {} waves, gravity {:.1f}, time scale {:.2f}",
                                level.id, level.waves.size(), m_config.gravity,
                                m_config.timeScale));
    return true;
}

bool SimulationDriver::start() {
    if (m_state != SimulationState::Idle || !m_level) {
        SIMULATION_WARN("start() requires an idle driver with a loaded level");
        return false;
    }
    m_state = SimulationState::Running;
    SIMULATION_INFO(std::format("Level '{}' running", m_level->id));
    return true;
}

void SimulationDriver::reset() {
    clearSession();
    if (m_level) {
        m_spawner.configure(m_level->waves, m_config);
    }
    placeAvatar((m_area.width - m_config.avatarSize) * 0.5f);
    m_state = SimulationState::Idle;
    SIMULATION_DEBUG("Session reset");
}

void SimulationDriver::clearSession() {
    releaseLiveRecords();
    m_spawner.reset();
    m_targets.clear();
    m_pendingAvatarX.reset();
    m_pendingShots = 0;
    m_pendingTargets.clear();
    m_pendingWarnings.clear();
    m_levelElapsed = 0.0f;
    m_score = 0;
    m_clearAnnounced = false;
    m_stats = SessionStats{};
    m_rng.seed(m_seed);
}

void SimulationDriver::releaseLiveRecords() {
    m_enemies.clear();
    m_projectiles.clear();
    m_pools.releaseAll();
}

void SimulationDriver::setAvatarX(float x) {
    if (!std::isfinite(x)) {
        SIMULATION_WARN("Dropping non-finite avatar position");
        m_pendingWarnings.emplace_back("Non-finite avatar position dropped");
        return;
    }
    m_pendingAvatarX = x;
}

void SimulationDriver::fireProjectile() {
    ++m_pendingShots;
}

void SimulationDriver::spawnMysteryTarget(float xFraction, float yFraction,
                                          std::string rewardPayload) {
    if (!std::isfinite(xFraction) || !std::isfinite(yFraction)) {
        SIMULATION_WARN("Dropping mystery target with non-finite placement");
        m_pendingWarnings.emplace_back("Mystery target with non-finite placement dropped");
        return;
    }
    m_pendingTargets.push_back(PendingTarget{xFraction, yFraction, std::move(rewardPayload)});
}

void SimulationDriver::setProjectileModifiers(const ProjectileModifiers& modifiers) {
    m_modifiers = modifiers;
    m_modifiers.count = std::max(1, modifiers.count);
    if (!(m_modifiers.speedMultiplier > 0.0f)) m_modifiers.speedMultiplier = 1.0f;
    if (!(m_modifiers.sizeMultiplier > 0.0f)) m_modifiers.sizeMultiplier = 1.0f;
}

void SimulationDriver::placeAvatar(float x) {
    const float size = m_config.avatarSize;
    m_avatar.id = "avatar";
    m_avatar.width = size;
    m_avatar.height = size;
    m_avatar.x = std::clamp(x, 0.0f, std::max(0.0f, m_area.width - size));
    m_avatar.y = m_area.height - size - m_config.avatarBottomMargin;
    m_avatar.velocityX = 0.0f;
    m_avatar.velocityY = 0.0f;
}

TickResult SimulationDriver::tick(float dt) {
    TickResult result;
    if (m_state != SimulationState::Running) {
        return result;
    }

    if (!std::isfinite(dt)) {
        result.events.push_back(SimulationEvent::warning("Non-finite tick delta treated as 0"));
        dt = 0.0f;
    }
    dt = std::clamp(dt, 0.0f, m_config.maxTickDelta) * m_config.timeScale;

    EventList events;
    CollisionOutcome outcome;
    int missed = 0;
    int spawnedBefore = m_spawner.getTotalSpawned();

    bool failed = false;
    std::string failure;
    try {
        applyIntents(events);
        m_levelElapsed += dt;

        m_spawner.update(dt, m_levelElapsed, m_area, m_pools, m_enemies, events, m_rng);
        missed = m_physics.step(dt, m_area, m_enemies, m_projectiles, m_pools, events);
        outcome = m_collisions.resolve(m_enemies, m_projectiles, m_targets, m_avatar, m_pools,
                                       events);
        ageMysteryTargets(dt);
        if (m_tickHook) {
            m_tickHook(events);
        }
    } catch (const std::exception& ex) {
        failed = true;
        failure = ex.what();
    } catch (...) {
        failed = true;
        failure = "Unknown exception";
    }

    if (failed) {
        // Records spawned or fired before the failure stay live, so their events are kept
        SIMULATION_ERROR(std::format("Tick {} failed: {}", m_stats.ticks, failure));
        m_stats.ticks++;
        m_stats.enemiesSpawned += m_spawner.getTotalSpawned() - spawnedBefore;
        result.events.insert(result.events.end(), std::make_move_iterator(events.begin()),
                             std::make_move_iterator(events.end()));
        result.events.push_back(SimulationEvent::warning(std::format("Tick skipped: {}", failure)));
        dispatch(result.events);
        return result;
    }

    m_stats.ticks++;
    m_stats.enemiesSpawned += m_spawner.getTotalSpawned() - spawnedBefore;
    m_stats.shotsMissed += missed;
    m_stats.shotsHit += outcome.projectilesHit;
    m_stats.enemiesEliminated += outcome.enemiesHit - outcome.enemiesSplit;
    m_stats.enemiesSplit += outcome.enemiesSplit;
    m_stats.mysteryRewards += outcome.mysteryPops;

    result.events.insert(result.events.end(), std::make_move_iterator(events.begin()),
                         std::make_move_iterator(events.end()));
    result.scoreDelta = outcome.scoreDelta;
    result.avatarHit = outcome.avatarHit;
    m_score += outcome.scoreDelta;

    if (outcome.avatarHit) {
        m_state = SimulationState::Terminated;
        SIMULATION_INFO(std::format("Session terminated at {:.2f}s with score {}", m_levelElapsed,
                                    m_score));
    } else if (m_enemies.empty() && m_spawner.allWavesFinished()) {
        result.levelCleared = true;
        if (!m_clearAnnounced) {
            m_clearAnnounced = true;
            SimulationEvent cleared;
            cleared.kind = EventKind::LevelCleared;
            cleared.entityId = m_level ? m_level->id : std::string{};
            result.events.push_back(std::move(cleared));
            SIMULATION_INFO(std::format("Level cleared at {:.2f}s, score {}", m_levelElapsed,
                                        m_score));
        }
    }

    dispatch(result.events);
    return result;
}

void SimulationDriver::applyIntents(EventList& events) {
    for (auto& message : m_pendingWarnings) {
        events.push_back(SimulationEvent::warning(std::move(message)));
    }
    m_pendingWarnings.clear();

    if (m_pendingAvatarX) {
        placeAvatar(*m_pendingAvatarX);
        m_pendingAvatarX.reset();
    }

    for (auto& pending : m_pendingTargets) {
        const float size = m_config.enemyBaseSize;
        MysteryTarget target;
        target.id = std::format("mystery_{}", ++m_nextTargetId);
        target.width = size;
        target.height = size;
        target.x = std::clamp(pending.xFraction * m_area.width - size * 0.5f, 0.0f,
                              std::max(0.0f, m_area.width - size));
        target.y = std::clamp(pending.yFraction * m_area.height, 0.0f,
                              std::max(0.0f, m_area.height - size));
        target.rewardPayload = std::move(pending.payload);
        m_targets.push_back(std::move(target));
    }
    m_pendingTargets.clear();

    while (m_pendingShots > 0) {
        --m_pendingShots;
        launchProjectiles(events);
    }
}

void SimulationDriver::launchProjectiles(EventList& events) {
    const int count = m_modifiers.count;
    const float speed = m_config.projectileSpeed * m_modifiers.speedMultiplier;
    const float size = m_config.projectileSize * m_modifiers.sizeMultiplier;

    for (int i = 0; i < count; ++i) {
        float degrees = 0.0f;
        if (count > 1) {
            degrees = -MULTI_SHOT_SPREAD_DEGREES * 0.5f +
                      MULTI_SHOT_SPREAD_DEGREES * static_cast<float>(i) / static_cast<float>(count - 1);
        }
        const float radians = degrees * std::numbers::pi_v<float> / 180.0f;

        Projectile& projectile = m_pools.acquireProjectile();
        projectile.width = size;
        projectile.height = size;
        projectile.x = m_avatar.x + (m_avatar.width - size) * 0.5f;
        projectile.y = m_avatar.y - size;
        projectile.velocityX = std::sin(radians) * speed;
        projectile.velocityY = -std::cos(radians) * speed;
        projectile.piercing = m_modifiers.piercing;
        projectile.explosive = m_modifiers.explosive;
        m_projectiles.push_back(&projectile);
        m_stats.shotsFired++;

        SimulationEvent fired;
        fired.kind = EventKind::ProjectileFired;
        fired.entityId = projectile.id;
        events.push_back(std::move(fired));
    }
}

void SimulationDriver::ageMysteryTargets(float dt) {
    const float lifetime = m_config.mysteryTargetLifetime;
    for (auto& target : m_targets) {
        target.age += dt;
    }
    std::erase_if(m_targets, [lifetime](const MysteryTarget& t) { return t.age >= lifetime; });
}

void SimulationDriver::setTickHook(TickHook hook) {
    m_tickHook = std::move(hook);
}

ListenerToken SimulationDriver::addEventListener(SimulationEventHandler handler) {
    const ListenerToken token = m_nextToken++;
    m_listeners.emplace_back(token, std::move(handler));
    return token;
}

bool SimulationDriver::removeEventListener(ListenerToken token) {
    return std::erase_if(m_listeners, [token](const auto& entry) { return entry.first == token; }) > 0;
}

void SimulationDriver::dispatch(const EventList& events) {
    if (m_listeners.empty()) {
        return;
    }
    // Copy so a listener may unsubscribe while being notified
    auto listeners = m_listeners;
    for (const auto& event : events) {
        for (const auto& [token, handler] : listeners) {
            if (!handler) {
                continue;
            }
            try {
                handler(event);
            } catch (const std::exception& ex) {
                SIMULATION_ERROR(std::format("Listener {} threw on {}: {}", token,
                                             eventKindName(event.kind), ex.what()));
            } catch (...) {
                SIMULATION_ERROR(std::format("Listener {} threw on {}: Unknown exception", token,
                                             eventKindName(event.kind)));
            }
        }
    }
}

std::vector<Enemy> SimulationDriver::getEnemies() const {
    std::vector<Enemy> snapshot;
    snapshot.reserve(m_enemies.size());
    for (const Enemy* enemy : m_enemies) {
        snapshot.push_back(*enemy);
    }
    return snapshot;
}

std::vector<Projectile> SimulationDriver::getProjectiles() const {
    std::vector<Projectile> snapshot;
    snapshot.reserve(m_projectiles.size());
    for (const Projectile* projectile : m_projectiles) {
        snapshot.push_back(*projectile);
    }
    return snapshot;
}

const std::string& SimulationDriver::getLevelId() const {
    static const std::string none;
    return m_level ? m_level->id : none;
}

} // namespace PopEngine
