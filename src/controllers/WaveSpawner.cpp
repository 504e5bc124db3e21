/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/WaveSpawner.hpp"
#include "core/Logger.hpp"
#include "managers/EntityPool.hpp"

#include <algorithm>
#include <format>

namespace PopEngine {

namespace {
constexpr float RANDOM_PATTERN_SPREAD = 0.15f;
}

const char* waveStateName(WaveState state) {
    switch (state) {
        case WaveState::Pending:  return "pending";
        case WaveState::Active:   return "active";
        case WaveState::Finished: return "finished";
    }
    return "unknown";
}

void WaveSpawner::configure(const std::vector<Wave>& waves, const EffectiveConfig& config) {
    m_config = &config;
    m_waves.clear();
    m_waves.reserve(waves.size());
    for (const auto& wave : waves) {
        WaveRuntime runtime;
        runtime.wave = wave;
        m_waves.push_back(std::move(runtime));
    }
    m_totalSpawned = 0;
    SPAWNER_DEBUG(std::format("Configured {} waves", m_waves.size()));
}

void WaveSpawner::reset() {
    m_waves.clear();
    m_config = nullptr;
    m_totalSpawned = 0;
}

void WaveSpawner::update(float dt, float levelElapsed, const PlayArea& area, EntityPools& pools,
                         std::vector<Enemy*>& enemies, EventList& events, std::mt19937& rng) {
    if (m_config == nullptr) {
        return;
    }

    for (auto& runtime : m_waves) {
        const float start = runtime.wave.startOffsetSeconds;
        const float end = start + runtime.wave.durationSeconds;

        switch (runtime.state) {
            case WaveState::Pending:
                if (levelElapsed > end) {
                    // Clock jumped over the whole window
                    finish(runtime, events);
                } else if (levelElapsed >= start) {
                    activate(runtime, events);
                    spawnDue(runtime, std::min(dt, levelElapsed - start), area, pools, enemies,
                             events, rng);
                }
                break;
            case WaveState::Active:
                if (levelElapsed > end) {
                    finish(runtime, events);
                } else {
                    spawnDue(runtime, dt, area, pools, enemies, events, rng);
                }
                break;
            case WaveState::Finished:
                break;
        }
    }
}

void WaveSpawner::activate(WaveRuntime& runtime, EventList& events) {
    runtime.state = WaveState::Active;
    runtime.progress.assign(runtime.wave.enemies.size(), DefinitionProgress{});

    SimulationEvent e;
    e.kind = EventKind::WaveStarted;
    e.entityId = runtime.wave.id;
    events.push_back(std::move(e));
    SPAWNER_INFO(std::format("Wave '{}' active ({} definitions)", runtime.wave.id,
                             runtime.wave.enemies.size()));
}

void WaveSpawner::finish(WaveRuntime& runtime, EventList& events) {
    runtime.state = WaveState::Finished;
    runtime.progress.clear();
    runtime.progress.shrink_to_fit();

    SimulationEvent e;
    e.kind = EventKind::WaveFinished;
    e.entityId = runtime.wave.id;
    events.push_back(std::move(e));
    SPAWNER_INFO(std::format("Wave '{}' finished after {} spawns", runtime.wave.id,
                             runtime.spawnIndex));
}

void WaveSpawner::spawnDue(WaveRuntime& runtime, float dt, const PlayArea& area,
                           EntityPools& pools, std::vector<Enemy*>& enemies, EventList& events,
                           std::mt19937& rng) {
    const float rate = m_config->spawnRateMultiplier;

    for (size_t i = 0; i < runtime.wave.enemies.size(); ++i) {
        const auto& def = runtime.wave.enemies[i];
        auto& progress = runtime.progress[i];

        progress.timer += dt;
        if (rate <= 0.0f || progress.spawned >= def.count) {
            continue;
        }
        if (progress.timer < def.spawnIntervalSeconds / rate) {
            continue;
        }

        Enemy& enemy = spawnEnemy(def, runtime, area, pools, rng);
        enemies.push_back(&enemy);
        progress.spawned++;
        progress.timer = 0.0f;
        m_totalSpawned++;

        SimulationEvent e;
        e.kind = EventKind::EnemySpawned;
        e.entityId = enemy.id;
        e.sizeLevel = enemy.sizeLevel;
        events.push_back(std::move(e));
    }
}

Enemy& WaveSpawner::spawnEnemy(const EnemySpawnDefinition& def, WaveRuntime& runtime,
                               const PlayArea& area, EntityPools& pools, std::mt19937& rng) {
    const EffectiveConfig& cfg = *m_config;
    const int index = runtime.spawnIndex++;

    const float size = cfg.enemyBaseSize * cfg.sizeMultiplier.forLevel(def.sizeLevel);

    float centerX = area.width * 0.5f;
    const auto fractions = spawnPatternFractions(runtime.wave.spawnPattern);
    if (fractions.empty()) {
        std::uniform_real_distribution<float> spread(-RANDOM_PATTERN_SPREAD, RANDOM_PATTERN_SPREAD);
        centerX += spread(rng) * area.width;
    } else {
        centerX = fractions[static_cast<size_t>(index) % fractions.size()] * area.width;
    }
    const float half = size * 0.5f;
    centerX = (area.width > size) ? std::clamp(centerX, half, area.width - half) : area.width * 0.5f;

    float heightFraction = 0.0f;
    if (!cfg.spawnHeights.empty()) {
        heightFraction = cfg.spawnHeights[static_cast<size_t>(index) % cfg.spawnHeights.size()];
    }

    float direction = 1.0f;
    if (centerX < area.width / 3.0f) {
        direction = 1.0f;
    } else if (centerX > area.width * 2.0f / 3.0f) {
        direction = -1.0f;
    } else {
        direction = std::bernoulli_distribution(0.5)(rng) ? 1.0f : -1.0f;
    }

    const auto& sv = cfg.spawnVelocity;
    std::uniform_real_distribution<float> variation(-sv.horizontalVariation, sv.horizontalVariation);
    // Smaller enemies move faster; the medium speed is the reference for the spawn base
    const float sizeScale = cfg.speedBySize.medium > 0.0f
                                ? cfg.speedBySize.forLevel(def.sizeLevel) / cfg.speedBySize.medium
                                : 1.0f;
    float speed = (sv.horizontalBase + variation(rng)) * sizeScale * def.movementSpeedMultiplier;
    speed = std::max(speed, cfg.minHorizontalVelocity);

    std::uniform_real_distribution<float> lift(0.0f, sv.verticalRandom);
    const float vertical =
        (sv.verticalBase + lift(rng)) * EnemyTraits::verticalLaunchFactor(def.movementType);

    Enemy& enemy = pools.acquireEnemy();
    enemy.x = centerX - half;
    enemy.y = area.height * heightFraction;
    enemy.width = size;
    enemy.height = size;
    enemy.velocityX = direction * speed;
    enemy.velocityY = vertical;
    enemy.sizeLevel = def.sizeLevel;
    enemy.type = def.type;
    enemy.movementType = def.movementType;
    enemy.split = def.splitBehavior;

    SPAWNER_DEBUG(std::format("Spawned {} ({} size {}) at ({:.1f}, {:.1f}) v=({:.1f}, {:.1f})",
                              enemy.id, enemyTypeName(enemy.type), enemy.sizeLevel, enemy.x,
                              enemy.y, enemy.velocityX, enemy.velocityY));
    return enemy;
}

bool WaveSpawner::allWavesFinished() const {
    return std::all_of(m_waves.begin(), m_waves.end(), [](const WaveRuntime& r) {
        return r.state == WaveState::Finished;
    });
}

WaveState WaveSpawner::getWaveState(size_t waveIndex) const {
    if (waveIndex >= m_waves.size()) {
        return WaveState::Finished;
    }
    return m_waves[waveIndex].state;
}

int WaveSpawner::getSpawnedCount(size_t waveIndex, size_t definitionIndex) const {
    if (waveIndex >= m_waves.size()) {
        return 0;
    }
    const auto& runtime = m_waves[waveIndex];
    if (definitionIndex >= runtime.progress.size()) {
        return 0;
    }
    return runtime.progress[definitionIndex].spawned;
}

int WaveSpawner::getWaveSpawnTotal(size_t waveIndex) const {
    return waveIndex < m_waves.size() ? m_waves[waveIndex].spawnIndex : 0;
}

} // namespace PopEngine
