/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WAVE_SPAWNER_HPP
#define WAVE_SPAWNER_HPP

#include "events/SimulationEvent.hpp"
#include "world/LevelDescriptor.hpp"
#include "world/PhysicsConfig.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace PopEngine {

class EntityPools;

enum class WaveState : uint8_t {
    Pending = 0,
    Active,
    Finished
};

const char* waveStateName(WaveState state);

/**
 * @brief Drives the level's wave timeline and places new enemies.
 *
 * Each wave moves Pending -> Active -> Finished on the level clock and never
 * goes back. While active, every spawn definition keeps its own timer,
 * accumulated from tick deltas, and emits at most one enemy per tick.
 */
class WaveSpawner {
public:
    WaveSpawner() = default;

    /**
     * @brief Replace the timeline. All waves start Pending.
     * @param config must outlive the spawner's use of it
     */
    void configure(const std::vector<Wave>& waves, const EffectiveConfig& config);

    void reset();

    /**
     * @brief Advance timers by dt and spawn what is due.
     * @param levelElapsed level clock after this tick's dt was added
     */
    void update(float dt, float levelElapsed, const PlayArea& area, EntityPools& pools,
                std::vector<Enemy*>& enemies, EventList& events, std::mt19937& rng);

    bool allWavesFinished() const;
    size_t getWaveCount() const { return m_waves.size(); }
    WaveState getWaveState(size_t waveIndex) const;
    // Per-definition counts are dropped once the wave finishes
    int getSpawnedCount(size_t waveIndex, size_t definitionIndex) const;
    int getWaveSpawnTotal(size_t waveIndex) const;
    int getTotalSpawned() const { return m_totalSpawned; }

private:
    struct DefinitionProgress {
        float timer{0.0f};
        int spawned{0};
    };

    struct WaveRuntime {
        Wave wave;
        WaveState state{WaveState::Pending};
        std::vector<DefinitionProgress> progress;
        int spawnIndex{0};
    };

    void activate(WaveRuntime& runtime, EventList& events);
    void finish(WaveRuntime& runtime, EventList& events);
    void spawnDue(WaveRuntime& runtime, float dt, const PlayArea& area, EntityPools& pools,
                  std::vector<Enemy*>& enemies, EventList& events, std::mt19937& rng);
    Enemy& spawnEnemy(const EnemySpawnDefinition& def, WaveRuntime& runtime,
                      const PlayArea& area, EntityPools& pools, std::mt19937& rng);

    std::vector<WaveRuntime> m_waves;
    const EffectiveConfig* m_config{nullptr};
    int m_totalSpawned{0};
};

} // namespace PopEngine

#endif // WAVE_SPAWNER_HPP
