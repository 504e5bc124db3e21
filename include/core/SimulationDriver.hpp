/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_DRIVER_HPP
#define SIMULATION_DRIVER_HPP

#include "collisions/CollisionResolver.hpp"
#include "controllers/PhysicsIntegrator.hpp"
#include "controllers/WaveSpawner.hpp"
#include "entities/EntityRecords.hpp"
#include "events/SimulationEvent.hpp"
#include "managers/EntityPool.hpp"
#include "world/LevelDescriptor.hpp"
#include "world/PhysicsConfig.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace PopEngine {

enum class SimulationState : uint8_t {
    Idle = 0,
    Running,
    Terminated
};

const char* simulationStateName(SimulationState state);

inline std::ostream& operator<<(std::ostream& os, SimulationState state) {
    return os << simulationStateName(state);
}

/**
 * @brief Power-up adjustments to newly fired projectiles.
 * Count > 1 fans the shots over a 30 degree arc.
 */
struct ProjectileModifiers {
    float speedMultiplier{1.0f};
    float sizeMultiplier{1.0f};
    int count{1};
    bool piercing{false};
    bool explosive{false};
};

struct SessionStats {
    int shotsFired{0};
    int shotsHit{0};
    int shotsMissed{0};
    int enemiesSpawned{0};
    int enemiesEliminated{0};
    int enemiesSplit{0};
    int mysteryRewards{0};
    uint64_t ticks{0};

    // Fraction of fired projectiles that hit an enemy, 0 before the first shot
    float accuracy() const {
        return shotsFired > 0 ? static_cast<float>(shotsHit) / static_cast<float>(shotsFired)
                              : 0.0f;
    }
};

struct TickResult {
    EventList events;
    int scoreDelta{0};
    bool levelCleared{false};
    bool avatarHit{false};
};

/**
 * @brief Owns one simulation session and runs it a tick at a time.
 *
 * Idle -> Running -> Terminated; reset() returns to Idle from anywhere and
 * re-arms the loaded level. Commands from collaborators are queued and take
 * effect at the start of the next tick. Live collections stay private;
 * getters hand out copies.
 */
class SimulationDriver {
public:
    explicit SimulationDriver(PlayArea area, BasePhysicsConfig base = BasePhysicsConfig{},
                              uint32_t seed = 0x5eed);

    SimulationDriver(const SimulationDriver&) = delete;
    SimulationDriver& operator=(const SimulationDriver&) = delete;

    /**
     * @brief Install a level. Only valid while Idle.
     * @return false if the driver is not Idle
     */
    bool loadLevel(const LevelDescriptor& level);

    /**
     * @brief Idle -> Running.
     * @return false without a loaded level or when not Idle
     */
    bool start();

    void reset();

    // Intents, applied at the start of the next tick
    void setAvatarX(float x);
    void fireProjectile();
    void spawnMysteryTarget(float xFraction, float yFraction, std::string rewardPayload);

    void setProjectileModifiers(const ProjectileModifiers& modifiers);
    const ProjectileModifiers& getProjectileModifiers() const { return m_modifiers; }

    TickResult tick(float dt);

    /**
     * @brief Collaborator step run inside the tick, after collisions and before
     * the results are committed. It sees the events produced so far. A throw
     * aborts the tick like any other failure inside it.
     */
    using TickHook = std::function<void(const EventList&)>;
    void setTickHook(TickHook hook);

    ListenerToken addEventListener(SimulationEventHandler handler);
    bool removeEventListener(ListenerToken token);

    // Snapshots
    std::vector<Enemy> getEnemies() const;
    std::vector<Projectile> getProjectiles() const;
    std::vector<MysteryTarget> getMysteryTargets() const { return m_targets; }
    Avatar getAvatar() const { return m_avatar; }

    SimulationState getState() const { return m_state; }
    bool isLevelLoaded() const { return m_level.has_value(); }
    const std::string& getLevelId() const;
    int getScore() const { return m_score; }
    const SessionStats& getStats() const { return m_stats; }
    float getLevelElapsed() const { return m_levelElapsed; }
    const PlayArea& getPlayArea() const { return m_area; }
    const EffectiveConfig& getEffectiveConfig() const { return m_config; }
    const WaveSpawner& getSpawner() const { return m_spawner; }
    PoolStats getEnemyPoolStats() const { return m_pools.getEnemyStats(); }
    PoolStats getProjectilePoolStats() const { return m_pools.getProjectileStats(); }

private:
    struct PendingTarget {
        float xFraction;
        float yFraction;
        std::string payload;
    };

    void applyIntents(EventList& events);
    void launchProjectiles(EventList& events);
    void ageMysteryTargets(float dt);
    void placeAvatar(float x);
    void releaseLiveRecords();
    void clearSession();
    void dispatch(const EventList& events);

    PlayArea m_area;
    BasePhysicsConfig m_base;
    LevelConfigCache m_configCache;
    EffectiveConfig m_config;
    uint32_t m_seed;
    std::mt19937 m_rng;

    EntityPools m_pools;
    WaveSpawner m_spawner;
    PhysicsIntegrator m_physics;
    CollisionResolver m_collisions;

    std::optional<LevelDescriptor> m_level;
    SimulationState m_state{SimulationState::Idle};

    std::vector<Enemy*> m_enemies;
    std::vector<Projectile*> m_projectiles;
    std::vector<MysteryTarget> m_targets;
    Avatar m_avatar;

    std::optional<float> m_pendingAvatarX;
    int m_pendingShots{0};
    std::vector<PendingTarget> m_pendingTargets;
    std::vector<std::string> m_pendingWarnings;
    ProjectileModifiers m_modifiers;

    float m_levelElapsed{0.0f};
    int m_score{0};
    bool m_clearAnnounced{false};
    uint64_t m_nextTargetId{0};
    SessionStats m_stats;

    TickHook m_tickHook;
    std::vector<std::pair<ListenerToken, SimulationEventHandler>> m_listeners;
    ListenerToken m_nextToken{1};
};

} // namespace PopEngine

#endif // SIMULATION_DRIVER_HPP
