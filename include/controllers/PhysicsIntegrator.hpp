/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_INTEGRATOR_HPP
#define PHYSICS_INTEGRATOR_HPP

#include "entities/EntityRecords.hpp"
#include "events/SimulationEvent.hpp"
#include "world/PhysicsConfig.hpp"

#include <vector>

namespace PopEngine {

class EntityPools;

/**
 * @brief Per-tick motion for enemies and projectiles.
 *
 * Integration mutates records in place. Removal is decided by the mark
 * pass, which only reads, and carried out by removeMarked() once per tick.
 */
class PhysicsIntegrator {
public:
    explicit PhysicsIntegrator(const EffectiveConfig& config) : m_config(&config) {}

    void setConfig(const EffectiveConfig& config) { m_config = &config; }

    // Gravity, wind and drag, move, then walls, ceiling, floor, speed limits
    void integrateEnemy(Enemy& enemy, float dt, const PlayArea& area) const;
    void integrateProjectile(Projectile& projectile, float dt) const;

    bool shouldRemoveEnemy(const Enemy& enemy, const PlayArea& area) const;
    bool shouldRemoveProjectile(const Projectile& projectile, const PlayArea& area) const;

    /**
     * @brief Integrate everything, then release what left the playfield.
     * Projectiles leaving through the top emit ProjectileMissed.
     * @return number of projectiles that missed
     */
    int step(float dt, const PlayArea& area, std::vector<Enemy*>& enemies,
             std::vector<Projectile*>& projectiles, EntityPools& pools, EventList& events) const;

private:
    const EffectiveConfig* m_config;
};

} // namespace PopEngine

#endif // PHYSICS_INTEGRATOR_HPP
