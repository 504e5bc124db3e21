/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/PhysicsIntegrator.hpp"
#include "core/Logger.hpp"
#include "managers/EntityPool.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace PopEngine {

namespace {
bool isFinite(const Entity& e) {
    return std::isfinite(e.x) && std::isfinite(e.y) && std::isfinite(e.velocityX) &&
           std::isfinite(e.velocityY);
}
} // namespace

void PhysicsIntegrator::integrateEnemy(Enemy& enemy, float dt, const PlayArea& area) const {
    const EffectiveConfig& cfg = *m_config;

    // 1. Forces
    enemy.velocityY += cfg.gravity * dt;
    if (cfg.wind.strength != 0.0f) {
        const float radians = cfg.wind.directionDegrees * std::numbers::pi_v<float> / 180.0f;
        enemy.velocityX += cfg.wind.strength * std::cos(radians) * dt;
        enemy.velocityY -= cfg.wind.strength * std::sin(radians) * dt;
    }
    enemy.velocityX *= cfg.airResistance;
    enemy.velocityY *= cfg.airResistance;

    // 2. Position; only horizontal motion feels the type multiplier
    enemy.x += enemy.velocityX * EnemyTraits::speedMultiplier(enemy.type) * dt;
    enemy.y += enemy.velocityY * dt;

    // 3. Walls
    const float maxX = area.width - enemy.width;
    if (enemy.x <= 0.0f) {
        enemy.velocityX = std::abs(enemy.velocityX) * cfg.bounce.wall;
        enemy.x = 0.0f;
    } else if (enemy.x >= maxX) {
        enemy.velocityX = -std::abs(enemy.velocityX) * cfg.bounce.wall;
        enemy.x = std::max(0.0f, maxX);
    }

    // 4. Ceiling
    if (enemy.y <= 0.0f) {
        enemy.velocityY = std::abs(enemy.velocityY) * cfg.bounce.ceiling;
        enemy.y = 0.0f;
    }

    // 5. Floor; a sub-threshold bounce leaves the enemy resting on the floor line
    const float floorY = area.height - enemy.height;
    if (enemy.y >= floorY) {
        const float candidate = -std::abs(enemy.velocityY) * cfg.bounce.floor;
        enemy.velocityY = (std::abs(candidate) < cfg.minBounceVelocity) ? 0.0f : candidate;
        enemy.y = floorY;
    }

    // 6. Speed limits
    if (std::abs(enemy.velocityX) < cfg.minHorizontalVelocity) {
        enemy.velocityX = std::copysign(cfg.minHorizontalVelocity, enemy.velocityX);
    }
    if (cfg.maxVelocity > 0.0f) {
        enemy.velocityX = std::clamp(enemy.velocityX, -cfg.maxVelocity, cfg.maxVelocity);
        enemy.velocityY = std::clamp(enemy.velocityY, -cfg.maxVelocity, cfg.maxVelocity);
    }
}

void PhysicsIntegrator::integrateProjectile(Projectile& projectile, float dt) const {
    const EffectiveConfig& cfg = *m_config;
    if (cfg.projectileGravityMultiplier != 0.0f) {
        projectile.velocityY += cfg.gravity * cfg.projectileGravityMultiplier * dt;
    }
    projectile.x += projectile.velocityX * dt;
    projectile.y += projectile.velocityY * dt;
    projectile.age += dt;
}

bool PhysicsIntegrator::shouldRemoveEnemy(const Enemy& enemy, const PlayArea& area) const {
    if (!isFinite(enemy)) {
        return true;
    }
    return enemy.y > area.height + enemy.height;
}

bool PhysicsIntegrator::shouldRemoveProjectile(const Projectile& projectile,
                                               const PlayArea& area) const {
    const EffectiveConfig& cfg = *m_config;
    if (!isFinite(projectile)) {
        return true;
    }
    const float margin = cfg.projectileRemovalMargin;
    if (projectile.y <= -margin) {
        return true;
    }
    if (cfg.cullProjectilesHorizontally) {
        return projectile.x < -margin || projectile.x > area.width + margin;
    }
    return false;
}

int PhysicsIntegrator::step(float dt, const PlayArea& area, std::vector<Enemy*>& enemies,
                            std::vector<Projectile*>& projectiles, EntityPools& pools,
                            EventList& events) const {
    for (Enemy* enemy : enemies) {
        integrateEnemy(*enemy, dt, area);
    }
    for (Projectile* projectile : projectiles) {
        integrateProjectile(*projectile, dt);
    }

    for (size_t i = enemies.size(); i-- > 0;) {
        if (shouldRemoveEnemy(*enemies[i], area)) {
            PHYSICS_WARN(std::format("Removing {}: left the playfield at ({:.1f}, {:.1f})",
                                     enemies[i]->id, enemies[i]->x, enemies[i]->y));
            pools.release(*enemies[i]);
            enemies.erase(enemies.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }

    int missed = 0;
    for (size_t i = projectiles.size(); i-- > 0;) {
        if (shouldRemoveProjectile(*projectiles[i], area)) {
            SimulationEvent e;
            e.kind = EventKind::ProjectileMissed;
            e.entityId = projectiles[i]->id;
            events.push_back(std::move(e));
            ++missed;

            pools.release(*projectiles[i]);
            projectiles.erase(projectiles.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
    return missed;
}

} // namespace PopEngine
