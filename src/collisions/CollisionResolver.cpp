/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionResolver.hpp"
#include "collisions/AABB.hpp"
#include "core/Logger.hpp"
#include "managers/EntityPool.hpp"

#include <boost/container/small_vector.hpp>
#include <cmath>
#include <format>
#include <numbers>

namespace PopEngine {

namespace {
// Typical tick touches a handful of entities; avoid heap churn for the flags
using FlagVector = boost::container::small_vector<bool, 64>;
}

int CollisionResolver::pointsFor(int sizeLevel) const {
    return static_cast<int>(std::lround(m_config->pointsBySize.forLevel(sizeLevel)));
}

std::vector<Enemy*> CollisionResolver::splitEnemy(const Enemy& parent, EntityPools& pools) const {
    std::vector<Enemy*> children;
    if (!parent.canSplit()) {
        return children;
    }

    const SplitBehavior& split = parent.split;
    const SplitVelocity& sv = m_config->splitVelocity;
    const float childSize = parent.width * split.childSizeReduction;
    children.reserve(static_cast<size_t>(split.splitInto));

    for (int i = 0; i < split.splitInto; ++i) {
        const float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) /
                            static_cast<float>(split.splitInto);

        Enemy& child = pools.acquireEnemy();
        child.x = parent.x + std::cos(angle) * sv.offset;
        child.y = parent.y + std::sin(angle) * sv.offset;
        child.width = childSize;
        child.height = childSize;
        child.velocityX = std::cos(angle) * sv.horizontal * split.childSpeedBonus;
        child.velocityY = -sv.vertical * split.childSpeedBonus;
        child.sizeLevel = parent.sizeLevel - 1;
        child.type = parent.type;
        child.movementType = parent.movementType;
        child.split = parent.split;
        children.push_back(&child);
    }
    return children;
}

CollisionOutcome CollisionResolver::resolve(std::vector<Enemy*>& enemies,
                                            std::vector<Projectile*>& projectiles,
                                            std::vector<MysteryTarget>& targets,
                                            const Avatar& avatar, EntityPools& pools,
                                            EventList& events) const {
    CollisionOutcome outcome;

    FlagVector enemyHit(enemies.size(), false);
    FlagVector projectileSpent(projectiles.size(), false);
    FlagVector targetPopped(targets.size(), false);

    // 1. Projectile x Enemy
    for (size_t p = 0; p < projectiles.size(); ++p) {
        const Projectile& projectile = *projectiles[p];
        for (size_t e = 0; e < enemies.size(); ++e) {
            if (enemyHit[e] || !overlaps(projectile, *enemies[e])) {
                continue;
            }
            enemyHit[e] = true;
            projectileSpent[p] = projectile.consumedOnHit();
            outcome.projectilesHit++;

            SimulationEvent hit;
            hit.kind = EventKind::ProjectileHit;
            hit.entityId = projectile.id;
            events.push_back(std::move(hit));
            break;
        }
    }

    // 2. Score and split, before any parent record goes back to the pool
    std::vector<Enemy*> children;
    for (size_t e = 0; e < enemies.size(); ++e) {
        if (!enemyHit[e]) {
            continue;
        }
        const Enemy& enemy = *enemies[e];
        const int points = pointsFor(enemy.sizeLevel);
        outcome.scoreDelta += points;
        outcome.enemiesHit++;

        auto spawned = splitEnemy(enemy, pools);

        SimulationEvent pop;
        pop.entityId = enemy.id;
        pop.sizeLevel = enemy.sizeLevel;
        pop.points = points;
        if (spawned.empty()) {
            pop.kind = EventKind::EnemyEliminated;
        } else {
            pop.kind = EventKind::EnemySplit;
            outcome.enemiesSplit++;
        }
        events.push_back(std::move(pop));

        COLLISION_DEBUG(std::format("{} popped at size {} (+{}), {} children", enemy.id,
                                    enemy.sizeLevel, points, spawned.size()));
        children.insert(children.end(), spawned.begin(), spawned.end());
    }

    // 3. Enemy x Avatar
    for (size_t e = 0; e < enemies.size(); ++e) {
        if (!enemyHit[e] && overlaps(*enemies[e], avatar)) {
            outcome.avatarHit = true;

            SimulationEvent hit;
            hit.kind = EventKind::AvatarHit;
            hit.entityId = enemies[e]->id;
            events.push_back(std::move(hit));
            COLLISION_INFO(std::format("Avatar hit by {}", enemies[e]->id));
            break;
        }
    }

    // 4. Projectile x MysteryTarget
    if (!outcome.avatarHit) {
        for (size_t p = 0; p < projectiles.size(); ++p) {
            if (projectileSpent[p]) {
                continue;
            }
            for (size_t t = 0; t < targets.size(); ++t) {
                if (targetPopped[t] || !overlaps(*projectiles[p], targets[t])) {
                    continue;
                }
                targetPopped[t] = true;
                projectileSpent[p] = true;
                outcome.mysteryPops++;

                SimulationEvent reward;
                reward.kind = EventKind::MysteryReward;
                reward.entityId = targets[t].id;
                reward.payload = targets[t].rewardPayload;
                events.push_back(std::move(reward));
                break;
            }
        }
    }

    // Cleanup, reverse order so erase keeps lower indices stable
    for (size_t e = enemies.size(); e-- > 0;) {
        if (enemyHit[e]) {
            pools.release(*enemies[e]);
            enemies.erase(enemies.begin() + static_cast<std::ptrdiff_t>(e));
        }
    }
    for (size_t p = projectiles.size(); p-- > 0;) {
        if (projectileSpent[p]) {
            pools.release(*projectiles[p]);
            projectiles.erase(projectiles.begin() + static_cast<std::ptrdiff_t>(p));
        }
    }
    for (size_t t = targets.size(); t-- > 0;) {
        if (targetPopped[t]) {
            targets.erase(targets.begin() + static_cast<std::ptrdiff_t>(t));
        }
    }

    enemies.insert(enemies.end(), children.begin(), children.end());
    return outcome;
}

} // namespace PopEngine
