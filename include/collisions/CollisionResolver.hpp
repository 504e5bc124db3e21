/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

#include "entities/EntityRecords.hpp"
#include "events/SimulationEvent.hpp"
#include "world/PhysicsConfig.hpp"

#include <vector>

namespace PopEngine {

class EntityPools;

struct CollisionOutcome {
    int scoreDelta{0};
    int enemiesHit{0};
    int enemiesSplit{0};
    int projectilesHit{0};
    int mysteryPops{0};
    bool avatarHit{false};
};

/**
 * @brief Resolves one tick's contacts on the post-move snapshot.
 *
 * Order: projectile vs enemy (first match wins, one hit per projectile and
 * per enemy), score and split, enemy vs avatar (short-circuits the rest),
 * projectile vs mystery target. Hit records are released in a single
 * reverse pass; split children are appended after it so they are not
 * tested again this tick.
 */
class CollisionResolver {
public:
    explicit CollisionResolver(const EffectiveConfig& config) : m_config(&config) {}

    void setConfig(const EffectiveConfig& config) { m_config = &config; }

    CollisionOutcome resolve(std::vector<Enemy*>& enemies, std::vector<Projectile*>& projectiles,
                             std::vector<MysteryTarget>& targets, const Avatar& avatar,
                             EntityPools& pools, EventList& events) const;

    /**
     * @brief Build the children of a hit enemy. Empty when it cannot split.
     * Children are acquired from `pools` but not added to any live list.
     */
    std::vector<Enemy*> splitEnemy(const Enemy& parent, EntityPools& pools) const;

    int pointsFor(int sizeLevel) const;

private:
    const EffectiveConfig* m_config;
};

} // namespace PopEngine

#endif // COLLISION_RESOLVER_HPP
