/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityPool.hpp"

namespace PopEngine {

EntityPools::EntityPools() : m_enemies("enemy"), m_projectiles("projectile") {}

void EntityPools::releaseAll() {
    m_enemies.releaseAll();
    m_projectiles.releaseAll();
    POOL_DEBUG(std::format("Released all records (enemies allocated: {}, projectiles allocated: {})",
                           m_enemies.getStats().total, m_projectiles.getStats().total));
}

} // namespace PopEngine
