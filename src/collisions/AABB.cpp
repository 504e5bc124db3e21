/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include "entities/EntityRecords.hpp"

namespace PopEngine {

AABB AABB::fromEntity(const Entity& e) {
    return AABB{e.x, e.y, e.width, e.height};
}

bool AABB::intersects(const AABB& other) const {
    // Non-strict separation: boxes sharing only an edge do not intersect
    if (right() <= other.left() || other.right() <= left()) return false;
    if (bottom() <= other.top() || other.bottom() <= top()) return false;
    return true;
}

bool AABB::contains(float px, float py) const {
    return px >= left() && px <= right() && py >= top() && py <= bottom();
}

bool overlaps(const Entity& a, const Entity& b) {
    return AABB::fromEntity(a).intersects(AABB::fromEntity(b));
}

} // namespace PopEngine
