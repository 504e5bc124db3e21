/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

namespace PopEngine {

struct Entity;

// Axis-aligned box in screen space: (x, y) is the top-left corner, y grows down
struct AABB {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};

    AABB() = default;
    AABB(float left, float top, float w, float h) : x(left), y(top), width(w), height(h) {}

    static AABB fromEntity(const Entity& e);

    float left() const { return x; }
    float right() const { return x + width; }
    float top() const { return y; }
    float bottom() const { return y + height; }
    float centerX() const { return x + width * 0.5f; }
    float centerY() const { return y + height * 0.5f; }

    bool intersects(const AABB& other) const;
    bool contains(float px, float py) const;
};

// Shorthand used by the resolver
bool overlaps(const Entity& a, const Entity& b);

} // namespace PopEngine

#endif // AABB_HPP
