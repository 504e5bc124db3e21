/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_RECORDS_HPP
#define ENTITY_RECORDS_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace PopEngine {

/**
 * @brief Enemy behaviour families.
 *
 * Closed set: every switch over EnemyType is exhaustive so adding a type
 * fails to compile until its speed entry exists.
 */
enum class EnemyType : uint8_t {
    Basic = 0,
    Fast,
    Strong,
    Bouncer,
    Splitter,
    Ghost
};

/**
 * @brief Initial vertical velocity profile of a spawned enemy.
 */
enum class MovementType : uint8_t {
    PhysicsNormal = 0,
    PhysicsHeavy,
    PhysicsFloaty
};

namespace EnemyTraits {

/// Horizontal speed multiplier applied during integration
constexpr float speedMultiplier(EnemyType type) noexcept {
    switch (type) {
        case EnemyType::Basic:    return 1.0f;
        case EnemyType::Fast:     return 1.5f;
        case EnemyType::Strong:   return 0.7f;
        case EnemyType::Bouncer:  return 1.2f;
        case EnemyType::Splitter: return 1.0f;
        case EnemyType::Ghost:    return 0.8f;
    }
    return 1.0f;
}

/// Scale applied to the spawn vertical velocity
constexpr float verticalLaunchFactor(MovementType type) noexcept {
    switch (type) {
        case MovementType::PhysicsNormal: return 1.0f;
        case MovementType::PhysicsHeavy:  return 1.3f;
        case MovementType::PhysicsFloaty: return 0.7f;
    }
    return 1.0f;
}

} // namespace EnemyTraits

const char* enemyTypeName(EnemyType type);
std::optional<EnemyType> enemyTypeFromString(std::string_view name);

const char* movementTypeName(MovementType type);
std::optional<MovementType> movementTypeFromString(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, EnemyType type) {
    return os << enemyTypeName(type);
}

/**
 * @brief How an enemy breaks apart when hit. Children inherit it.
 */
struct SplitBehavior {
    bool enabled{true};
    int minSizeToSplit{2};
    int splitInto{2};
    float childSizeReduction{0.7f};
    float childSpeedBonus{1.1f};
};

/**
 * @brief Fields shared by every simulated rectangle.
 *
 * Position is the top-left corner in pixels; velocities are pixels per second.
 */
struct Entity {
    std::string id;
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
    float velocityX{0.0f};
    float velocityY{0.0f};
};

struct Enemy : Entity {
    int sizeLevel{3};
    EnemyType type{EnemyType::Basic};
    MovementType movementType{MovementType::PhysicsNormal};
    SplitBehavior split;

    bool canSplit() const {
        return sizeLevel > 1 && split.enabled && split.splitInto > 0 &&
               sizeLevel >= split.minSizeToSplit;
    }
};

struct Projectile : Entity {
    float age{0.0f};
    bool piercing{false};
    bool explosive{false};

    // Consumed on first hit unless it passes through or detonates
    bool consumedOnHit() const { return !piercing && !explosive; }
};

struct MysteryTarget : Entity {
    std::string rewardPayload;
    float age{0.0f};
};

// One per session, never pooled; velocities stay zero
struct Avatar : Entity {};

} // namespace PopEngine

#endif // ENTITY_RECORDS_HPP
