/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityRecords.hpp"

namespace PopEngine {

const char* enemyTypeName(EnemyType type) {
    switch (type) {
        case EnemyType::Basic:    return "basic";
        case EnemyType::Fast:     return "fast";
        case EnemyType::Strong:   return "strong";
        case EnemyType::Bouncer:  return "bouncer";
        case EnemyType::Splitter: return "splitter";
        case EnemyType::Ghost:    return "ghost";
    }
    return "unknown";
}

std::optional<EnemyType> enemyTypeFromString(std::string_view name) {
    if (name == "basic") return EnemyType::Basic;
    if (name == "fast") return EnemyType::Fast;
    if (name == "strong") return EnemyType::Strong;
    if (name == "bouncer") return EnemyType::Bouncer;
    if (name == "splitter") return EnemyType::Splitter;
    if (name == "ghost") return EnemyType::Ghost;
    return std::nullopt;
}

const char* movementTypeName(MovementType type) {
    switch (type) {
        case MovementType::PhysicsNormal: return "physics_normal";
        case MovementType::PhysicsHeavy:  return "physics_heavy";
        case MovementType::PhysicsFloaty: return "physics_floaty";
    }
    return "unknown";
}

std::optional<MovementType> movementTypeFromString(std::string_view name) {
    if (name == "physics_normal") return MovementType::PhysicsNormal;
    if (name == "physics_heavy") return MovementType::PhysicsHeavy;
    if (name == "physics_floaty") return MovementType::PhysicsFloaty;
    return std::nullopt;
}

} // namespace PopEngine
