/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_DESCRIPTOR_HPP
#define LEVEL_DESCRIPTOR_HPP

#include "entities/EntityRecords.hpp"
#include "world/PhysicsConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PopEngine {

/**
 * @brief Horizontal placement families, as fractions of the play width.
 */
enum class SpawnPattern : uint8_t {
    TwoPoint = 0,     // 0.2, 0.8
    ThreePointWide,   // 0.15, 0.5, 0.85
    EvenColumns,      // 0.25, 0.5, 0.75
    FivePointSpread,  // 0.1 .. 0.9
    EdgeOnly,         // 0.1, 0.9
    Random            // centre +/- 15%
};

const char* spawnPatternName(SpawnPattern pattern);
std::optional<SpawnPattern> spawnPatternFromString(std::string_view name);

// Fixed fractions for the pattern; empty for Random
std::vector<float> spawnPatternFractions(SpawnPattern pattern);

struct EnemySpawnDefinition {
    EnemyType type{EnemyType::Basic};
    int sizeLevel{3};
    int count{1};
    float spawnIntervalSeconds{1.0f};
    float movementSpeedMultiplier{1.0f};
    MovementType movementType{MovementType::PhysicsNormal};
    SplitBehavior splitBehavior;
};

struct Wave {
    std::string id;
    float startOffsetSeconds{0.0f};
    float durationSeconds{0.0f};
    SpawnPattern spawnPattern{SpawnPattern::Random};
    std::vector<EnemySpawnDefinition> enemies;
};

/**
 * @brief Declarative level script: waves plus physics overrides.
 */
struct LevelDescriptor {
    std::string id;
    std::string name;
    std::vector<Wave> waves;
    LevelOverrides overrides;
};

} // namespace PopEngine

#endif // LEVEL_DESCRIPTOR_HPP
