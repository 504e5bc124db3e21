/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LevelDescriptor.hpp"

namespace PopEngine {

const char* spawnPatternName(SpawnPattern pattern) {
    switch (pattern) {
        case SpawnPattern::TwoPoint:        return "two_small";
        case SpawnPattern::ThreePointWide:  return "three_small_wide";
        case SpawnPattern::EvenColumns:     return "pipes";
        case SpawnPattern::FivePointSpread: return "crazy";
        case SpawnPattern::EdgeOnly:        return "entrap";
        case SpawnPattern::Random:          return "random";
    }
    return "random";
}

std::optional<SpawnPattern> spawnPatternFromString(std::string_view name) {
    if (name == "two_small") return SpawnPattern::TwoPoint;
    if (name == "three_small_wide") return SpawnPattern::ThreePointWide;
    if (name == "pipes") return SpawnPattern::EvenColumns;
    if (name == "crazy") return SpawnPattern::FivePointSpread;
    if (name == "entrap") return SpawnPattern::EdgeOnly;
    if (name == "random") return SpawnPattern::Random;
    return std::nullopt;
}

std::vector<float> spawnPatternFractions(SpawnPattern pattern) {
    switch (pattern) {
        case SpawnPattern::TwoPoint:        return {0.2f, 0.8f};
        case SpawnPattern::ThreePointWide:  return {0.15f, 0.5f, 0.85f};
        case SpawnPattern::EvenColumns:     return {0.25f, 0.5f, 0.75f};
        case SpawnPattern::FivePointSpread: return {0.1f, 0.3f, 0.5f, 0.7f, 0.9f};
        case SpawnPattern::EdgeOnly:        return {0.1f, 0.9f};
        case SpawnPattern::Random:          return {};
    }
    return {};
}

} // namespace PopEngine
