/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/SimulationEvent.hpp"

namespace PopEngine {

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::EnemySpawned:     return "EnemySpawned";
        case EventKind::EnemyEliminated:  return "EnemyEliminated";
        case EventKind::EnemySplit:       return "EnemySplit";
        case EventKind::AvatarHit:        return "AvatarHit";
        case EventKind::MysteryReward:    return "MysteryReward";
        case EventKind::ProjectileFired:  return "ProjectileFired";
        case EventKind::ProjectileHit:    return "ProjectileHit";
        case EventKind::ProjectileMissed: return "ProjectileMissed";
        case EventKind::WaveStarted:      return "WaveStarted";
        case EventKind::WaveFinished:     return "WaveFinished";
        case EventKind::LevelCleared:     return "LevelCleared";
        case EventKind::Warning:          return "Warning";
    }
    return "Unknown";
}

} // namespace PopEngine
