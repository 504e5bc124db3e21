/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_EVENT_HPP
#define SIMULATION_EVENT_HPP

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace PopEngine {

enum class EventKind : uint8_t {
    EnemySpawned = 0,
    EnemyEliminated,
    EnemySplit,
    AvatarHit,
    MysteryReward,
    ProjectileFired,
    ProjectileHit,
    ProjectileMissed,
    WaveStarted,
    WaveFinished,
    LevelCleared,
    Warning
};

const char* eventKindName(EventKind kind);

inline std::ostream& operator<<(std::ostream& os, EventKind kind) {
    return os << eventKindName(kind);
}

/**
 * @brief Something observable that happened during a tick.
 *
 * Only the fields relevant to the kind are set: entityId names the enemy,
 * projectile, wave or target; sizeLevel and points accompany pops;
 * payload carries a mystery reward; message explains a Warning.
 */
struct SimulationEvent {
    EventKind kind{EventKind::Warning};
    std::string entityId;
    int sizeLevel{0};
    int points{0};
    std::string payload;
    std::string message;

    static SimulationEvent warning(std::string text) {
        SimulationEvent e;
        e.kind = EventKind::Warning;
        e.message = std::move(text);
        return e;
    }
};

using EventList = std::vector<SimulationEvent>;
using SimulationEventHandler = std::function<void(const SimulationEvent&)>;
using ListenerToken = uint64_t;

} // namespace PopEngine

#endif // SIMULATION_EVENT_HPP
