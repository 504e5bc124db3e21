/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEADLESS_RUNNER_HPP
#define HEADLESS_RUNNER_HPP

#include "core/SimulationDriver.hpp"

#include <cstdint>
#include <vector>

namespace PopEngine {

/**
 * @brief Tuning for the autopilot. Distances are pixels between centres.
 */
struct AutopilotConfig {
    float shootThreshold{80.0f};  // fire at enemies this close horizontally
    float laneWidth{20.0f};       // hold fire if a projectile already rises in the lane
    float avoidThreshold{60.0f};
    float dodgeStep{40.0f};
    float centerBias{0.4f};       // fraction of the width treated as centre zone
    float centerStep{15.0f};
    float edgeMargin{30.0f};
};

struct AutopilotAction {
    enum class Kind : uint8_t { Idle, Shoot, Move };
    Kind kind{Kind::Idle};
    float x{0.0f};
};

/**
 * @brief Stateless decision: shoot, else dodge, else drift to centre.
 */
AutopilotAction decideAutopilot(const Avatar& avatar, const std::vector<Enemy>& enemies,
                                const std::vector<Projectile>& projectiles, const PlayArea& area,
                                const AutopilotConfig& config);

enum class SessionOutcome : uint8_t {
    NotStarted = 0,
    Cleared,
    AvatarHit,
    TimedOut
};

const char* sessionOutcomeName(SessionOutcome outcome);

struct HeadlessReport {
    SessionOutcome outcome{SessionOutcome::NotStarted};
    int score{0};
    float elapsedSeconds{0.0f};
    SessionStats stats;
};

/**
 * @brief Plays a loaded level without a window, for balance checks.
 */
class HeadlessRunner {
public:
    HeadlessRunner(SimulationDriver& driver, AutopilotConfig config = AutopilotConfig{});

    /**
     * @brief Run until cleared, hit, or `maxSeconds` of level time.
     * The driver must be Idle with a level loaded.
     */
    HeadlessReport run(float maxSeconds, float tickSeconds = 1.0f / 60.0f);

private:
    SimulationDriver& m_driver;
    AutopilotConfig m_config;
};

} // namespace PopEngine

#endif // HEADLESS_RUNNER_HPP
