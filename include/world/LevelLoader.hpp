/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_LOADER_HPP
#define LEVEL_LOADER_HPP

#include "world/LevelDescriptor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace PopEngine {

class JsonValue;

/**
 * @brief Builds LevelDescriptors from level JSON.
 *
 * Broken waves and spawn definitions are skipped, not fatal. Each skip is
 * logged and recorded in getWarnings() so tools can surface them.
 */
class LevelLoader {
public:
    explicit LevelLoader(BasePhysicsConfig base = BasePhysicsConfig{});

    std::optional<LevelDescriptor> loadFromFile(const std::string& path);
    std::optional<LevelDescriptor> loadFromString(const std::string& json);
    std::optional<LevelDescriptor> fromJson(const JsonValue& root);

    const std::vector<std::string>& getWarnings() const { return m_warnings; }

private:
    std::optional<Wave> parseWave(const JsonValue& node, size_t index);
    std::optional<EnemySpawnDefinition> parseDefinition(const JsonValue& node,
                                                        const std::string& waveId,
                                                        size_t index);
    void parseBalance(const JsonValue& node, LevelOverrides& overrides);
    void parseEnvironment(const JsonValue& node, LevelOverrides& overrides);
    void warn(std::string message);

    BasePhysicsConfig m_base;
    std::vector<std::string> m_warnings;
};

} // namespace PopEngine

#endif // LEVEL_LOADER_HPP
