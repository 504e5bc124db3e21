/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LevelLoader.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <cmath>
#include <format>
#include <limits>

namespace PopEngine {

namespace {
constexpr int MAX_SPLIT_CHILDREN = 8;

// Whole numbers inside the int range only; fractions, overflow and non-finite values are rejected
std::optional<int> integerValue(const JsonValue& value) {
    auto number = value.tryAsNumber();
    if (!number || !std::isfinite(*number) || std::trunc(*number) != *number) {
        return std::nullopt;
    }
    if (*number < static_cast<double>(std::numeric_limits<int>::min()) ||
        *number > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(*number);
}
} // namespace

LevelLoader::LevelLoader(BasePhysicsConfig base) : m_base(std::move(base)) {}

std::optional<LevelDescriptor> LevelLoader::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        LEVEL_ERROR(std::format("Failed to read level {}: {}", path, reader.getLastError()));
        return std::nullopt;
    }
    return fromJson(reader.getRoot());
}

std::optional<LevelDescriptor> LevelLoader::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        LEVEL_ERROR(std::format("Failed to parse level JSON: {}", reader.getLastError()));
        return std::nullopt;
    }
    return fromJson(reader.getRoot());
}

std::optional<LevelDescriptor> LevelLoader::fromJson(const JsonValue& root) {
    m_warnings.clear();

    if (!root.isObject()) {
        LEVEL_ERROR("Level root must be a JSON object");
        return std::nullopt;
    }

    LevelDescriptor level;
    if (auto id = root["id"].tryAsString()) {
        level.id = *id;
    } else if (auto numericId = integerValue(root["id"])) {
        level.id = std::format("level_{}", *numericId);
    } else {
        LEVEL_ERROR("Level is missing an 'id'");
        return std::nullopt;
    }
    level.name = root.stringOr("name", level.id);

    const JsonArray* waves = root["enemyWaves"].tryAsArray();
    if (waves == nullptr) {
        warn(std::format("Level '{}' has no enemyWaves array", level.id));
    } else {
        for (size_t i = 0; i < waves->size(); ++i) {
            if (auto wave = parseWave((*waves)[i], i)) {
                level.waves.push_back(std::move(*wave));
            }
        }
    }

    parseBalance(root["balance"], level.overrides);
    parseEnvironment(root["environment"], level.overrides);

    LEVEL_INFO(std::format("Loaded level '{}' with {} waves ({} warnings)", level.id,
                           level.waves.size(), m_warnings.size()));
    return level;
}

std::optional<Wave> LevelLoader::parseWave(const JsonValue& node, size_t index) {
    if (!node.isObject()) {
        warn(std::format("Skipping wave {}: not an object", index));
        return std::nullopt;
    }

    Wave wave;
    wave.id = node.stringOr("id", std::format("wave_{}", index));

    auto start = node["startTime"].tryAsFloat();
    auto duration = node["duration"].tryAsFloat();
    if (!start || !duration) {
        warn(std::format("Skipping wave '{}': startTime and duration must be numbers", wave.id));
        return std::nullopt;
    }
    if (*start < 0.0f || *duration < 0.0f) {
        warn(std::format("Skipping wave '{}': negative timing", wave.id));
        return std::nullopt;
    }
    wave.startOffsetSeconds = *start;
    wave.durationSeconds = *duration;

    std::string patternName = node.stringOr("spawnPattern", "random");
    if (auto pattern = spawnPatternFromString(patternName)) {
        wave.spawnPattern = *pattern;
    } else {
        warn(std::format("Wave '{}': unknown spawnPattern '{}', using random", wave.id,
                         patternName));
    }

    if (const JsonArray* defs = node["enemies"].tryAsArray()) {
        for (size_t i = 0; i < defs->size(); ++i) {
            if (auto def = parseDefinition((*defs)[i], wave.id, i)) {
                wave.enemies.push_back(*def);
            }
        }
    }
    if (wave.enemies.empty()) {
        warn(std::format("Wave '{}' spawns nothing", wave.id));
    }
    return wave;
}

std::optional<EnemySpawnDefinition> LevelLoader::parseDefinition(const JsonValue& node,
                                                                 const std::string& waveId,
                                                                 size_t index) {
    const std::string where = std::format("wave '{}' enemy {}", waveId, index);
    if (!node.isObject()) {
        warn(std::format("Skipping {}: not an object", where));
        return std::nullopt;
    }

    EnemySpawnDefinition def;

    auto typeName = node["type"].tryAsString();
    auto type = typeName ? enemyTypeFromString(*typeName) : std::nullopt;
    if (!type) {
        warn(std::format("Skipping {}: unknown or missing type", where));
        return std::nullopt;
    }
    def.type = *type;

    auto count = integerValue(node["count"]);
    auto sizeLevel = integerValue(node["sizeLevel"]);
    auto interval = node["spawnInterval"].tryAsFloat();
    if (!count || !sizeLevel || !interval || !std::isfinite(*interval)) {
        warn(std::format("Skipping {}: count and sizeLevel must be whole numbers and "
                         "spawnInterval a number", where));
        return std::nullopt;
    }
    if (*sizeLevel < 1 || *sizeLevel > 3) {
        warn(std::format("Skipping {}: sizeLevel {} out of range", where, *sizeLevel));
        return std::nullopt;
    }
    if (*count < 0 || *interval < 0.0f) {
        warn(std::format("Skipping {}: negative count or interval", where));
        return std::nullopt;
    }
    def.count = *count;
    def.sizeLevel = *sizeLevel;
    def.spawnIntervalSeconds = *interval;
    def.movementSpeedMultiplier = node.floatOr("movementSpeed", 1.0f);

    if (auto movement = node["movementType"].tryAsString()) {
        if (auto parsed = movementTypeFromString(*movement)) {
            def.movementType = *parsed;
        } else {
            warn(std::format("{}: unsupported movementType '{}', using physics_normal", where,
                             *movement));
        }
    }

    if (const JsonValue& split = node["splitBehavior"]; split.isObject()) {
        SplitBehavior& behavior = def.splitBehavior;
        behavior.enabled = split.boolOr("enabled", true);

        const JsonValue& minSize = split["minSizeToSplit"];
        const JsonValue& splitInto = split["splitInto"];
        if (!minSize.isNull()) {
            auto value = integerValue(minSize);
            if (!value || *value < 1 || *value > 3) {
                warn(std::format("Skipping {}: minSizeToSplit must be a whole number in [1, 3]",
                                 where));
                return std::nullopt;
            }
            behavior.minSizeToSplit = *value;
        }
        if (!splitInto.isNull()) {
            auto value = integerValue(splitInto);
            if (!value || *value < 1 || *value > MAX_SPLIT_CHILDREN) {
                warn(std::format("Skipping {}: splitInto must be a whole number in [1, {}]", where,
                                 MAX_SPLIT_CHILDREN));
                return std::nullopt;
            }
            behavior.splitInto = *value;
        }

        behavior.childSizeReduction = split.floatOr("childSizeReduction", behavior.childSizeReduction);
        behavior.childSpeedBonus = split.floatOr("childSpeedBonus", behavior.childSpeedBonus);
        if (!(behavior.childSizeReduction > 0.0f && behavior.childSizeReduction <= 1.0f)) {
            warn(std::format("Skipping {}: childSizeReduction must be in (0, 1]", where));
            return std::nullopt;
        }
        if (!(behavior.childSpeedBonus > 0.0f) || !std::isfinite(behavior.childSpeedBonus)) {
            warn(std::format("Skipping {}: childSpeedBonus must be positive", where));
            return std::nullopt;
        }
    }
    return def;
}

void LevelLoader::parseBalance(const JsonValue& node, LevelOverrides& overrides) {
    if (!node.isObject()) {
        return;
    }
    overrides.gravityMultiplier = node["gravityMultiplier"].tryAsFloat();
    overrides.bounceEnergyMultiplier = node["bounceEnergyMultiplier"].tryAsFloat();
    overrides.airResistanceMultiplier = node["airResistanceMultiplier"].tryAsFloat();
    overrides.enemySpeedMultiplier = node["enemySpeedMultiplier"].tryAsFloat();
    overrides.spawnRateMultiplier = node["spawnRateMultiplier"].tryAsFloat();
    overrides.balloonSizeMultiplier = node["balloonSizeMultiplier"].tryAsFloat();
    overrides.avatarSpeedMultiplier = node["avatarSpeedMultiplier"].tryAsFloat();
    overrides.projectileSpeedMultiplier = node["projectileSpeedMultiplier"].tryAsFloat();
}

void LevelLoader::parseEnvironment(const JsonValue& node, LevelOverrides& overrides) {
    if (!node.isObject()) {
        return;
    }

    // Absolute gravity wins over the balance multiplier
    if (auto gravity = node["gravity"].tryAsFloat()) {
        if (m_base.gravity != 0.0f) {
            overrides.gravityMultiplier = *gravity / m_base.gravity;
        } else {
            warn("Ignoring environment gravity: base gravity is zero");
        }
    }

    // Percent per tick, 0.5 means velocities keep 99.5%
    if (auto percent = node["airResistance"].tryAsFloat()) {
        if (m_base.airResistance != 0.0f) {
            overrides.airResistanceMultiplier = (1.0f - *percent / 100.0f) / m_base.airResistance;
        }
    }

    if (const JsonValue& wind = node["windForce"]; wind.isObject()) {
        auto strength = wind["strength"].tryAsFloat();
        auto direction = wind["direction"].tryAsFloat();
        if (strength && direction) {
            overrides.windForce = WindForce{*strength, *direction};
        } else {
            warn("Ignoring windForce: strength and direction must be numbers");
        }
    }

    if (auto v = node["wallBounceMultiplier"].tryAsFloat()) overrides.wallBounceMultiplier = v;
    if (auto v = node["floorBounceMultiplier"].tryAsFloat()) overrides.floorBounceMultiplier = v;
    if (auto v = node["ceilingBounceMultiplier"].tryAsFloat()) overrides.ceilingBounceMultiplier = v;

    if (auto scale = node["timeScale"].tryAsFloat()) {
        if (*scale > 0.0f) {
            overrides.timeScale = scale;
        } else {
            warn(std::format("Ignoring non-positive timeScale {}", *scale));
        }
    }
}

void LevelLoader::warn(std::string message) {
    LEVEL_WARN(message);
    m_warnings.push_back(std::move(message));
}

} // namespace PopEngine
