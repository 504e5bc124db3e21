/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/PhysicsConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <format>

namespace PopEngine {

namespace {

float factor(const std::optional<float>& multiplier) {
    return multiplier.value_or(1.0f);
}

SizeTable scaled(const SizeTable& table, float k) {
    return SizeTable{table.small * k, table.medium * k, table.large * k};
}

// Overwrites `target` only when `key` holds a number
void readFloat(const JsonValue& node, const char* key, float& target) {
    if (!node.hasKey(key)) {
        return;
    }
    if (auto value = node[key].tryAsFloat()) {
        target = *value;
    } else {
        CONFIG_WARN(std::format("Ignoring '{}': expected a number", key));
    }
}

void readSizeTable(const JsonValue& node, const char* key, SizeTable& table) {
    if (!node.hasKey(key)) {
        return;
    }
    const JsonValue& t = node[key];
    if (!t.isObject()) {
        CONFIG_WARN(std::format("Ignoring '{}': expected an object", key));
        return;
    }
    readFloat(t, "small", table.small);
    readFloat(t, "medium", table.medium);
    readFloat(t, "large", table.large);
}

} // namespace

float SizeTable::forLevel(int sizeLevel) const {
    switch (sizeLevel) {
        case 1: return small;
        case 2: return medium;
        default: return large;
    }
}

EffectiveConfig resolve(const BasePhysicsConfig& base, const LevelOverrides& overrides) {
    EffectiveConfig cfg;

    const float bounceEnergy = factor(overrides.bounceEnergyMultiplier);
    const float enemySpeed = factor(overrides.enemySpeedMultiplier);

    cfg.gravity = base.gravity * factor(overrides.gravityMultiplier);
    cfg.bounce.wall = base.bounce.wall * bounceEnergy * factor(overrides.wallBounceMultiplier);
    cfg.bounce.floor = base.bounce.floor * bounceEnergy * factor(overrides.floorBounceMultiplier);
    cfg.bounce.ceiling =
        base.bounce.ceiling * bounceEnergy * factor(overrides.ceilingBounceMultiplier);
    cfg.minBounceVelocity = base.minBounceVelocity;
    cfg.minHorizontalVelocity = base.minHorizontalVelocity * enemySpeed;
    cfg.maxVelocity = base.maxVelocity;
    cfg.airResistance = base.airResistance * factor(overrides.airResistanceMultiplier);

    cfg.spawnVelocity = base.spawnVelocity;
    cfg.spawnVelocity.horizontalBase *= enemySpeed;
    cfg.spawnVelocity.horizontalVariation *= enemySpeed;
    cfg.splitVelocity = base.splitVelocity;
    cfg.speedBySize = scaled(base.speedBySize, enemySpeed);

    cfg.enemyBaseSize = base.enemyBaseSize * factor(overrides.balloonSizeMultiplier);
    cfg.sizeMultiplier = base.sizeMultiplier;
    cfg.pointsBySize = base.pointsBySize;
    cfg.spawnRateMultiplier = factor(overrides.spawnRateMultiplier);

    cfg.projectileSize = base.projectileSize;
    cfg.projectileSpeed = base.projectileSpeed * factor(overrides.projectileSpeedMultiplier);
    cfg.projectileGravityMultiplier = base.projectileGravityMultiplier;
    cfg.projectileRemovalMargin = base.projectileRemovalMargin;
    cfg.cullProjectilesHorizontally = base.cullProjectilesHorizontally;

    cfg.avatarSize = base.avatarSize;
    cfg.avatarBottomMargin = base.avatarBottomMargin;
    cfg.avatarSpeed = base.avatarSpeed * factor(overrides.avatarSpeedMultiplier);

    cfg.spawnHeights = base.spawnHeights;
    cfg.maxTickDelta = base.maxTickDelta;
    cfg.mysteryTargetLifetime = base.mysteryTargetLifetime;

    cfg.wind = overrides.windForce.value_or(WindForce{});
    cfg.timeScale = overrides.timeScale.value_or(1.0f);
    return cfg;
}

BasePhysicsConfig applyPhysicsJson(BasePhysicsConfig base, const JsonValue& root) {
    if (!root.isObject()) {
        CONFIG_WARN("Physics config root is not an object, keeping defaults");
        return base;
    }

    readFloat(root, "gravity", base.gravity);
    readFloat(root, "minBounceVelocity", base.minBounceVelocity);
    readFloat(root, "minHorizontalVelocity", base.minHorizontalVelocity);
    readFloat(root, "maxVelocity", base.maxVelocity);
    readFloat(root, "airResistance", base.airResistance);

    if (const JsonValue& bounce = root["bounce"]; bounce.isObject()) {
        readFloat(bounce, "floor", base.bounce.floor);
        readFloat(bounce, "wall", base.bounce.wall);
        readFloat(bounce, "ceiling", base.bounce.ceiling);
    }

    if (const JsonValue& spawn = root["spawnVelocity"]; spawn.isObject()) {
        readFloat(spawn, "horizontalBase", base.spawnVelocity.horizontalBase);
        readFloat(spawn, "horizontalVariation", base.spawnVelocity.horizontalVariation);
        readFloat(spawn, "verticalBase", base.spawnVelocity.verticalBase);
        readFloat(spawn, "verticalRandom", base.spawnVelocity.verticalRandom);
    }

    if (const JsonValue& split = root["splitVelocity"]; split.isObject()) {
        readFloat(split, "horizontal", base.splitVelocity.horizontal);
        readFloat(split, "vertical", base.splitVelocity.vertical);
        readFloat(split, "offset", base.splitVelocity.offset);
    }

    readSizeTable(root, "speedBySize", base.speedBySize);
    readSizeTable(root, "sizeMultiplier", base.sizeMultiplier);
    readSizeTable(root, "pointsBySize", base.pointsBySize);
    readFloat(root, "enemyBaseSize", base.enemyBaseSize);

    if (const JsonValue& projectile = root["projectile"]; projectile.isObject()) {
        readFloat(projectile, "size", base.projectileSize);
        readFloat(projectile, "speed", base.projectileSpeed);
        readFloat(projectile, "gravityMultiplier", base.projectileGravityMultiplier);
        readFloat(projectile, "removalMargin", base.projectileRemovalMargin);
        base.cullProjectilesHorizontally =
            projectile.boolOr("cullHorizontally", base.cullProjectilesHorizontally);
    }

    if (const JsonValue& avatar = root["avatar"]; avatar.isObject()) {
        readFloat(avatar, "size", base.avatarSize);
        readFloat(avatar, "bottomMargin", base.avatarBottomMargin);
        readFloat(avatar, "speed", base.avatarSpeed);
    }

    if (const JsonArray* heights = root["spawnHeights"].tryAsArray()) {
        std::vector<float> parsed;
        for (const auto& h : *heights) {
            if (auto v = h.tryAsFloat()) {
                parsed.push_back(*v);
            }
        }
        if (parsed.empty()) {
            CONFIG_WARN("Ignoring empty spawnHeights list");
        } else {
            base.spawnHeights = std::move(parsed);
        }
    }

    readFloat(root, "maxTickDelta", base.maxTickDelta);
    readFloat(root, "mysteryTargetLifetime", base.mysteryTargetLifetime);
    return base;
}

BasePhysicsConfig loadBasePhysicsConfig(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR(std::format("Failed to load physics config {}: {}", path,
                                 reader.getLastError()));
        return BasePhysicsConfig{};
    }
    CONFIG_INFO(std::format("Loaded physics config from {}", path));
    return applyPhysicsJson(BasePhysicsConfig{}, reader.getRoot());
}

const EffectiveConfig& LevelConfigCache::get(const std::string& levelId,
                                             const BasePhysicsConfig& base,
                                             const LevelOverrides& overrides) {
    auto it = m_cache.find(levelId);
    if (it == m_cache.end()) {
        it = m_cache.emplace(levelId, resolve(base, overrides)).first;
        CONFIG_DEBUG(std::format("Resolved config for level '{}' (gravity {:.1f}, spawn rate x{:.2f})",
                                 levelId, it->second.gravity, it->second.spawnRateMultiplier));
    }
    return it->second;
}

bool LevelConfigCache::contains(const std::string& levelId) const {
    return m_cache.find(levelId) != m_cache.end();
}

} // namespace PopEngine
