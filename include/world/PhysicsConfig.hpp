/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_CONFIG_HPP
#define PHYSICS_CONFIG_HPP

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PopEngine {

class JsonValue;

struct BounceCoefficients {
    float floor{0.95f};
    float wall{0.9f};
    float ceiling{0.85f};
};

// Indexed SMALL, MEDIUM, LARGE (size levels 1..3)
struct SizeTable {
    float small{0.0f};
    float medium{0.0f};
    float large{0.0f};

    float forLevel(int sizeLevel) const;
};

struct SpawnVelocity {
    float horizontalBase{120.0f};
    float horizontalVariation{30.0f};
    float verticalBase{40.0f};
    float verticalRandom{5.0f};
};

struct SplitVelocity {
    float horizontal{250.0f};
    float vertical{150.0f};
    float offset{8.0f};
};

// Playfield in pixels; height is the floor line of the game area
struct PlayArea {
    float width{0.0f};
    float height{0.0f};
};

struct WindForce {
    float strength{0.0f};
    float directionDegrees{0.0f};
};

/**
 * @brief Game-wide physics and balance constants before level overrides.
 */
struct BasePhysicsConfig {
    float gravity{500.0f};
    BounceCoefficients bounce;
    float minBounceVelocity{0.0f};
    float minHorizontalVelocity{100.0f};
    float maxVelocity{400.0f};        // per axis, 0 disables the cap
    float airResistance{1.0f};        // velocity factor per tick, 1 = none

    SpawnVelocity spawnVelocity;
    SplitVelocity splitVelocity;
    SizeTable speedBySize{80.0f, 64.0f, 50.0f};

    float enemyBaseSize{58.0f};
    SizeTable sizeMultiplier{0.7f, 0.85f, 1.0f};
    SizeTable pointsBySize{30.0f, 20.0f, 10.0f};

    float projectileSize{10.0f};
    float projectileSpeed{700.0f};
    float projectileGravityMultiplier{0.0f};
    float projectileRemovalMargin{100.0f};
    bool cullProjectilesHorizontally{true};

    float avatarSize{40.0f};
    float avatarBottomMargin{20.0f};
    float avatarSpeed{300.0f};

    std::vector<float> spawnHeights{0.285f, 0.375f, 0.385f};
    float maxTickDelta{1.0f / 30.0f};
    float mysteryTargetLifetime{30.0f};
};

/**
 * @brief Per-level adjustments. An absent multiplier means 1.0; an explicit
 * 0 is honored and is not the same as absent.
 */
struct LevelOverrides {
    std::optional<float> gravityMultiplier;
    std::optional<float> bounceEnergyMultiplier;
    std::optional<float> wallBounceMultiplier;
    std::optional<float> floorBounceMultiplier;
    std::optional<float> ceilingBounceMultiplier;
    std::optional<float> airResistanceMultiplier;
    std::optional<float> enemySpeedMultiplier;
    std::optional<float> spawnRateMultiplier;
    std::optional<float> balloonSizeMultiplier;
    std::optional<float> avatarSpeedMultiplier;
    std::optional<float> projectileSpeedMultiplier;

    // Replace rather than scale
    std::optional<WindForce> windForce;
    std::optional<float> timeScale;
};

/**
 * @brief Fully resolved configuration the per-tick components read.
 * Immutable once produced for a level.
 */
struct EffectiveConfig {
    float gravity{0.0f};
    BounceCoefficients bounce;
    float minBounceVelocity{0.0f};
    float minHorizontalVelocity{0.0f};
    float maxVelocity{0.0f};
    float airResistance{1.0f};

    SpawnVelocity spawnVelocity;
    SplitVelocity splitVelocity;
    SizeTable speedBySize;

    float enemyBaseSize{0.0f};
    SizeTable sizeMultiplier;
    SizeTable pointsBySize;
    float spawnRateMultiplier{1.0f};

    float projectileSize{0.0f};
    float projectileSpeed{0.0f};
    float projectileGravityMultiplier{0.0f};
    float projectileRemovalMargin{0.0f};
    bool cullProjectilesHorizontally{true};

    float avatarSize{0.0f};
    float avatarBottomMargin{0.0f};
    float avatarSpeed{0.0f};

    std::vector<float> spawnHeights;
    float maxTickDelta{1.0f / 30.0f};
    float mysteryTargetLifetime{30.0f};

    WindForce wind;
    float timeScale{1.0f};
};

/**
 * @brief Merge base constants with level overrides. Pure and idempotent.
 */
EffectiveConfig resolve(const BasePhysicsConfig& base, const LevelOverrides& overrides);

/**
 * @brief Apply the keys present in a JSON object on top of `base`.
 * Wrongly typed keys are skipped with a warning.
 */
BasePhysicsConfig applyPhysicsJson(BasePhysicsConfig base, const JsonValue& root);

/**
 * @brief Read a physics config file; returns the defaults when the file is
 * missing or malformed.
 */
BasePhysicsConfig loadBasePhysicsConfig(const std::string& path);

/**
 * @brief Memoizes resolve() per level id.
 */
class LevelConfigCache {
public:
    const EffectiveConfig& get(const std::string& levelId, const BasePhysicsConfig& base,
                               const LevelOverrides& overrides);
    bool contains(const std::string& levelId) const;
    void clear() { m_cache.clear(); }
    size_t size() const { return m_cache.size(); }

private:
    std::unordered_map<std::string, EffectiveConfig> m_cache;
};

} // namespace PopEngine

#endif // PHYSICS_CONFIG_HPP
