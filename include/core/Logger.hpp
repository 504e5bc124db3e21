/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - std::atomic<bool> benchmark flag
#include <cstdint> // IWYU pragma: keep - uint8_t
#include <cstdio> // IWYU pragma: keep - printf() and fflush()
#include <mutex> // IWYU pragma: keep - serialized console output
#include <string> // IWYU pragma: keep - std::string messages from std::format

namespace PopEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Pop Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    }
    return "UNKNOWN";
  }
};

#define POP_CRITICAL(system, msg)                                              \
  PopEngine::Logger::Log(PopEngine::LogLevel::CRITICAL, system, msg)
#define POP_ERROR(system, msg)                                                 \
  PopEngine::Logger::Log(PopEngine::LogLevel::ERROR_LEVEL, system, msg)
#define POP_WARN(system, msg)                                                  \
  PopEngine::Logger::Log(PopEngine::LogLevel::WARNING, system, msg)
#define POP_INFO(system, msg)                                                  \
  PopEngine::Logger::Log(PopEngine::LogLevel::INFO, system, msg)
#define POP_DEBUG(system, msg)                                                 \
  PopEngine::Logger::Log(PopEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define POP_CRITICAL(system, msg)                                              \
  PopEngine::Logger::Log("CRITICAL", system, msg)
#define POP_ERROR(system, msg) PopEngine::Logger::Log("ERROR", system, msg)

#define POP_WARN(system, msg) ((void)0)
#define POP_INFO(system, msg) ((void)0)
#define POP_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Simulation core
#define SIMULATION_CRITICAL(msg) POP_CRITICAL("SimulationDriver", msg)
#define SIMULATION_ERROR(msg) POP_ERROR("SimulationDriver", msg)
#define SIMULATION_WARN(msg) POP_WARN("SimulationDriver", msg)
#define SIMULATION_INFO(msg) POP_INFO("SimulationDriver", msg)
#define SIMULATION_DEBUG(msg) POP_DEBUG("SimulationDriver", msg)

#define POOL_CRITICAL(msg) POP_CRITICAL("EntityPool", msg)
#define POOL_ERROR(msg) POP_ERROR("EntityPool", msg)
#define POOL_WARN(msg) POP_WARN("EntityPool", msg)
#define POOL_INFO(msg) POP_INFO("EntityPool", msg)
#define POOL_DEBUG(msg) POP_DEBUG("EntityPool", msg)

#define SPAWNER_CRITICAL(msg) POP_CRITICAL("WaveSpawner", msg)
#define SPAWNER_ERROR(msg) POP_ERROR("WaveSpawner", msg)
#define SPAWNER_WARN(msg) POP_WARN("WaveSpawner", msg)
#define SPAWNER_INFO(msg) POP_INFO("WaveSpawner", msg)
#define SPAWNER_DEBUG(msg) POP_DEBUG("WaveSpawner", msg)

#define PHYSICS_CRITICAL(msg) POP_CRITICAL("PhysicsIntegrator", msg)
#define PHYSICS_ERROR(msg) POP_ERROR("PhysicsIntegrator", msg)
#define PHYSICS_WARN(msg) POP_WARN("PhysicsIntegrator", msg)
#define PHYSICS_INFO(msg) POP_INFO("PhysicsIntegrator", msg)
#define PHYSICS_DEBUG(msg) POP_DEBUG("PhysicsIntegrator", msg)

#define COLLISION_CRITICAL(msg) POP_CRITICAL("CollisionResolver", msg)
#define COLLISION_ERROR(msg) POP_ERROR("CollisionResolver", msg)
#define COLLISION_WARN(msg) POP_WARN("CollisionResolver", msg)
#define COLLISION_INFO(msg) POP_INFO("CollisionResolver", msg)
#define COLLISION_DEBUG(msg) POP_DEBUG("CollisionResolver", msg)

// Data loading
#define CONFIG_CRITICAL(msg) POP_CRITICAL("PhysicsConfig", msg)
#define CONFIG_ERROR(msg) POP_ERROR("PhysicsConfig", msg)
#define CONFIG_WARN(msg) POP_WARN("PhysicsConfig", msg)
#define CONFIG_INFO(msg) POP_INFO("PhysicsConfig", msg)
#define CONFIG_DEBUG(msg) POP_DEBUG("PhysicsConfig", msg)

#define LEVEL_CRITICAL(msg) POP_CRITICAL("LevelLoader", msg)
#define LEVEL_ERROR(msg) POP_ERROR("LevelLoader", msg)
#define LEVEL_WARN(msg) POP_WARN("LevelLoader", msg)
#define LEVEL_INFO(msg) POP_INFO("LevelLoader", msg)
#define LEVEL_DEBUG(msg) POP_DEBUG("LevelLoader", msg)

// Runners
#define HEADLESS_CRITICAL(msg) POP_CRITICAL("HeadlessRunner", msg)
#define HEADLESS_ERROR(msg) POP_ERROR("HeadlessRunner", msg)
#define HEADLESS_WARN(msg) POP_WARN("HeadlessRunner", msg)
#define HEADLESS_INFO(msg) POP_INFO("HeadlessRunner", msg)
#define HEADLESS_DEBUG(msg) POP_DEBUG("HeadlessRunner", msg)

#define HOST_CRITICAL(msg) POP_CRITICAL("Host", msg)
#define HOST_ERROR(msg) POP_ERROR("Host", msg)
#define HOST_WARN(msg) POP_WARN("Host", msg)
#define HOST_INFO(msg) POP_INFO("Host", msg)
#define HOST_DEBUG(msg) POP_DEBUG("Host", msg)

#define POP_ENABLE_BENCHMARK_MODE() PopEngine::Logger::SetBenchmarkMode(true)
#define POP_DISABLE_BENCHMARK_MODE() PopEngine::Logger::SetBenchmarkMode(false)

} // namespace PopEngine

#endif // LOGGER_HPP
