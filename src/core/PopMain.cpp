/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/HeadlessRunner.hpp"
#include "core/Logger.hpp"
#include "core/SimulationDriver.hpp"
#include "core/TimestepManager.hpp"
#include "world/LevelLoader.hpp"
#include "world/PhysicsConfig.hpp"

#include <SDL3/SDL.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace {

const int WINDOW_WIDTH{480};
const int WINDOW_HEIGHT{800};
const std::string GAME_NAME{"Pop Engine"};

struct HostOptions {
  std::string levelPath{"res/levels/level_001.json"};
  std::string configPath{"res/config/physics.json"};
  std::optional<float> headlessSeconds;
  uint32_t seed{0x5eed};
};

template <typename T> bool parseNumber(std::string_view text, T &out) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

std::optional<HostOptions> parseArguments(int argc, char *argv[]) {
  HostOptions options;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};
    const bool hasValue = i + 1 < argc;

    if (arg == "--level" && hasValue) {
      options.levelPath = argv[++i];
    } else if (arg == "--config" && hasValue) {
      options.configPath = argv[++i];
    } else if (arg == "--headless" && hasValue) {
      float seconds = 0.0f;
      if (!parseNumber(std::string_view{argv[++i]}, seconds) || !std::isfinite(seconds) ||
          seconds <= 0.0f) {
        HOST_ERROR(std::format("Invalid --headless duration '{}'", argv[i]));
        return std::nullopt;
      }
      options.headlessSeconds = seconds;
    } else if (arg == "--seed" && hasValue) {
      if (!parseNumber(std::string_view{argv[++i]}, options.seed)) {
        HOST_ERROR(std::format("Invalid --seed '{}'", argv[i]));
        return std::nullopt;
      }
    } else {
      HOST_ERROR(std::format("Unknown argument '{}'. Usage: PopEngine [--level file] "
                             "[--config file] [--headless seconds] [--seed n]",
                             arg));
      return std::nullopt;
    }
  }
  return options;
}

void fillEntity(SDL_Renderer *renderer, const PopEngine::Entity &e) {
  SDL_FRect rect{e.x, e.y, e.width, e.height};
  SDL_RenderFillRect(renderer, &rect);
}

// Debug view: flat rectangles only, art belongs to the real renderer
void drawFrame(SDL_Renderer *renderer, const PopEngine::SimulationDriver &driver) {
  SDL_SetRenderDrawColor(renderer, 18, 18, 32, 255);
  SDL_RenderClear(renderer);

  SDL_SetRenderDrawColor(renderer, 230, 80, 90, 255);
  for (const auto &enemy : driver.getEnemies()) {
    fillEntity(renderer, enemy);
  }
  SDL_SetRenderDrawColor(renderer, 250, 220, 90, 255);
  for (const auto &projectile : driver.getProjectiles()) {
    fillEntity(renderer, projectile);
  }
  SDL_SetRenderDrawColor(renderer, 170, 110, 240, 255);
  for (const auto &target : driver.getMysteryTargets()) {
    fillEntity(renderer, target);
  }
  SDL_SetRenderDrawColor(renderer, 90, 200, 120, 255);
  fillEntity(renderer, driver.getAvatar());

  SDL_RenderPresent(renderer);
}

int runHeadless(PopEngine::SimulationDriver &driver, float seconds) {
  PopEngine::HeadlessRunner runner(driver);
  PopEngine::HeadlessReport report = runner.run(seconds);
  if (report.outcome == PopEngine::SessionOutcome::NotStarted) {
    return -1;
  }
  // Summary goes to stdout in every build type
  printf("%s: %s, score %d, accuracy %.1f%%, %d shots, %.1fs\n", driver.getLevelId().c_str(),
         PopEngine::sessionOutcomeName(report.outcome), report.score,
         static_cast<double>(report.stats.accuracy() * 100.0f), report.stats.shotsFired,
         static_cast<double>(report.elapsedSeconds));
  return 0;
}

int runWindowed(PopEngine::SimulationDriver &driver) {
  if (!SDL_Init(SDL_INIT_VIDEO)) {
    HOST_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  SDL_Window *window = nullptr;
  SDL_Renderer *renderer = nullptr;
  if (!SDL_CreateWindowAndRenderer(GAME_NAME.c_str(), WINDOW_WIDTH, WINDOW_HEIGHT, 0, &window,
                                   &renderer)) {
    HOST_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
    SDL_Quit();
    return -1;
  }

  PopEngine::TimestepManager ts;
  ts.setSoftwareFrameLimiting(!SDL_SetRenderVSync(renderer, 1));
  HOST_INFO(std::format("Frame timing: {}", ts.isUsingSoftwareFrameLimiting()
                                                ? "software frame limiting"
                                                : "hardware VSync"));

  driver.addEventListener([](const PopEngine::SimulationEvent &event) {
    if (event.kind == PopEngine::EventKind::MysteryReward) {
      HOST_INFO(std::format("Mystery reward: {}", event.payload));
    }
  });

  driver.start();
  bool running = true;
  while (running) {
    ts.startFrame();

    bool fire = false;
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      if (event.type == SDL_EVENT_QUIT) {
        running = false;
      } else if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
        switch (event.key.scancode) {
        case SDL_SCANCODE_ESCAPE:
          running = false;
          break;
        case SDL_SCANCODE_SPACE:
          fire = true;
          break;
        case SDL_SCANCODE_R:
          driver.reset();
          driver.start();
          break;
        case SDL_SCANCODE_M:
          driver.spawnMysteryTarget(0.5f, 0.1f, "bonus");
          break;
        default:
          break;
        }
      }
    }

    while (ts.shouldUpdate()) {
      const float dt = ts.getUpdateDeltaTime();
      const bool *keys = SDL_GetKeyboardState(nullptr);
      float direction = 0.0f;
      if (keys[SDL_SCANCODE_LEFT]) direction -= 1.0f;
      if (keys[SDL_SCANCODE_RIGHT]) direction += 1.0f;
      if (direction != 0.0f) {
        driver.setAvatarX(driver.getAvatar().x +
                          direction * driver.getEffectiveConfig().avatarSpeed * dt);
      }
      if (fire) {
        driver.fireProjectile();
        fire = false;
      }

      PopEngine::TickResult result = driver.tick(dt);
      if (result.avatarHit) {
        HOST_INFO(std::format("Hit! Final score {} - press R to retry", driver.getScore()));
      }
    }

    drawFrame(renderer, driver);
    ts.endFrame();
  }

  SDL_DestroyRenderer(renderer);
  SDL_DestroyWindow(window);
  SDL_Quit();
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  auto options = parseArguments(argc, argv);
  if (!options) {
    return -1;
  }

  HOST_INFO(std::format("Initializing {}", GAME_NAME));
  PopEngine::BasePhysicsConfig base = PopEngine::loadBasePhysicsConfig(options->configPath);

  PopEngine::LevelLoader loader(base);
  auto level = loader.loadFromFile(options->levelPath);
  if (!level) {
    HOST_CRITICAL(std::format("Cannot start without a level ({})", options->levelPath));
    return -1;
  }

  PopEngine::SimulationDriver driver(
      PopEngine::PlayArea{static_cast<float>(WINDOW_WIDTH), static_cast<float>(WINDOW_HEIGHT)},
      base, options->seed);
  if (!driver.loadLevel(*level)) {
    return -1;
  }

  const int status = options->headlessSeconds ? runHeadless(driver, *options->headlessSeconds)
                                              : runWindowed(driver);
  HOST_INFO(std::format("{} shutting down", GAME_NAME));
  return status;
}
