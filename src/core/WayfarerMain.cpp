/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <string>

#ifndef WAYFARER_APP_NAME
#define WAYFARER_APP_NAME "Wayfarer"
#endif

const std::string GAME_NAME{WAYFARER_APP_NAME};

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  GAMEENGINE_INFO(std::format("Initializing {}", GAME_NAME));

  // Settings are read before the window exists (tile size decides its size)
  auto& settingsManager = Wayfarer::SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    GAMEENGINE_WARN("Failed to load settings.json - using defaults");
  } else {
    GAMEENGINE_INFO("Settings loaded from res/settings.json");
  }

  GameEngine& gameEngine = GameEngine::Instance();

  try {
    if (!gameEngine.init(GAME_NAME)) {
      GAMEENGINE_CRITICAL(std::format("Init {} Failed", GAME_NAME));
      gameEngine.clean();
      return -1;
    }
  } catch (const std::exception& e) {
    GAMEENGINE_CRITICAL(std::format("Exception during init: {}", e.what()));
    gameEngine.clean();
    return -1;
  }

  GAMEENGINE_INFO("Starting Main Loop");

  TimestepManager& ts = gameEngine.getTimestepManager();

  while (gameEngine.isRunning()) {
    ts.startFrame();

    // Process SDL events (must be on main thread)
    gameEngine.handleEvents();

    // Forward input to the engine
    gameEngine.update();

    // Drain engine events, animate, draw when the idle throttle allows
    gameEngine.render();

    // Sleep out the rest of the frame budget
    ts.endFrame();
  }

  GAMEENGINE_INFO(std::format("Game {} shutting down", GAME_NAME));

  gameEngine.clean();

  return 0;
}
