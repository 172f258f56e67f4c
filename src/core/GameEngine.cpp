/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "managers/InputManager.hpp"
#include "render/TerrainRenderer.hpp"
#include "world/WorldMap.hpp"
#include <format>
#include <string>

bool GameEngine::init(std::string_view title) {
  GAMEENGINE_INFO(std::format("Initializing {}", title));

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    GAMEENGINE_CRITICAL(std::format("SDL Video initialization failed: {}", SDL_GetError()));
    return false;
  }
  m_sdlInitialized = true;

  m_settings = Wayfarer::SettingsManager::Instance().getGameSettings();

  const auto worldMap = Wayfarer::WorldMap::reference();
  m_windowWidth = m_settings.tileSize * worldMap->width();
  m_windowHeight = m_settings.tileSize * worldMap->height();

  mp_window.reset(SDL_CreateWindow(std::string(title).c_str(), m_windowWidth,
                                   m_windowHeight, SDL_WINDOW_RESIZABLE));
  if (!mp_window) {
    GAMEENGINE_CRITICAL(std::format("Window creation failed: {}", SDL_GetError()));
    return false;
  }
  GAMEENGINE_INFO(std::format("Window created: {}x{}", m_windowWidth, m_windowHeight));

  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
  if (!mp_renderer) {
    GAMEENGINE_CRITICAL(std::format("Renderer creation failed: {}", SDL_GetError()));
    return false;
  }

  const char* rendererName = SDL_GetRendererName(mp_renderer.get());
  GAMEENGINE_INFO(std::format("Renderer: {}", rendererName ? rendererName : "unknown"));

  if (!SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_BLEND)) {
    GAMEENGINE_ERROR(std::format("Failed to set blend mode: {}", SDL_GetError()));
  }

  configureVSync(m_settings.vsync, m_settings.maxFps);

  // Channels and the background engine
  m_commands = std::make_shared<Wayfarer::CommandChannel>();
  m_events = std::make_shared<Wayfarer::EventChannel>();
  m_worker = std::make_unique<Wayfarer::EngineWorker>(m_commands, m_events, worldMap);
  if (!m_worker->start()) {
    GAMEENGINE_CRITICAL("Failed to start engine worker");
    return false;
  }

  // Status line goes to the window title
  SDL_Window* window = mp_window.get();
  m_statusController = std::make_unique<StatusController>(
      [window](const std::string& line) {
        if (!SDL_SetWindowTitle(window, line.c_str())) {
          GAMEENGINE_WARN(std::format("Failed to set window title: {}", SDL_GetError()));
        }
      });
  m_statusController->subscribe(m_broadcaster);

  RenderController::Config config;
  config.tileSize = m_settings.tileSize;
  config.canvasWidth = m_windowWidth;
  config.canvasHeight = m_windowHeight;
  config.stepDelayMs = m_settings.stepDelayMs;
  config.animationSeed = m_settings.animationSeed;
  config.animation.cloudsEnabled = m_settings.clouds;
  config.animation.wavesEnabled = m_settings.waves;
  config.animation.riverEnabled = m_settings.river;

  m_renderController =
      std::make_unique<RenderController>(m_commands, m_events, m_broadcaster, config);

  SDL_Renderer* renderer = mp_renderer.get();
  m_renderController->setDrawCallback([renderer](const Wayfarer::FrameParams& params) {
    if (Wayfarer::TerrainRenderer::drawFrame(renderer, params)) {
      SDL_RenderPresent(renderer);
    }
  });

  if (!m_renderController->start(Wayfarer::EngineWorker::nowMs())) {
    GAMEENGINE_CRITICAL("Failed to send Start to the engine");
    return false;
  }

  InputManager::Instance().reset();

  m_running = true;
  GAMEENGINE_INFO("Initialization complete");
  return true;
}

void GameEngine::configureVSync(bool vsyncRequested, int maxFps) {
  GAMEENGINE_INFO(std::format("VSync setting: {}", vsyncRequested ? "enabled" : "disabled"));

  const bool vsyncSet = SDL_SetRenderVSync(mp_renderer.get(), vsyncRequested ? 1 : 0);
  if (!vsyncSet) {
    GAMEENGINE_WARN(std::format("Failed to {} VSync: {}",
                                vsyncRequested ? "enable" : "disable", SDL_GetError()));
  }

  m_timestepManager = std::make_unique<TimestepManager>(static_cast<float>(maxFps));

  int vsync = 0;
  const bool vsyncActive = vsyncSet && vsyncRequested &&
                           SDL_GetRenderVSync(mp_renderer.get(), &vsync) && vsync > 0;

  // Frames are only presented when the idle throttle allows, so a loop
  // iteration without a draw never blocks on VSync. Pace it in software.
  m_timestepManager->setSoftwareFrameLimiting(true);

  GAMEENGINE_INFO(std::format("TimestepManager created: {} FPS, software frame limiting, VSync {}",
                              m_timestepManager->getTargetFPS(),
                              vsyncActive ? "active" : "inactive"));
}

void GameEngine::handleEvents() {
  InputManager& inputMgr = InputManager::Instance();

  // Clear previous frame's pressed keys before processing new events
  inputMgr.clearFrameInput();

  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
      case SDL_EVENT_QUIT:
        GAMEENGINE_INFO("Shutting down! {}===]>");
        setRunning(false);
        break;

      case SDL_EVENT_KEY_DOWN:
        onKeyDown(event);
        inputMgr.onKeyDown(event);
        break;
      case SDL_EVENT_KEY_UP:
        inputMgr.onKeyUp(event);
        break;

      case SDL_EVENT_WINDOW_RESIZED:
        onWindowResize(event);
        break;

      default:
        break;
    }
  }
}

void GameEngine::onKeyDown(const SDL_Event& event) {
  switch (event.key.key) {
    case SDLK_ESCAPE:
      GAMEENGINE_INFO("Escape pressed, quitting");
      setRunning(false);
      break;
    case SDLK_1:
    case SDLK_2:
    case SDLK_3:
      if (!event.key.repeat) {
        toggleAnimation(event.key.key);
      }
      break;
    default:
      break;
  }
}

void GameEngine::toggleAnimation(SDL_Keycode key) {
  if (!m_renderController) {
    return;
  }

  const Wayfarer::AnimationSettings current = m_renderController->getAnimation().getSettings();
  Wayfarer::AnimationSettingsPatch patch;
  if (key == SDLK_1) {
    patch.cloudsEnabled = !current.cloudsEnabled;
  } else if (key == SDLK_2) {
    patch.wavesEnabled = !current.wavesEnabled;
  } else {
    patch.riverEnabled = !current.riverEnabled;
  }
  m_renderController->setAnimationSettings(patch);

  const auto& updated = m_renderController->getAnimation().getSettings();
  GAMEENGINE_INFO(std::format("Animation: clouds {}, waves {}, river {}",
                              updated.cloudsEnabled ? "on" : "off",
                              updated.wavesEnabled ? "on" : "off",
                              updated.riverEnabled ? "on" : "off"));
}

void GameEngine::onWindowResize(const SDL_Event& event) {
  m_windowWidth = event.window.data1;
  m_windowHeight = event.window.data2;
  GAMEENGINE_INFO(std::format("Window resized to {}x{}", m_windowWidth, m_windowHeight));

  if (m_renderController) {
    m_renderController->resize(m_windowWidth, m_windowHeight);
  }
}

void GameEngine::update() {
  if (!m_renderController) {
    return;
  }

  const int64_t now = Wayfarer::EngineWorker::nowMs();
  for (Wayfarer::Direction direction : InputManager::Instance().getPressedDirections()) {
    m_renderController->requestMove(direction, now);
  }
}

void GameEngine::render() {
  if (m_renderController) {
    m_renderController->tick(Wayfarer::EngineWorker::nowMs());
  }
}

void GameEngine::clean() {
  if (m_cleaned) {
    return;
  }
  m_cleaned = true;
  m_running = false;

  GAMEENGINE_INFO("Stopping render controller...");
  if (m_renderController) {
    m_renderController->stop();
    GAMEENGINE_INFO(std::format("Frames drawn: {}, moves sent: {}, moves dropped: {}",
                                m_renderController->getFramesDrawn(),
                                m_renderController->getMovesSent(),
                                m_renderController->getMovesDropped()));
  }

  GAMEENGINE_INFO("Stopping engine worker...");
  if (m_worker) {
    m_worker->stop();
  }
  if (m_events) {
    m_events->close();
  }

  if (m_statusController) {
    m_statusController->unsubscribe();
  }
  m_broadcaster.clearAllHandlers();

  m_renderController.reset();
  m_statusController.reset();
  m_worker.reset();
  m_commands.reset();
  m_events.reset();

  InputManager::Instance().clean();

  // Renderer before window
  mp_renderer.reset();
  mp_window.reset();

  if (m_sdlInitialized) {
    GAMEENGINE_INFO("Calling SDL_Quit...");
    SDL_Quit();
    m_sdlInitialized = false;
  }
  GAMEENGINE_INFO("Cleanup complete");
}
