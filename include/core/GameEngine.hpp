/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "controllers/render/RenderController.hpp"
#include "controllers/ui/StatusController.hpp"
#include "core/TimestepManager.hpp"
#include "engine/EngineWorker.hpp"
#include "events/StateBroadcaster.hpp"
#include "managers/SettingsManager.hpp"
#include <SDL3/SDL.h>
#include <atomic>
#include <memory>
#include <string_view>

/**
 * @brief Application shell: owns the window, the engine worker and the
 *        foreground controllers
 *
 * Lifecycle: init() -> (handleEvents(), update(), render())* -> clean()
 *
 * The engine worker runs on its own thread and only talks to the foreground
 * through the command/event channels. Everything else here runs on the main
 * thread, which also owns SDL.
 */
class GameEngine {
 public:
  ~GameEngine() = default;

  static GameEngine& Instance() {
    static GameEngine instance;
    return instance;
  }

  /**
   * @brief Create the window and renderer, then start the engine worker
   * @param title Window title until the first status line arrives
   * @return false on any SDL or worker failure (call clean() regardless)
   */
  bool init(std::string_view title);

  void handleEvents();
  void update();
  void render();
  void clean();

  void setRunning(bool running) { m_running = running; }
  bool isRunning() const { return m_running; }

  TimestepManager& getTimestepManager() { return *m_timestepManager; }

  SDL_Renderer* getRenderer() const noexcept { return mp_renderer.get(); }
  SDL_Window* getWindow() const noexcept { return mp_window.get(); }

 private:
  GameEngine() = default;
  GameEngine(const GameEngine&) = delete;
  GameEngine& operator=(const GameEngine&) = delete;

  void onKeyDown(const SDL_Event& event);
  void onWindowResize(const SDL_Event& event);
  void toggleAnimation(SDL_Keycode key);
  void configureVSync(bool vsyncRequested, int maxFps);

  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{
      nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{
      nullptr, SDL_DestroyRenderer};

  Wayfarer::GameSettings m_settings{};
  Wayfarer::StateBroadcaster m_broadcaster{};
  std::shared_ptr<Wayfarer::CommandChannel> m_commands{};
  std::shared_ptr<Wayfarer::EventChannel> m_events{};
  std::unique_ptr<Wayfarer::EngineWorker> m_worker{};
  std::unique_ptr<RenderController> m_renderController{};
  std::unique_ptr<StatusController> m_statusController{};
  std::unique_ptr<TimestepManager> m_timestepManager{};

  int m_windowWidth{0};
  int m_windowHeight{0};
  std::atomic<bool> m_running{false};
  bool m_sdlInitialized{false};
  bool m_cleaned{false};
};

#endif  // GAME_ENGINE_HPP
