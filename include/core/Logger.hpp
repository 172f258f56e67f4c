/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Wayfarer {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds - console output
class Logger {
private:
  static std::mutex s_logMutex;

public:

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Wayfarer - [%s] %s: %s\n", system, getLevelString(level), message);
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
    default:
      return "UNKNOWN";
    }
  }
};

#define WAYFARER_CRITICAL(system, msg)                                         \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::CRITICAL, system, msg)
#define WAYFARER_ERROR(system, msg)                                            \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::ERROR_LEVEL, system, msg)
#define WAYFARER_WARN(system, msg)                                             \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::WARNING, system, msg)
#define WAYFARER_INFO(system, msg)                                             \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::INFO, system, msg)
#define WAYFARER_DEBUG(system, msg)                                            \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::DEBUG_LEVEL, system, msg)

inline std::mutex Logger::s_logMutex{};

#else
// Release builds - CRITICAL and ERROR go to the rotating file log (Logger.cpp)
class Logger {
private:
public:

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define WAYFARER_CRITICAL(system, msg)                                         \
  Wayfarer::Logger::Log("CRITICAL", system, msg)

#define WAYFARER_ERROR(system, msg)                                            \
  Wayfarer::Logger::Log("ERROR", system, msg)

#define WAYFARER_WARN(system, msg) ((void)0)  // Zero overhead
#define WAYFARER_INFO(system, msg) ((void)0)  // Zero overhead
#define WAYFARER_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each system

// Core Systems
#define GAMEENGINE_CRITICAL(msg) WAYFARER_CRITICAL("GameEngine", msg)
#define GAMEENGINE_ERROR(msg) WAYFARER_ERROR("GameEngine", msg)
#define GAMEENGINE_WARN(msg) WAYFARER_WARN("GameEngine", msg)
#define GAMEENGINE_INFO(msg) WAYFARER_INFO("GameEngine", msg)
#define GAMEENGINE_DEBUG(msg) WAYFARER_DEBUG("GameEngine", msg)

// Authoritative state and its background context
#define STATEENGINE_CRITICAL(msg) WAYFARER_CRITICAL("StateEngine", msg)
#define STATEENGINE_ERROR(msg) WAYFARER_ERROR("StateEngine", msg)
#define STATEENGINE_WARN(msg) WAYFARER_WARN("StateEngine", msg)
#define STATEENGINE_INFO(msg) WAYFARER_INFO("StateEngine", msg)
#define STATEENGINE_DEBUG(msg) WAYFARER_DEBUG("StateEngine", msg)

#define WORKER_CRITICAL(msg) WAYFARER_CRITICAL("EngineWorker", msg)
#define WORKER_ERROR(msg) WAYFARER_ERROR("EngineWorker", msg)
#define WORKER_WARN(msg) WAYFARER_WARN("EngineWorker", msg)
#define WORKER_INFO(msg) WAYFARER_INFO("EngineWorker", msg)
#define WORKER_DEBUG(msg) WAYFARER_DEBUG("EngineWorker", msg)

#define WORLD_CRITICAL(msg) WAYFARER_CRITICAL("WorldMap", msg)
#define WORLD_ERROR(msg) WAYFARER_ERROR("WorldMap", msg)
#define WORLD_WARN(msg) WAYFARER_WARN("WorldMap", msg)
#define WORLD_INFO(msg) WAYFARER_INFO("WorldMap", msg)
#define WORLD_DEBUG(msg) WAYFARER_DEBUG("WorldMap", msg)

// Foreground systems
#define RENDERCTL_CRITICAL(msg) WAYFARER_CRITICAL("RenderController", msg)
#define RENDERCTL_ERROR(msg) WAYFARER_ERROR("RenderController", msg)
#define RENDERCTL_WARN(msg) WAYFARER_WARN("RenderController", msg)
#define RENDERCTL_INFO(msg) WAYFARER_INFO("RenderController", msg)
#define RENDERCTL_DEBUG(msg) WAYFARER_DEBUG("RenderController", msg)

#define ANIMATION_CRITICAL(msg) WAYFARER_CRITICAL("Animation", msg)
#define ANIMATION_ERROR(msg) WAYFARER_ERROR("Animation", msg)
#define ANIMATION_WARN(msg) WAYFARER_WARN("Animation", msg)
#define ANIMATION_INFO(msg) WAYFARER_INFO("Animation", msg)
#define ANIMATION_DEBUG(msg) WAYFARER_DEBUG("Animation", msg)

#define RENDERER_CRITICAL(msg) WAYFARER_CRITICAL("TerrainRenderer", msg)
#define RENDERER_ERROR(msg) WAYFARER_ERROR("TerrainRenderer", msg)
#define RENDERER_WARN(msg) WAYFARER_WARN("TerrainRenderer", msg)
#define RENDERER_INFO(msg) WAYFARER_INFO("TerrainRenderer", msg)
#define RENDERER_DEBUG(msg) WAYFARER_DEBUG("TerrainRenderer", msg)

#define BROADCAST_CRITICAL(msg) WAYFARER_CRITICAL("StateBroadcaster", msg)
#define BROADCAST_ERROR(msg) WAYFARER_ERROR("StateBroadcaster", msg)
#define BROADCAST_WARN(msg) WAYFARER_WARN("StateBroadcaster", msg)
#define BROADCAST_INFO(msg) WAYFARER_INFO("StateBroadcaster", msg)
#define BROADCAST_DEBUG(msg) WAYFARER_DEBUG("StateBroadcaster", msg)

#define STATUS_CRITICAL(msg) WAYFARER_CRITICAL("StatusController", msg)
#define STATUS_ERROR(msg) WAYFARER_ERROR("StatusController", msg)
#define STATUS_WARN(msg) WAYFARER_WARN("StatusController", msg)
#define STATUS_INFO(msg) WAYFARER_INFO("StatusController", msg)
#define STATUS_DEBUG(msg) WAYFARER_DEBUG("StatusController", msg)

#define INPUT_CRITICAL(msg) WAYFARER_CRITICAL("InputManager", msg)
#define INPUT_ERROR(msg) WAYFARER_ERROR("InputManager", msg)
#define INPUT_WARN(msg) WAYFARER_WARN("InputManager", msg)
#define INPUT_INFO(msg) WAYFARER_INFO("InputManager", msg)
#define INPUT_DEBUG(msg) WAYFARER_DEBUG("InputManager", msg)

#define SETTINGS_CRITICAL(msg) WAYFARER_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) WAYFARER_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) WAYFARER_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) WAYFARER_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) WAYFARER_DEBUG("SettingsManager", msg)

} // namespace Wayfarer

#endif // LOGGER_HPP
