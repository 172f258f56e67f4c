/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENGINE_TYPES_HPP
#define ENGINE_TYPES_HPP

/**
 * @file EngineTypes.hpp
 * @brief Data model shared by the state engine and the render side
 *
 * Everything here is a plain value type: snapshots and messages are copied
 * across the channel, never shared mutably.
 */

#include "world/WorldMap.hpp"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace Wayfarer {

// Up/Down/Left/Right move the player; Back/Front only select a sprite pose
enum class Direction : uint8_t {
    Up = 0,
    Down,
    Left,
    Right,
    Back,
    Front
};

[[nodiscard]] std::string_view toString(Direction direction);
[[nodiscard]] std::optional<Direction> directionFromString(std::string_view text);
[[nodiscard]] bool isMovementDirection(Direction direction);

/**
 * @brief Unit grid step for a movement direction (y grows downward)
 * @return (0,0) for facing-only directions
 */
[[nodiscard]] Position unitVector(Direction direction);

/**
 * Coarse activity classification, ordered by increasing inactivity.
 */
enum class IdleState : uint8_t {
    Active = 0,
    Resting,
    Idle,
    Sleeping
};

// Milliseconds since last activity at which each state begins
struct IdleThresholds {
    static constexpr int64_t RESTING = 200;
    static constexpr int64_t IDLE = 5000;
    static constexpr int64_t SLEEPING = 30000;
};

[[nodiscard]] std::string_view toString(IdleState state);
[[nodiscard]] IdleState idleStateForElapsed(int64_t elapsedMs);

enum class EngineStatus : uint8_t {
    Idle = 0,
    Processing,
    Finished,
    Error
};

[[nodiscard]] std::string_view toString(EngineStatus status);

/**
 * Authoritative player state. Owned by StateEngine; everyone else holds copies.
 */
struct PlayerState {
    Position position{2, 2};
    Direction facing{Direction::Down};
    bool isMoving{false};
    TerrainKind currentTerrain{TerrainKind::Grassland};
    IdleState idleState{IdleState::Active};
    int64_t lastActivityMs{0};
    std::string statusMessage{};
    EngineStatus status{EngineStatus::Idle};
    bool isStarted{false};
};

// Task identifiers on the wire
namespace EngineTask {
inline constexpr std::string_view START = "START";
inline constexpr std::string_view GAME_UPDATE = "GAME_UPDATE";
} // namespace EngineTask

/**
 * Command sent from the render side to the engine.
 * The task is kept as text so an unrecognised task can be reported by name.
 */
struct EngineCommand {
    std::string task;
    std::optional<Direction> direction{};
    std::optional<int> delayMs{};

    [[nodiscard]] static EngineCommand start(std::optional<int> delayMs = std::nullopt);
    [[nodiscard]] static EngineCommand move(Direction direction);
};

/**
 * Notification sent from the engine to the render side. Only the fields
 * relevant to the cause are populated.
 */
struct EngineEvent {
    EngineStatus status{EngineStatus::Idle};
    std::optional<std::string> message{};
    std::optional<PlayerState> snapshot{};
    WorldMapPtr worldMap{};
    std::optional<int> progressStep{};
    std::optional<int> progressTotal{};
    std::optional<int64_t> progressResult{};
};

inline std::ostream& operator<<(std::ostream& os, const Direction& direction) {
    return os << toString(direction);
}

inline std::ostream& operator<<(std::ostream& os, const IdleState& state) {
    return os << toString(state);
}

inline std::ostream& operator<<(std::ostream& os, const EngineStatus& status) {
    return os << toString(status);
}

} // namespace Wayfarer

#endif // ENGINE_TYPES_HPP
