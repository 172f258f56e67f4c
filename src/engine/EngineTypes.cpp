/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "engine/EngineTypes.hpp"

namespace Wayfarer {

std::string_view toString(Direction direction) {
    switch (direction) {
        case Direction::Up:    return "up";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
        case Direction::Back:  return "back";
        case Direction::Front: return "front";
        default: return "unknown";
    }
}

std::optional<Direction> directionFromString(std::string_view text) {
    if (text == "up") return Direction::Up;
    if (text == "down") return Direction::Down;
    if (text == "left") return Direction::Left;
    if (text == "right") return Direction::Right;
    if (text == "back") return Direction::Back;
    if (text == "front") return Direction::Front;
    return std::nullopt;
}

bool isMovementDirection(Direction direction) {
    return direction == Direction::Up || direction == Direction::Down ||
           direction == Direction::Left || direction == Direction::Right;
}

Position unitVector(Direction direction) {
    switch (direction) {
        case Direction::Up:    return {0, -1};
        case Direction::Down:  return {0, 1};
        case Direction::Left:  return {-1, 0};
        case Direction::Right: return {1, 0};
        default: return {0, 0};
    }
}

std::string_view toString(IdleState state) {
    switch (state) {
        case IdleState::Active:   return "active";
        case IdleState::Resting:  return "resting";
        case IdleState::Idle:     return "idle";
        case IdleState::Sleeping: return "sleeping";
        default: return "active";
    }
}

IdleState idleStateForElapsed(int64_t elapsedMs) {
    if (elapsedMs >= IdleThresholds::SLEEPING) {
        return IdleState::Sleeping;
    }
    if (elapsedMs >= IdleThresholds::IDLE) {
        return IdleState::Idle;
    }
    if (elapsedMs >= IdleThresholds::RESTING) {
        return IdleState::Resting;
    }
    return IdleState::Active;
}

std::string_view toString(EngineStatus status) {
    switch (status) {
        case EngineStatus::Idle:       return "STATUS_IDLE";
        case EngineStatus::Processing: return "STATUS_PROCESSING";
        case EngineStatus::Finished:   return "STATUS_FINISHED";
        case EngineStatus::Error:      return "STATUS_ERROR";
        default: return "STATUS_IDLE";
    }
}

EngineCommand EngineCommand::start(std::optional<int> delayMs) {
    EngineCommand command;
    command.task = std::string(EngineTask::START);
    command.delayMs = delayMs;
    return command;
}

EngineCommand EngineCommand::move(Direction direction) {
    EngineCommand command;
    command.task = std::string(EngineTask::GAME_UPDATE);
    command.direction = direction;
    return command;
}

} // namespace Wayfarer
