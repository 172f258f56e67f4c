/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "engine/StateEngine.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

namespace Wayfarer {

StateEngine::StateEngine(WorldMapPtr worldMap)
    : m_worldMap(std::move(worldMap)) {
    if (!m_worldMap) {
        throw std::invalid_argument("StateEngine requires a world map");
    }
    if (!m_worldMap->inBounds(SPAWN_POSITION) ||
        !TerrainTable::isWalkable(m_worldMap->at(SPAWN_POSITION))) {
        throw std::invalid_argument("Spawn cell (2,2) must be an in-bounds walkable cell");
    }

    m_state.position = SPAWN_POSITION;
    m_state.currentTerrain = m_worldMap->at(SPAWN_POSITION);
}

EventBatch StateEngine::handleCommand(const EngineCommand& command, int64_t nowMs) {
    if (command.task == EngineTask::START) {
        return handleStart(command, nowMs);
    }
    if (command.task == EngineTask::GAME_UPDATE) {
        return handleMove(command, nowMs);
    }

    STATEENGINE_ERROR(std::format("Unknown task: {}", command.task));
    EventBatch events;
    events.push_back(makeErrorEvent(std::format("Unknown task: {}", command.task)));
    return events;
}

EventBatch StateEngine::handleStart(const EngineCommand& command, int64_t nowMs) {
    int stepDelay = command.delayMs.value_or(DEFAULT_STEP_DELAY_MS);
    if (stepDelay < 0) {
        STATEENGINE_WARN(std::format("Negative step delay {} clamped to 0", stepDelay));
        stepDelay = 0;
    }

    m_state = PlayerState{};
    m_state.position = SPAWN_POSITION;
    m_state.facing = Direction::Down;
    m_state.currentTerrain = m_worldMap->at(SPAWN_POSITION);
    m_state.idleState = IdleState::Active;
    m_state.lastActivityMs = nowMs;
    m_state.statusMessage = "Game initialized";
    m_state.status = EngineStatus::Processing;
    m_state.isStarted = true;

    m_progress.start(stepDelay, nowMs);

    STATEENGINE_INFO(std::format("Game initialized at ({},{}) on {}, step delay {}ms",
                                 SPAWN_POSITION.x, SPAWN_POSITION.y,
                                 TerrainTable::displayName(m_state.currentTerrain), stepDelay));

    EventBatch events;
    events.push_back(makeStateEvent(EngineStatus::Processing, m_state.statusMessage, true));
    return events;
}

EventBatch StateEngine::handleMove(const EngineCommand& command, int64_t nowMs) {
    EventBatch events;

    if (!m_state.isStarted) {
        events.push_back(makeErrorEvent("Cannot move before the game is started"));
        return events;
    }
    if (!command.direction) {
        events.push_back(makeErrorEvent("Missing direction for GAME_UPDATE"));
        return events;
    }

    const Direction direction = *command.direction;
    if (!isMovementDirection(direction)) {
        events.push_back(makeErrorEvent(std::format("Invalid direction: {}", toString(direction))));
        return events;
    }

    // Any accepted command counts as activity
    m_state.lastActivityMs = nowMs;
    m_state.idleState = IdleState::Active;
    m_state.facing = direction;

    const Position step = unitVector(direction);
    const Position target{m_state.position.x + step.x, m_state.position.y + step.y};
    const TerrainKind fromTerrain = m_worldMap->at(m_state.position);

    const bool inBounds = m_worldMap->inBounds(target);
    const bool walkable = inBounds && TerrainTable::isWalkable(m_worldMap->at(target));

    if (!walkable) {
        const std::string_view blocker =
            inBounds ? TerrainTable::displayName(m_worldMap->at(target)) : "boundary";
        m_state.statusMessage =
            std::format("Cannot move {} - blocked by {}", toString(direction), blocker);
        m_state.status = EngineStatus::Error;

        STATEENGINE_DEBUG(m_state.statusMessage);
        events.push_back(makeStateEvent(EngineStatus::Error, m_state.statusMessage, true));
        return events;
    }

    m_state.position = target;
    m_state.currentTerrain = m_worldMap->at(target);
    m_state.statusMessage = std::format("Moved {} from {} to {}", toString(direction),
                                        TerrainTable::displayName(fromTerrain),
                                        TerrainTable::displayName(m_state.currentTerrain));
    m_state.status = EngineStatus::Processing;

    STATEENGINE_DEBUG(m_state.statusMessage);
    events.push_back(makeStateEvent(EngineStatus::Processing, m_state.statusMessage, true));
    return events;
}

std::optional<EngineEvent> StateEngine::checkIdle(int64_t nowMs) {
    if (!m_state.isStarted) {
        return std::nullopt;
    }

    const IdleState computed = idleStateForElapsed(nowMs - m_state.lastActivityMs);
    if (computed == m_state.idleState) {
        return std::nullopt;
    }

    m_state.idleState = computed;
    m_state.statusMessage = std::format("State changed to {}", toString(computed));
    m_state.status = EngineStatus::Processing;

    STATEENGINE_DEBUG(m_state.statusMessage);
    return makeStateEvent(EngineStatus::Processing, m_state.statusMessage, false);
}

EventBatch StateEngine::pollProgress(int64_t nowMs) {
    EventBatch events;
    m_progress.poll(nowMs, events);
    return events;
}

EngineEvent StateEngine::makeStateEvent(EngineStatus status, std::string message,
                                        bool includeMap) const {
    EngineEvent event;
    event.status = status;
    event.message = std::move(message);
    event.snapshot = m_state;
    if (includeMap) {
        event.worldMap = m_worldMap;
    }
    return event;
}

EngineEvent StateEngine::makeErrorEvent(std::string message) {
    EngineEvent event;
    event.status = EngineStatus::Error;
    event.message = std::move(message);
    return event;
}

} // namespace Wayfarer
