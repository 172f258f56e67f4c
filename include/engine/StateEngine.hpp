/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATE_ENGINE_HPP
#define STATE_ENGINE_HPP

/**
 * @file StateEngine.hpp
 * @brief Authoritative game state machine
 *
 * StateEngine owns the PlayerState and is the only code that mutates it.
 * It is deliberately single-threaded and clock-free: every entry point takes
 * the current time in milliseconds and returns the events it produced. The
 * EngineWorker runs it on the background context and forwards those events
 * over the channel; tests drive it directly with synthetic timestamps.
 *
 * Failures never throw out of handleCommand(). A blocked move, an unknown
 * task or a malformed command comes back as an Error-status event and the
 * player state is left as documented per case.
 */

#include "engine/EngineTypes.hpp"
#include "engine/ProgressTask.hpp"
#include "world/WorldMap.hpp"
#include <cstdint>
#include <optional>

namespace Wayfarer {

class StateEngine {
public:
    static constexpr int64_t IDLE_CHECK_INTERVAL_MS = 500;
    static constexpr int DEFAULT_STEP_DELAY_MS = 100;
    static constexpr Position SPAWN_POSITION{2, 2};

    /**
     * @throws std::invalid_argument if the spawn cell is outside the map or
     * not walkable
     */
    explicit StateEngine(WorldMapPtr worldMap = WorldMap::reference());

    /**
     * @brief Handle one command from the channel
     * @return events to publish, in order
     */
    [[nodiscard]] EventBatch handleCommand(const EngineCommand& command, int64_t nowMs);

    /**
     * @brief Idle-decay tick; recompute the idle state from elapsed inactivity
     * @return a Processing event if the state changed, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<EngineEvent> checkIdle(int64_t nowMs);

    /**
     * @brief Advance the demo progress task to @p nowMs
     */
    [[nodiscard]] EventBatch pollProgress(int64_t nowMs);

    [[nodiscard]] std::optional<int64_t> nextProgressDeadline() const {
        return m_progress.nextDeadline();
    }

    [[nodiscard]] bool isStarted() const noexcept { return m_state.isStarted; }
    [[nodiscard]] const PlayerState& getState() const noexcept { return m_state; }
    [[nodiscard]] const WorldMap& getWorldMap() const noexcept { return *m_worldMap; }
    [[nodiscard]] const WorldMapPtr& getWorldMapPtr() const noexcept { return m_worldMap; }
    [[nodiscard]] const ProgressTask& getProgressTask() const noexcept { return m_progress; }

private:
    EventBatch handleStart(const EngineCommand& command, int64_t nowMs);
    EventBatch handleMove(const EngineCommand& command, int64_t nowMs);

    // Event carrying a copy of the current state
    EngineEvent makeStateEvent(EngineStatus status, std::string message, bool includeMap) const;
    static EngineEvent makeErrorEvent(std::string message);

    WorldMapPtr m_worldMap;
    PlayerState m_state{};
    ProgressTask m_progress{};
};

} // namespace Wayfarer

#endif // STATE_ENGINE_HPP
