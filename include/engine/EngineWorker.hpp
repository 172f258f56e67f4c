/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENGINE_WORKER_HPP
#define ENGINE_WORKER_HPP

/**
 * @file EngineWorker.hpp
 * @brief Background execution context hosting the StateEngine
 *
 * Threading model:
 * - One dedicated thread owns the StateEngine; nothing else touches it once
 *   start() has returned, so every PlayerState mutation is sequential.
 * - Inbound commands and outbound events travel over two Channels; no other
 *   memory is shared with the foreground.
 * - Timers (idle decay every 500ms, progress steps) are deadlines. The thread
 *   blocks on the command channel until the earliest deadline, so commands
 *   are handled while a progress continuation is pending.
 *
 * A worker is single-use: stop() closes the command channel, joins the thread
 * and guarantees nothing is published afterwards.
 */

#include "core/Channel.hpp"
#include "engine/EngineTypes.hpp"
#include "engine/StateEngine.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>

namespace Wayfarer {

using CommandChannel = Channel<EngineCommand>;
using EventChannel = Channel<EngineEvent>;

class EngineWorker {
public:
    EngineWorker(std::shared_ptr<CommandChannel> commands,
                 std::shared_ptr<EventChannel> events,
                 WorldMapPtr worldMap = WorldMap::reference());
    ~EngineWorker();

    EngineWorker(const EngineWorker&) = delete;
    EngineWorker& operator=(const EngineWorker&) = delete;

    /**
     * @brief Spawn the background thread
     * @return false if already running or previously stopped
     */
    bool start();

    /**
     * @brief Close the command channel, cancel timers and join the thread
     * @note Safe to call multiple times
     */
    void stop();

    [[nodiscard]] bool isRunning() const noexcept {
        return m_running.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t getCommandsHandled() const noexcept {
        return m_commandsHandled.load(std::memory_order_relaxed);
    }

    /**
     * @brief Monotonic clock in milliseconds shared by both contexts
     */
    [[nodiscard]] static int64_t nowMs();

private:
    void run();
    void handleCommand(const EngineCommand& command);
    void fireDueTimers(int64_t nowMs);
    [[nodiscard]] int64_t nextWakeMs(int64_t nowMs) const;

    void publish(EngineEvent event);
    template <typename Batch> void publishAll(Batch& events) {
        for (auto& event : events) {
            publish(std::move(event));
        }
    }

    std::shared_ptr<CommandChannel> m_commands;
    std::shared_ptr<EventChannel> m_events;
    StateEngine m_engine;

    std::thread m_thread{};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<size_t> m_commandsHandled{0};

    // Worker-thread only
    std::optional<int64_t> m_nextIdleCheckMs{};
    bool m_eventChannelLost{false};

    static constexpr int64_t MAX_WAIT_MS = 1000;
};

} // namespace Wayfarer

#endif // ENGINE_WORKER_HPP
