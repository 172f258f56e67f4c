/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "engine/EngineWorker.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <stdexcept>

#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace Wayfarer {

EngineWorker::EngineWorker(std::shared_ptr<CommandChannel> commands,
                           std::shared_ptr<EventChannel> events,
                           WorldMapPtr worldMap)
    : m_commands(std::move(commands))
    , m_events(std::move(events))
    , m_engine(std::move(worldMap))
{
    if (!m_commands || !m_events) {
        throw std::invalid_argument("EngineWorker requires both channels");
    }
}

EngineWorker::~EngineWorker() {
    stop();
}

int64_t EngineWorker::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

bool EngineWorker::start() {
    if (m_running.load(std::memory_order_acquire)) {
        WORKER_WARN("EngineWorker already running");
        return false;
    }
    if (m_stopRequested.load(std::memory_order_acquire) || m_commands->isClosed()) {
        WORKER_ERROR("EngineWorker cannot be restarted after stop()");
        return false;
    }

    m_running.store(true, std::memory_order_release);
    m_thread = std::thread([this]() {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), "EngineWorker");
#elif defined(__APPLE__)
        pthread_setname_np("EngineWorker");
#endif
        run();
    });

    WORKER_INFO("Engine worker started");
    return true;
}

void EngineWorker::stop() {
    m_stopRequested.store(true, std::memory_order_release);
    m_commands->close();  // Wakes the worker if it is blocked on receive

    if (m_thread.joinable()) {
        m_thread.join();
        WORKER_INFO(std::format("Engine worker stopped after {} commands",
                                m_commandsHandled.load(std::memory_order_relaxed)));
    }
    m_running.store(false, std::memory_order_release);
}

void EngineWorker::run() {
    while (!m_stopRequested.load(std::memory_order_acquire)) {
        fireDueTimers(nowMs());

        const int64_t wakeMs = nextWakeMs(nowMs());
        const auto deadline =
            std::chrono::steady_clock::time_point(std::chrono::milliseconds(wakeMs));

        EngineCommand command;
        if (m_commands->receiveUntil(command, deadline)) {
            handleCommand(command);
        } else if (m_commands->isClosed()) {
            break;
        }
    }

    // Timers die with the loop; nothing is published past this point
    m_nextIdleCheckMs.reset();
}

void EngineWorker::handleCommand(const EngineCommand& command) {
    if (m_stopRequested.load(std::memory_order_acquire)) {
        return;
    }

    const int64_t now = nowMs();
    try {
        auto events = m_engine.handleCommand(command, now);
        publishAll(events);

        if (command.task == EngineTask::START && m_engine.isStarted()) {
            // (Re)start the idle-decay timer
            m_nextIdleCheckMs = now + StateEngine::IDLE_CHECK_INTERVAL_MS;
        }
    } catch (const std::exception& e) {
        WORKER_ERROR(std::format("Exception handling task {}: {}", command.task, e.what()));
        EngineEvent error;
        error.status = EngineStatus::Error;
        error.message = e.what();
        publish(std::move(error));
    }

    m_commandsHandled.fetch_add(1, std::memory_order_relaxed);
}

void EngineWorker::fireDueTimers(int64_t now) {
    auto progressEvents = m_engine.pollProgress(now);
    publishAll(progressEvents);

    if (m_nextIdleCheckMs && *m_nextIdleCheckMs <= now) {
        if (auto changed = m_engine.checkIdle(now)) {
            publish(std::move(*changed));
        }

        *m_nextIdleCheckMs += StateEngine::IDLE_CHECK_INTERVAL_MS;
        if (*m_nextIdleCheckMs <= now) {
            // Fell behind by more than a period; resume the cadence from now
            m_nextIdleCheckMs = now + StateEngine::IDLE_CHECK_INTERVAL_MS;
        }
    }
}

int64_t EngineWorker::nextWakeMs(int64_t now) const {
    int64_t wake = now + MAX_WAIT_MS;
    if (m_nextIdleCheckMs) {
        wake = std::min(wake, *m_nextIdleCheckMs);
    }
    if (auto progressAt = m_engine.nextProgressDeadline()) {
        wake = std::min(wake, *progressAt);
    }
    return wake;
}

void EngineWorker::publish(EngineEvent event) {
    if (m_stopRequested.load(std::memory_order_acquire)) {
        return;
    }
    if (!m_events->send(std::move(event)) && !m_eventChannelLost) {
        m_eventChannelLost = true;
        WORKER_WARN("Event channel closed; further events are dropped");
    }
}

} // namespace Wayfarer
