/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "engine/ProgressTask.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Wayfarer {

void ProgressTask::start(int stepDelayMs, int64_t nowMs) {
    if (m_active) {
        STATEENGINE_DEBUG(std::format("Progress task restarted after {} of {} steps",
                                      m_step, TOTAL_STEPS));
    }
    m_active = true;
    m_step = 0;
    m_stepDelayMs = std::max(stepDelayMs, 0);
    m_nextDeadlineMs = nowMs + m_stepDelayMs;
}

void ProgressTask::cancel() {
    m_active = false;
}

void ProgressTask::poll(int64_t nowMs, EventBatch& out) {
    while (m_active && nowMs >= m_nextDeadlineMs) {
        ++m_step;

        EngineEvent tick;
        tick.status = EngineStatus::Processing;
        tick.progressStep = m_step;
        tick.progressTotal = TOTAL_STEPS;
        out.push_back(std::move(tick));

        if (m_step >= TOTAL_STEPS) {
            m_active = false;

            EngineEvent done;
            done.status = EngineStatus::Finished;
            done.progressResult = static_cast<int64_t>(m_stepDelayMs) * TOTAL_STEPS;
            done.message = std::format("Task finished with time = {}", m_stepDelayMs);
            out.push_back(std::move(done));

            STATEENGINE_INFO(std::format("Progress task finished, result {}",
                                         *out.back().progressResult));
            break;
        }

        m_nextDeadlineMs += m_stepDelayMs;
    }
}

std::optional<int64_t> ProgressTask::nextDeadline() const {
    if (!m_active) {
        return std::nullopt;
    }
    return m_nextDeadlineMs;
}

} // namespace Wayfarer
