/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PROGRESS_TASK_HPP
#define PROGRESS_TASK_HPP

#include "engine/EngineTypes.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <optional>

namespace Wayfarer {

using EventBatch = boost::container::small_vector<EngineEvent, 4>;

/**
 * @brief Fixed-length demo sequence that runs beside movement
 *
 * The task is a deadline-driven continuation rather than a blocking loop:
 * the owner asks for nextDeadline(), sleeps until then (handling other
 * messages meanwhile) and calls poll(). Each due step emits one Processing
 * event; the last step is followed by one Finished event whose result is
 * stepDelay * TOTAL_STEPS.
 */
class ProgressTask {
public:
    static constexpr int TOTAL_STEPS = 100;

    /**
     * @brief (Re)start the sequence; any sequence in flight is abandoned
     * @param stepDelayMs delay between steps, negative values are clamped to 0
     * @param nowMs current time in milliseconds
     */
    void start(int stepDelayMs, int64_t nowMs);

    void cancel();

    /**
     * @brief Emit every step that is due at @p nowMs, in order
     */
    void poll(int64_t nowMs, EventBatch& out);

    [[nodiscard]] bool isActive() const noexcept { return m_active; }
    [[nodiscard]] std::optional<int64_t> nextDeadline() const;
    [[nodiscard]] int getCompletedSteps() const noexcept { return m_step; }
    [[nodiscard]] int getStepDelayMs() const noexcept { return m_stepDelayMs; }

private:
    bool m_active{false};
    int m_step{0};
    int m_stepDelayMs{0};
    int64_t m_nextDeadlineMs{0};
};

} // namespace Wayfarer

#endif // PROGRESS_TASK_HPP
