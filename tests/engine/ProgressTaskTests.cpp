/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ProgressTaskTests
#include <boost/test/unit_test.hpp>

#include "engine/ProgressTask.hpp"

using namespace Wayfarer;

namespace {

int countStatus(const EventBatch& events, EngineStatus status) {
    int count = 0;
    for (const auto& event : events) {
        if (event.status == status) {
            ++count;
        }
    }
    return count;
}

} // namespace

BOOST_AUTO_TEST_SUITE(ProgressTaskTests)

BOOST_AUTO_TEST_CASE(TestInactiveByDefault) {
    ProgressTask task;
    BOOST_CHECK(!task.isActive());
    BOOST_CHECK(!task.nextDeadline().has_value());

    EventBatch events;
    task.poll(1000000, events);
    BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_CASE(TestStepsFollowDeadlines) {
    ProgressTask task;
    task.start(10, 1000);
    BOOST_REQUIRE(task.nextDeadline().has_value());
    BOOST_CHECK_EQUAL(*task.nextDeadline(), 1010);

    EventBatch events;
    task.poll(1009, events);
    BOOST_CHECK(events.empty());

    task.poll(1010, events);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].status, EngineStatus::Processing);
    BOOST_CHECK_EQUAL(*events[0].progressStep, 1);
    BOOST_CHECK_EQUAL(*events[0].progressTotal, ProgressTask::TOTAL_STEPS);
    BOOST_CHECK_EQUAL(*task.nextDeadline(), 1020);
}

BOOST_AUTO_TEST_CASE(TestCatchUpEmitsEveryStepInOrder) {
    ProgressTask task;
    task.start(10, 0);

    EventBatch events;
    task.poll(55, events);
    BOOST_REQUIRE_EQUAL(events.size(), 5u);
    for (size_t i = 0; i < events.size(); ++i) {
        BOOST_CHECK_EQUAL(*events[i].progressStep, static_cast<int>(i) + 1);
    }
    BOOST_CHECK_EQUAL(task.getCompletedSteps(), 5);
}

BOOST_AUTO_TEST_CASE(TestFinishesExactlyOnce) {
    ProgressTask task;
    task.start(10, 0);

    EventBatch events;
    task.poll(10 * ProgressTask::TOTAL_STEPS, events);
    BOOST_CHECK_EQUAL(countStatus(events, EngineStatus::Processing), ProgressTask::TOTAL_STEPS);
    BOOST_CHECK_EQUAL(countStatus(events, EngineStatus::Finished), 1);

    const auto& done = events.back();
    BOOST_CHECK_EQUAL(done.status, EngineStatus::Finished);
    BOOST_REQUIRE(done.progressResult.has_value());
    BOOST_CHECK_EQUAL(*done.progressResult, 1000);
    BOOST_CHECK(!task.isActive());

    EventBatch later;
    task.poll(1000000, later);
    BOOST_CHECK(later.empty());
}

BOOST_AUTO_TEST_CASE(TestZeroAndNegativeDelay) {
    ProgressTask task;
    task.start(-25, 500);
    BOOST_CHECK_EQUAL(task.getStepDelayMs(), 0);

    EventBatch events;
    task.poll(500, events);
    BOOST_CHECK_EQUAL(countStatus(events, EngineStatus::Finished), 1);
    BOOST_CHECK_EQUAL(*events.back().progressResult, 0);
}

BOOST_AUTO_TEST_CASE(TestRestartAbandonsSequence) {
    ProgressTask task;
    task.start(10, 0);

    EventBatch events;
    task.poll(30, events);
    BOOST_CHECK_EQUAL(task.getCompletedSteps(), 3);

    task.start(20, 30);
    BOOST_CHECK_EQUAL(task.getCompletedSteps(), 0);
    BOOST_CHECK_EQUAL(*task.nextDeadline(), 50);

    events.clear();
    task.poll(50, events);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(*events[0].progressStep, 1);
}

BOOST_AUTO_TEST_CASE(TestCancel) {
    ProgressTask task;
    task.start(10, 0);
    task.cancel();
    BOOST_CHECK(!task.isActive());

    EventBatch events;
    task.poll(5000, events);
    BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_SUITE_END()
