/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE TimestepManagerTests
#include <boost/test/unit_test.hpp>

#include "core/TimestepManager.hpp"
#include <chrono>

BOOST_AUTO_TEST_SUITE(TimestepManagerTests)

BOOST_AUTO_TEST_CASE(TestConstruction) {
    TimestepManager ts(60.0f);
    BOOST_CHECK_CLOSE(ts.getTargetFPS(), 60.0f, 0.001f);
    BOOST_CHECK_EQUAL(ts.getCurrentFPS(), 0.0f);
    BOOST_CHECK_EQUAL(ts.getFrameTimeMs(), 0u);
    BOOST_CHECK(!ts.isUsingSoftwareFrameLimiting());

    // Non-positive targets fall back to 60
    TimestepManager fallback(0.0f);
    BOOST_CHECK_CLOSE(fallback.getTargetFPS(), 60.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRecordFrameSmoothing) {
    TimestepManager ts(60.0f);

    // First sample seeds the average
    ts.recordFrame(0.02);
    BOOST_CHECK_CLOSE(ts.getCurrentFPS(), 50.0f, 0.01f);
    BOOST_CHECK_EQUAL(ts.getFrameTimeMs(), 20u);

    // Later samples move it by the smoothing factor
    ts.recordFrame(0.01);
    BOOST_CHECK_CLOSE(ts.getCurrentFPS(), 0.03f * 100.0f + 0.97f * 50.0f, 0.01f);
    BOOST_CHECK_EQUAL(ts.getFrameTimeMs(), 10u);

    // Zero duration updates frame time but not the rate
    const float before = ts.getCurrentFPS();
    ts.recordFrame(0.0);
    BOOST_CHECK_EQUAL(ts.getCurrentFPS(), before);
    BOOST_CHECK_EQUAL(ts.getFrameTimeMs(), 0u);
}

BOOST_AUTO_TEST_CASE(TestRecordFrameClampsRate) {
    TimestepManager ts(60.0f);
    ts.recordFrame(1e-6);
    BOOST_CHECK_CLOSE(ts.getCurrentFPS(), 1000.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestExcessiveFrameTime) {
    TimestepManager ts(50.0f);  // 20 ms budget

    ts.recordFrame(0.030);
    BOOST_CHECK(!ts.isFrameTimeExcessive());

    ts.recordFrame(0.045);
    BOOST_CHECK(ts.isFrameTimeExcessive());

    ts.setTargetFPS(10.0f);  // 100 ms budget
    BOOST_CHECK(!ts.isFrameTimeExcessive());
}

BOOST_AUTO_TEST_CASE(TestSetTargetFPS) {
    TimestepManager ts(60.0f);
    ts.setTargetFPS(144.0f);
    BOOST_CHECK_CLOSE(ts.getTargetFPS(), 144.0f, 0.001f);

    ts.setTargetFPS(-1.0f);
    BOOST_CHECK_CLOSE(ts.getTargetFPS(), 144.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestReset) {
    TimestepManager ts(60.0f);
    ts.recordFrame(0.016);
    BOOST_CHECK_GT(ts.getCurrentFPS(), 0.0f);

    ts.reset();
    BOOST_CHECK_EQUAL(ts.getCurrentFPS(), 0.0f);
    BOOST_CHECK_EQUAL(ts.getFrameTimeMs(), 0u);

    // First frame after a reset only re-arms the clock
    ts.startFrame();
    BOOST_CHECK_EQUAL(ts.getCurrentFPS(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestSoftwareFrameLimiting) {
    TimestepManager ts(50.0f);
    ts.setSoftwareFrameLimiting(true);
    BOOST_CHECK(ts.isUsingSoftwareFrameLimiting());

    const auto start = std::chrono::steady_clock::now();
    ts.startFrame();
    ts.endFrame();
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    // Allow for timer granularity below the 20 ms budget
    BOOST_CHECK_GE(elapsedMs, 15);
}

BOOST_AUTO_TEST_CASE(TestNoLimitingWithoutSoftwareMode) {
    TimestepManager ts(1.0f);  // One second budget

    const auto start = std::chrono::steady_clock::now();
    ts.startFrame();
    ts.endFrame();
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    BOOST_CHECK_LT(elapsedMs, 500);
}

BOOST_AUTO_TEST_SUITE_END()
