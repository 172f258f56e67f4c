/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE RenderControllerTests
#include <boost/test/unit_test.hpp>

#include "controllers/render/RenderController.hpp"
#include "engine/StateEngine.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

using namespace Wayfarer;

// ============================================================================
// Test Fixture
// ============================================================================

class RenderControllerTestFixture {
public:
    RenderControllerTestFixture()
        : commands(std::make_shared<CommandChannel>())
        , events(std::make_shared<EventChannel>())
        , controller(commands, events, broadcaster, makeConfig()) {
        controller.setDrawCallback([this](const FrameParams& params) { frames.push_back(params); });
        broadcaster.registerHandler([this](const GameStateUpdate& update) { updates.push_back(update); });
    }

    static RenderController::Config makeConfig() {
        RenderController::Config config;
        config.stepDelayMs = 10;
        config.animationSeed = 1234;
        return config;
    }

    // Hand every queued command to a synchronous engine and queue its answers
    void pumpEngine(int64_t nowMs) {
        EngineCommand command;
        while (commands->tryReceive(command)) {
            for (auto& event : engine.handleCommand(command, nowMs)) {
                events->send(std::move(event));
            }
        }
    }

    void pushIdle(IdleState state) {
        EngineEvent event;
        event.status = EngineStatus::Processing;
        PlayerState snapshot = controller.getDisplayedState();
        snapshot.idleState = state;
        event.snapshot = snapshot;
        event.message = "State changed";
        events->send(std::move(event));
    }

    std::vector<EngineCommand> takeCommands() {
        std::vector<EngineCommand> out;
        commands->drain(out);
        return out;
    }

    std::shared_ptr<CommandChannel> commands;
    std::shared_ptr<EventChannel> events;
    StateBroadcaster broadcaster;
    RenderController controller;
    StateEngine engine;
    std::vector<FrameParams> frames;
    std::vector<GameStateUpdate> updates;
};

// ============================================================================
// LIFECYCLE TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(LifecycleTests)

BOOST_AUTO_TEST_CASE(TestNullChannelsRejected) {
    StateBroadcaster broadcaster;
    BOOST_CHECK_THROW(RenderController(nullptr, std::make_shared<EventChannel>(), broadcaster, {}),
                      std::invalid_argument);
}

BOOST_FIXTURE_TEST_CASE(TestStartSendsStartCommand, RenderControllerTestFixture) {
    BOOST_CHECK(!controller.isRunning());
    BOOST_CHECK(controller.start(0));
    BOOST_CHECK(controller.isRunning());
    BOOST_CHECK(!controller.start(0));

    auto sent = takeCommands();
    BOOST_REQUIRE_EQUAL(sent.size(), 1u);
    BOOST_CHECK_EQUAL(sent[0].task, "START");
    BOOST_REQUIRE(sent[0].delayMs.has_value());
    BOOST_CHECK_EQUAL(*sent[0].delayMs, 10);
}

BOOST_FIXTURE_TEST_CASE(TestStartFailsOnClosedChannel, RenderControllerTestFixture) {
    commands->close();
    BOOST_CHECK(!controller.start(0));
    BOOST_CHECK(!controller.isRunning());
}

BOOST_FIXTURE_TEST_CASE(TestStoppedControllerIsInert, RenderControllerTestFixture) {
    BOOST_CHECK(!controller.requestMove(Direction::Left, 0));
    BOOST_CHECK_EQUAL(controller.getMovesDropped(), 1u);

    controller.start(0);
    pumpEngine(0);
    controller.stop();
    controller.stop();

    controller.tick(100);
    BOOST_CHECK(frames.empty());
    BOOST_CHECK(updates.empty());
    BOOST_CHECK(!controller.requestMove(Direction::Left, 100));
}

BOOST_FIXTURE_TEST_CASE(TestNoDrawBeforeWorldMap, RenderControllerTestFixture) {
    controller.start(0);
    controller.tick(0);
    controller.tick(100);
    BOOST_CHECK(frames.empty());
    BOOST_CHECK(!controller.buildFrameParams(100).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MERGE AND BROADCAST TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MergeTests, RenderControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestSnapshotMergedAndBroadcast) {
    controller.start(0);
    pumpEngine(0);
    controller.tick(0);

    BOOST_REQUIRE_EQUAL(updates.size(), 1u);
    const auto& update = updates[0];
    BOOST_CHECK_EQUAL(update.state.position, (Position{2, 2}));
    BOOST_CHECK_EQUAL(update.currentTerrain, TerrainKind::Grassland);
    BOOST_CHECK_EQUAL(update.message, "Game initialized");
    BOOST_CHECK(update.worldMap);
    BOOST_CHECK_EQUAL(update.terrainNames[static_cast<size_t>(TerrainKind::Beach)], "Beach");

    BOOST_REQUIRE_EQUAL(frames.size(), 1u);
    BOOST_CHECK_EQUAL(frames[0].playerPosition, (Position{2, 2}));
    BOOST_CHECK(frames[0].worldMap != nullptr);
    BOOST_CHECK_EQUAL(controller.getEventsMerged(), 1u);
    BOOST_CHECK_EQUAL(broadcaster.getPublishCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestEveryEventIsBroadcastInOrder) {
    controller.start(0);
    pumpEngine(0);
    for (auto& event : engine.pollProgress(30)) {
        events->send(std::move(event));
    }
    controller.tick(30);

    BOOST_REQUIRE_EQUAL(updates.size(), 4u);
    BOOST_CHECK(!updates[0].progressStep.has_value());
    BOOST_CHECK_EQUAL(*updates[1].progressStep, 1);
    BOOST_CHECK_EQUAL(*updates[3].progressStep, 3);
    BOOST_CHECK_EQUAL(*updates[3].progressTotal, 100);

    // Progress ticks keep the last snapshot and message
    BOOST_CHECK_EQUAL(updates[3].state.position, (Position{2, 2}));
    BOOST_CHECK_EQUAL(updates[3].message, "Game initialized");
}

BOOST_AUTO_TEST_CASE(TestProgressResultSurfaced) {
    controller.start(0);
    pumpEngine(0);
    for (auto& event : engine.pollProgress(1000)) {
        events->send(std::move(event));
    }
    controller.tick(1000);

    const auto state = controller.getGameState();
    BOOST_REQUIRE(state.progressResult.has_value());
    BOOST_CHECK_EQUAL(*state.progressResult, 1000);
    BOOST_CHECK_EQUAL(state.state.status, EngineStatus::Finished);
    BOOST_CHECK_EQUAL(state.message, "Task finished with time = 10");
}

BOOST_AUTO_TEST_CASE(TestMoveRoundTrip) {
    controller.start(0);
    pumpEngine(0);
    controller.tick(0);

    BOOST_CHECK(controller.requestMove(Direction::Left, 10));
    BOOST_CHECK(controller.isMoving());
    BOOST_CHECK(controller.getDisplayedState().isMoving);

    pumpEngine(10);
    controller.tick(20);

    const auto& state = controller.getDisplayedState();
    BOOST_CHECK_EQUAL(state.position, (Position{1, 2}));
    BOOST_CHECK_EQUAL(state.currentTerrain, TerrainKind::Beach);
    BOOST_CHECK_EQUAL(state.facing, Direction::Left);
    // Snapshot does not clear the marker while the cooldown runs
    BOOST_CHECK(state.isMoving);
    BOOST_CHECK_EQUAL(updates.back().message, "Moved left from Grassland to Beach");
}

BOOST_AUTO_TEST_CASE(TestBlockedMoveSurfaced) {
    controller.start(0);
    pumpEngine(0);
    controller.requestMove(Direction::Left, 0);
    pumpEngine(0);
    controller.requestMove(Direction::Left, 300);
    pumpEngine(300);
    controller.tick(300);

    BOOST_CHECK_EQUAL(controller.getDisplayedState().position, (Position{1, 2}));
    BOOST_CHECK_EQUAL(controller.getDisplayedState().status, EngineStatus::Error);
    BOOST_CHECK_EQUAL(updates.back().message, "Cannot move left - blocked by Water");
}

BOOST_AUTO_TEST_CASE(TestErrorWithoutSnapshotKeepsState) {
    controller.start(0);
    pumpEngine(0);
    controller.tick(0);

    EngineEvent error;
    error.status = EngineStatus::Error;
    error.message = "Unknown task: PING";
    events->send(std::move(error));
    controller.tick(10);

    BOOST_CHECK_EQUAL(controller.getDisplayedState().position, (Position{2, 2}));
    BOOST_CHECK_EQUAL(controller.getDisplayedState().status, EngineStatus::Error);
    BOOST_CHECK_EQUAL(updates.back().message, "Unknown task: PING");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MOVE COOLDOWN TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CooldownTests, RenderControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestMovesDebounced) {
    controller.start(0);
    takeCommands();

    BOOST_CHECK(controller.requestMove(Direction::Left, 1000));
    BOOST_CHECK(!controller.requestMove(Direction::Right, 1100));
    BOOST_CHECK(!controller.requestMove(Direction::Right, 1199));
    BOOST_CHECK(controller.requestMove(Direction::Right, 1200));

    auto sent = takeCommands();
    BOOST_REQUIRE_EQUAL(sent.size(), 2u);
    BOOST_CHECK_EQUAL(*sent[0].direction, Direction::Left);
    BOOST_CHECK_EQUAL(*sent[1].direction, Direction::Right);
    BOOST_CHECK_EQUAL(controller.getMovesSent(), 2u);
    BOOST_CHECK_EQUAL(controller.getMovesDropped(), 2u);
}

BOOST_AUTO_TEST_CASE(TestMovingMarkerClearsAfterCooldown) {
    controller.start(0);
    controller.requestMove(Direction::Up, 0);
    BOOST_CHECK(controller.isMoving());

    controller.tick(199);
    BOOST_CHECK(controller.isMoving());
    controller.tick(200);
    BOOST_CHECK(!controller.isMoving());
    BOOST_CHECK(!controller.getDisplayedState().isMoving);
}

BOOST_AUTO_TEST_CASE(TestMoveMarksActive) {
    controller.start(0);
    pumpEngine(0);
    pushIdle(IdleState::Sleeping);
    controller.tick(0);
    BOOST_CHECK_EQUAL(controller.getDisplayedState().idleState, IdleState::Sleeping);

    controller.requestMove(Direction::Down, 10);
    BOOST_CHECK_EQUAL(controller.getDisplayedState().idleState, IdleState::Active);
}

BOOST_AUTO_TEST_CASE(TestClosedCommandChannelDegrades) {
    controller.start(0);
    pumpEngine(0);
    controller.tick(0);

    commands->close();
    BOOST_CHECK(!controller.requestMove(Direction::Left, 10));
    BOOST_CHECK(!controller.requestMove(Direction::Left, 500));
    BOOST_CHECK_EQUAL(controller.getMovesDropped(), 2u);
    BOOST_CHECK(!controller.isMoving());

    // Keeps rendering the last known state
    controller.tick(100);
    BOOST_CHECK_EQUAL(frames.size(), 2u);
    BOOST_CHECK_EQUAL(frames.back().playerPosition, (Position{2, 2}));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FRAME THROTTLE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ThrottleTests, RenderControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestIntervals) {
    BOOST_CHECK_CLOSE(RenderController::frameIntervalMs(IdleState::Active), 1000.0 / 30.0, 0.001);
    BOOST_CHECK_CLOSE(RenderController::frameIntervalMs(IdleState::Resting), 50.0, 0.001);
    BOOST_CHECK_CLOSE(RenderController::frameIntervalMs(IdleState::Idle), 100.0, 0.001);
    BOOST_CHECK_CLOSE(RenderController::frameIntervalMs(IdleState::Sleeping), 200.0, 0.001);
}

BOOST_AUTO_TEST_CASE(TestActiveThrottle) {
    controller.start(0);
    pumpEngine(0);

    controller.tick(0);
    controller.tick(20);
    controller.tick(33);
    BOOST_CHECK_EQUAL(frames.size(), 1u);
    controller.tick(34);
    BOOST_CHECK_EQUAL(frames.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestThrottlePerIdleState) {
    controller.start(0);
    pumpEngine(0);
    controller.tick(0);

    struct Case { IdleState state; int64_t interval; };
    const Case cases[] = {
        {IdleState::Resting, 50},
        {IdleState::Idle, 100},
        {IdleState::Sleeping, 200},
    };

    int64_t lastDraw = 0;
    for (const Case& c : cases) {
        pushIdle(c.state);
        const size_t before = frames.size();

        controller.tick(lastDraw + c.interval - 1);
        BOOST_CHECK_EQUAL(frames.size(), before);
        controller.tick(lastDraw + c.interval);
        BOOST_CHECK_EQUAL(frames.size(), before + 1);
        lastDraw += c.interval;
    }
}

BOOST_AUTO_TEST_CASE(TestFrameStatistics) {
    controller.start(0);
    pumpEngine(0);
    for (int64_t t = 0; t <= 1000; t += 50) {
        controller.tick(t);
    }
    BOOST_CHECK_EQUAL(controller.getFramesDrawn(), 21u);
    BOOST_CHECK_EQUAL(controller.getLastFrameTimeMs(), 50);
    BOOST_CHECK_CLOSE(controller.getSmoothedFps(), 20.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ANIMATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(AnimationTests, RenderControllerTestFixture)

BOOST_AUTO_TEST_CASE(TestSettingsReachFrames) {
    controller.start(0);
    pumpEngine(0);

    AnimationSettingsPatch patch;
    patch.wavesEnabled = true;
    controller.setAnimationSettings(patch);
    controller.tick(5000);

    BOOST_REQUIRE(!frames.empty());
    BOOST_CHECK(frames.back().animation.wavesEnabled);
    BOOST_CHECK(!frames.back().animation.cloudsEnabled);
    BOOST_CHECK_GT(frames.back().waveOffset, 0.0);
    BOOST_CHECK(frames.back().clouds != nullptr);
}

BOOST_AUTO_TEST_CASE(TestResizeUpdatesAnimationCanvas) {
    controller.resize(1024, 768);
    BOOST_CHECK_EQUAL(controller.getAnimation().getCanvasWidth(), 1024);
    BOOST_CHECK_EQUAL(controller.getAnimation().getCanvasHeight(), 768);
}

BOOST_AUTO_TEST_SUITE_END()
