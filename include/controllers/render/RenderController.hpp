/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RENDER_CONTROLLER_HPP
#define RENDER_CONTROLLER_HPP

/**
 * @file RenderController.hpp
 * @brief Foreground frame scheduler: merges engine snapshots, animates, draws
 *
 * Each tick(nowMs):
 *   1. Drains the event channel; every snapshot replaces the displayed state
 *      wholesale and a GameStateUpdate is broadcast
 *   2. Clears the local moving marker once its 200ms cooldown has elapsed
 *   3. Advances animation if >= 16ms passed since the last advance
 *   4. Draws if the idle-dependent throttle interval has elapsed
 *      (Active 30fps, Resting 20fps, Idle 10fps, Sleeping 5fps)
 *
 * Move requests are debounced locally: while a move is cooling down, or
 * while the controller is stopped, the request is dropped without touching
 * the channel.
 *
 * Drawing goes through a DrawCallback so the scheduler runs without a
 * renderer; GameEngine points it at TerrainRenderer::drawFrame().
 *
 * Usage:
 *   - Owned by GameEngine
 *   - start() once the worker is running, tick() every frame, stop() on exit
 */

#include "core/Channel.hpp"
#include "engine/EngineTypes.hpp"
#include "engine/EngineWorker.hpp"
#include "events/GameStateUpdate.hpp"
#include "events/StateBroadcaster.hpp"
#include "render/AnimationState.hpp"
#include "render/TerrainRenderer.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class RenderController {
public:
    using DrawCallback = std::function<void(const Wayfarer::FrameParams&)>;

    static constexpr int64_t MOVE_COOLDOWN_MS = 200;

    struct Config {
        int tileSize{Wayfarer::DEFAULT_TILE_SIZE};
        int canvasWidth{Wayfarer::DEFAULT_TILE_SIZE * 20};
        int canvasHeight{Wayfarer::DEFAULT_TILE_SIZE * 15};
        int stepDelayMs{100};      // Demo progress task step delay
        uint32_t animationSeed{0}; // 0 = random
        Wayfarer::AnimationSettings animation{};
    };

    RenderController(std::shared_ptr<Wayfarer::CommandChannel> commands,
                     std::shared_ptr<Wayfarer::EventChannel> events,
                     Wayfarer::StateBroadcaster& broadcaster,
                     Config config);
    ~RenderController();

    // Non-copyable, non-movable
    RenderController(const RenderController&) = delete;
    RenderController& operator=(const RenderController&) = delete;
    RenderController(RenderController&&) = delete;
    RenderController& operator=(RenderController&&) = delete;

    /**
     * @brief Send Start to the engine and begin accepting moves
     * @return false if already running or the command channel is closed
     */
    bool start(int64_t nowMs);

    /**
     * @brief Stop the frame loop and reject further moves
     * @note Safe to call multiple times
     */
    void stop();

    /**
     * @brief Debounced move request
     * @return true if a move command was sent
     */
    bool requestMove(Wayfarer::Direction direction, int64_t nowMs);

    /**
     * @brief One frame of work; call every display refresh
     */
    void tick(int64_t nowMs);

    void setDrawCallback(DrawCallback callback) { m_drawCallback = std::move(callback); }

    void setAnimationSettings(const Wayfarer::AnimationSettingsPatch& patch);

    /**
     * @brief Canvas size changed; clouds are re-seeded
     */
    void resize(int canvasWidth, int canvasHeight);

    /**
     * @brief Current UI-facing view (same content as the last broadcast)
     */
    [[nodiscard]] Wayfarer::GameStateUpdate getGameState() const;

    /**
     * @brief Frame parameters the next draw would use
     * @return std::nullopt until the first world map has been received
     */
    [[nodiscard]] std::optional<Wayfarer::FrameParams> buildFrameParams(int64_t nowMs) const;

    /**
     * @brief Minimum milliseconds between draws for an idle state
     */
    [[nodiscard]] static double frameIntervalMs(Wayfarer::IdleState state);

    [[nodiscard]] bool isRunning() const { return m_running; }
    [[nodiscard]] bool isMoving() const { return m_moving; }
    [[nodiscard]] const Wayfarer::PlayerState& getDisplayedState() const { return m_state; }
    [[nodiscard]] const Wayfarer::AnimationState& getAnimation() const { return m_animation; }

    // Frame statistics
    [[nodiscard]] uint64_t getFramesDrawn() const { return m_framesDrawn; }
    [[nodiscard]] uint64_t getEventsMerged() const { return m_eventsMerged; }
    [[nodiscard]] uint64_t getMovesSent() const { return m_movesSent; }
    [[nodiscard]] uint64_t getMovesDropped() const { return m_movesDropped; }
    [[nodiscard]] int64_t getLastFrameTimeMs() const { return m_lastFrameTimeMs; }
    [[nodiscard]] float getSmoothedFps() const { return m_smoothedFps; }

private:
    void drainEvents();
    void mergeEvent(Wayfarer::EngineEvent& event);
    void draw(int64_t nowMs);

    std::shared_ptr<Wayfarer::CommandChannel> m_commands;
    std::shared_ptr<Wayfarer::EventChannel> m_events;
    Wayfarer::StateBroadcaster& m_broadcaster;
    Config m_config;

    Wayfarer::AnimationState m_animation;
    DrawCallback m_drawCallback{};

    // Last known engine view
    Wayfarer::PlayerState m_state{};
    Wayfarer::WorldMapPtr m_worldMap{};
    std::string m_message{};
    std::optional<int> m_progressStep{};
    std::optional<int> m_progressTotal{};
    std::optional<int64_t> m_progressResult{};

    bool m_running{false};
    bool m_moving{false};
    std::optional<int64_t> m_cooldownUntilMs{};
    std::optional<int64_t> m_lastDrawMs{};
    bool m_sendFailureLogged{false};

    std::vector<Wayfarer::EngineEvent> m_eventBuffer{};

    uint64_t m_framesDrawn{0};
    uint64_t m_eventsMerged{0};
    uint64_t m_movesSent{0};
    uint64_t m_movesDropped{0};
    int64_t m_lastFrameTimeMs{0};
    float m_smoothedFps{0.0f};

    static constexpr float FPS_SMOOTHING_ALPHA = 0.1f;
};

#endif // RENDER_CONTROLLER_HPP
