/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/render/RenderController.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

RenderController::RenderController(std::shared_ptr<Wayfarer::CommandChannel> commands,
                                   std::shared_ptr<Wayfarer::EventChannel> events,
                                   Wayfarer::StateBroadcaster& broadcaster,
                                   Config config)
    : m_commands(std::move(commands))
    , m_events(std::move(events))
    , m_broadcaster(broadcaster)
    , m_config(config)
    , m_animation(config.canvasWidth, config.canvasHeight, config.animationSeed)
{
    if (!m_commands || !m_events) {
        throw std::invalid_argument("RenderController requires both channels");
    }

    Wayfarer::AnimationSettingsPatch initial;
    initial.cloudsEnabled = config.animation.cloudsEnabled;
    initial.wavesEnabled = config.animation.wavesEnabled;
    initial.riverEnabled = config.animation.riverEnabled;
    m_animation.applySettings(initial);
}

RenderController::~RenderController() {
    stop();
}

bool RenderController::start(int64_t nowMs) {
    if (m_running) {
        RENDERCTL_WARN("RenderController already running");
        return false;
    }

    if (!m_commands->send(Wayfarer::EngineCommand::start(m_config.stepDelayMs))) {
        RENDERCTL_ERROR("Cannot start: command channel is closed");
        return false;
    }

    m_running = true;
    m_moving = false;
    m_cooldownUntilMs.reset();
    m_lastDrawMs.reset();
    m_state.lastActivityMs = nowMs;

    RENDERCTL_INFO(std::format("Started (step delay {}ms)", m_config.stepDelayMs));
    return true;
}

void RenderController::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    m_moving = false;
    m_cooldownUntilMs.reset();
    RENDERCTL_INFO(std::format("Stopped after {} frames", m_framesDrawn));
}

bool RenderController::requestMove(Wayfarer::Direction direction, int64_t nowMs) {
    if (!m_running) {
        ++m_movesDropped;
        return false;
    }
    if (m_cooldownUntilMs && nowMs < *m_cooldownUntilMs) {
        ++m_movesDropped;
        RENDERCTL_DEBUG(std::format("Move {} dropped: cooling down", Wayfarer::toString(direction)));
        return false;
    }

    if (!m_commands->send(Wayfarer::EngineCommand::move(direction))) {
        // Engine gone; keep rendering the last snapshot
        ++m_movesDropped;
        if (!m_sendFailureLogged) {
            m_sendFailureLogged = true;
            RENDERCTL_WARN("Command channel closed; moves are no longer delivered");
        }
        return false;
    }

    ++m_movesSent;
    m_moving = true;
    m_cooldownUntilMs = nowMs + MOVE_COOLDOWN_MS;

    // Local activity: render at full rate until the engine says otherwise
    m_state.isMoving = true;
    m_state.idleState = Wayfarer::IdleState::Active;
    m_state.lastActivityMs = nowMs;
    return true;
}

void RenderController::tick(int64_t nowMs) {
    if (!m_running) {
        return;
    }

    drainEvents();

    if (m_moving && m_cooldownUntilMs && nowMs >= *m_cooldownUntilMs) {
        m_moving = false;
        m_state.isMoving = false;
        m_cooldownUntilMs.reset();
    }

    m_animation.tick(nowMs);

    const double interval = frameIntervalMs(m_state.idleState);
    if (!m_lastDrawMs || static_cast<double>(nowMs - *m_lastDrawMs) >= interval) {
        draw(nowMs);
    }
}

void RenderController::drainEvents() {
    m_eventBuffer.clear();
    if (m_events->drain(m_eventBuffer) == 0) {
        return;
    }

    for (auto& event : m_eventBuffer) {
        mergeEvent(event);
    }
    m_eventBuffer.clear();
}

void RenderController::mergeEvent(Wayfarer::EngineEvent& event) {
    if (event.snapshot) {
        m_state = std::move(*event.snapshot);
        // The cooldown owns the moving marker
        m_state.isMoving = m_moving;
    } else {
        m_state.status = event.status;
    }

    if (event.worldMap) {
        m_worldMap = std::move(event.worldMap);
    }
    if (event.message) {
        m_message = std::move(*event.message);
    }
    if (event.progressStep) {
        m_progressStep = event.progressStep;
        m_progressTotal = event.progressTotal;
    }
    if (event.progressResult) {
        m_progressResult = event.progressResult;
    }

    if (event.status == Wayfarer::EngineStatus::Error && !event.snapshot) {
        RENDERCTL_WARN(std::format("Engine error: {}", m_message));
    }

    ++m_eventsMerged;
    m_broadcaster.publish(getGameState());
}

void RenderController::draw(int64_t nowMs) {
    auto params = buildFrameParams(nowMs);
    if (!params) {
        return;  // Nothing to draw until the engine has sent the map
    }

    if (m_drawCallback) {
        m_drawCallback(*params);
    }

    if (m_lastDrawMs) {
        m_lastFrameTimeMs = nowMs - *m_lastDrawMs;
        if (m_lastFrameTimeMs > 0) {
            const float instantFps = 1000.0f / static_cast<float>(m_lastFrameTimeMs);
            m_smoothedFps = (m_smoothedFps == 0.0f)
                                ? instantFps
                                : m_smoothedFps + FPS_SMOOTHING_ALPHA * (instantFps - m_smoothedFps);
        }
    }
    m_lastDrawMs = nowMs;
    ++m_framesDrawn;
}

std::optional<Wayfarer::FrameParams> RenderController::buildFrameParams(int64_t nowMs) const {
    if (!m_worldMap) {
        return std::nullopt;
    }

    Wayfarer::FrameParams params;
    params.worldMap = m_worldMap.get();
    params.playerPosition = m_state.position;
    params.facing = m_state.facing;
    params.isMoving = m_moving;
    params.animation = m_animation.getSettings();
    params.waveOffset = m_animation.getWaveOffset();
    params.riverOffset = m_animation.getRiverOffset();
    params.clouds = &m_animation.getClouds();
    params.tileSize = m_config.tileSize;
    params.nowMs = nowMs;
    return params;
}

void RenderController::setAnimationSettings(const Wayfarer::AnimationSettingsPatch& patch) {
    m_animation.applySettings(patch);
}

void RenderController::resize(int canvasWidth, int canvasHeight) {
    m_config.canvasWidth = canvasWidth;
    m_config.canvasHeight = canvasHeight;
    m_animation.resize(canvasWidth, canvasHeight);
}

Wayfarer::GameStateUpdate RenderController::getGameState() const {
    Wayfarer::GameStateUpdate update;
    update.state = m_state;
    update.currentTerrain = m_state.currentTerrain;
    update.worldMap = m_worldMap;
    update.message = m_message;
    update.progressStep = m_progressStep;
    update.progressTotal = m_progressTotal;
    update.progressResult = m_progressResult;
    return update;
}

double RenderController::frameIntervalMs(Wayfarer::IdleState state) {
    switch (state) {
        case Wayfarer::IdleState::Active:   return 1000.0 / 30.0;
        case Wayfarer::IdleState::Resting:  return 1000.0 / 20.0;
        case Wayfarer::IdleState::Idle:     return 1000.0 / 10.0;
        case Wayfarer::IdleState::Sleeping: return 1000.0 / 5.0;
    }
    return 1000.0 / 30.0;
}
