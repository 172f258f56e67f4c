/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STATUS_CONTROLLER_HPP
#define STATUS_CONTROLLER_HPP

/**
 * @file StatusController.hpp
 * @brief Mirrors the player's terrain, position and last message into a status line
 *
 * Event flow:
 *   EngineWorker -> EventChannel -> RenderController::tick() merges snapshot
 *     -> StateBroadcaster::publish(GameStateUpdate)
 *     -> StatusController formats the line and hands it to the title sink
 *        (GameEngine points the sink at SDL_SetWindowTitle)
 */

#include "controllers/ControllerBase.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

class StatusController : public ControllerBase
{
public:
    using TitleSink = std::function<void(const std::string&)>;

    explicit StatusController(TitleSink sink = {}) : m_titleSink(std::move(sink)) {}
    ~StatusController() override = default;

    void subscribe(Wayfarer::StateBroadcaster& broadcaster) override;

    [[nodiscard]] std::string_view getName() const override { return "StatusController"; }

    /**
     * @brief Current status line, e.g. "Wayfarer - Beach (1,2) - Moved left from Grassland to Beach"
     */
    [[nodiscard]] const std::string& getStatusLine() const { return m_statusLine; }
    [[nodiscard]] const std::string& getLastMessage() const { return m_lastMessage; }
    [[nodiscard]] uint64_t getUpdateCount() const { return m_updateCount; }

    // Build the status line for an update (pure, used by the handler)
    [[nodiscard]] static std::string formatStatusLine(const Wayfarer::GameStateUpdate& update);

private:
    void onStateUpdate(const Wayfarer::GameStateUpdate& update);

    TitleSink m_titleSink;
    std::string m_statusLine{};
    std::string m_lastMessage{};
    uint64_t m_updateCount{0};
};

#endif // STATUS_CONTROLLER_HPP
