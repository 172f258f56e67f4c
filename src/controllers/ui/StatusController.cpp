/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/ui/StatusController.hpp"
#include "core/Logger.hpp"
#include <format>

void StatusController::subscribe(Wayfarer::StateBroadcaster& broadcaster)
{
    if (checkAlreadySubscribed()) {
        return;
    }

    auto token = broadcaster.registerHandler(
        [this](const Wayfarer::GameStateUpdate& update) { onStateUpdate(update); });
    addHandlerToken(broadcaster, token);

    setSubscribed(true);
    STATUS_INFO("Subscribed to game state updates");
}

std::string StatusController::formatStatusLine(const Wayfarer::GameStateUpdate& update)
{
    const auto& pos = update.state.position;
    std::string line = std::format("Wayfarer - {} ({},{})",
                                   Wayfarer::toString(update.currentTerrain), pos.x, pos.y);
    if (!update.message.empty()) {
        line += " - ";
        line += update.message;
    }
    return line;
}

void StatusController::onStateUpdate(const Wayfarer::GameStateUpdate& update)
{
    ++m_updateCount;

    std::string line = formatStatusLine(update);
    if (line == m_statusLine) {
        return;  // Progress ticks republish the same status
    }
    m_statusLine = std::move(line);

    if (update.message != m_lastMessage) {
        m_lastMessage = update.message;
        if (update.state.status == Wayfarer::EngineStatus::Error) {
            STATUS_WARN(m_lastMessage);
        } else {
            STATUS_INFO(m_lastMessage);
        }
    }

    if (m_titleSink) {
        m_titleSink(m_statusLine);
    }
}
