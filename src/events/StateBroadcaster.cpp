/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "events/StateBroadcaster.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>
#include <format>

namespace Wayfarer {

StateBroadcaster::HandlerToken StateBroadcaster::registerHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    const uint64_t id = m_nextHandlerId++;
    m_handlers.push_back(HandlerEntry{std::make_shared<Handler>(std::move(handler)), id});
    return HandlerToken{id};
}

bool StateBroadcaster::removeHandler(const HandlerToken& token) {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    auto it = std::find_if(m_handlers.begin(), m_handlers.end(),
                           [&token](const HandlerEntry& entry) { return entry.id == token.id; });
    if (it == m_handlers.end()) {
        return false;
    }
    m_handlers.erase(it);
    return true;
}

void StateBroadcaster::publish(const GameStateUpdate& update) {
    // Snapshot so handlers can (un)register without deadlocking
    std::vector<HandlerEntry> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_handlersMutex);
        snapshot = m_handlers;
    }

    for (const auto& entry : snapshot) {
        {
            std::lock_guard<std::mutex> lock(m_handlersMutex);
            const bool stillRegistered =
                std::any_of(m_handlers.begin(), m_handlers.end(),
                            [&entry](const HandlerEntry& e) { return e.id == entry.id; });
            if (!stillRegistered) {
                continue;
            }
        }

        if (!entry.handler || !*entry.handler) {
            continue;
        }

        try {
            (*entry.handler)(update);
        } catch (const std::exception& e) {
            BROADCAST_ERROR(std::format("Handler {} threw: {}", entry.id, e.what()));
        }
    }

    m_publishCount.fetch_add(1, std::memory_order_relaxed);
}

void StateBroadcaster::clearAllHandlers() {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    m_handlers.clear();
    BROADCAST_DEBUG("All state handlers cleared");
}

size_t StateBroadcaster::getHandlerCount() const {
    std::lock_guard<std::mutex> lock(m_handlersMutex);
    return m_handlers.size();
}

} // namespace Wayfarer
