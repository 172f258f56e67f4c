/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STATE_BROADCASTER_HPP
#define STATE_BROADCASTER_HPP

/**
 * @file StateBroadcaster.hpp
 * @brief Explicit observer registry for GameStateUpdate notifications
 *
 * The application owns one broadcaster and hands it to the render controller
 * (publisher) and to presentation controllers (subscribers). There is no
 * global instance. Handlers run synchronously on the publishing thread in
 * registration order.
 *
 * A handler may remove itself, or any other handler, while being called;
 * removed handlers are skipped for the rest of that publish.
 */

#include "events/GameStateUpdate.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace Wayfarer {

class StateBroadcaster {
public:
    using Handler = std::function<void(const GameStateUpdate&)>;

    struct HandlerToken {
        uint64_t id{0};

        bool operator==(const HandlerToken&) const = default;
    };

    StateBroadcaster() = default;
    ~StateBroadcaster() = default;

    StateBroadcaster(const StateBroadcaster&) = delete;
    StateBroadcaster& operator=(const StateBroadcaster&) = delete;

    /**
     * @brief Register a handler
     * @return token for removeHandler()
     */
    HandlerToken registerHandler(Handler handler);

    /**
     * @return false if the token is unknown or already removed
     */
    bool removeHandler(const HandlerToken& token);

    void publish(const GameStateUpdate& update);

    void clearAllHandlers();

    [[nodiscard]] size_t getHandlerCount() const;
    [[nodiscard]] uint64_t getPublishCount() const {
        return m_publishCount.load(std::memory_order_relaxed);
    }

private:
    struct HandlerEntry {
        std::shared_ptr<Handler> handler;
        uint64_t id;
    };

    mutable std::mutex m_handlersMutex{};
    std::vector<HandlerEntry> m_handlers{};
    uint64_t m_nextHandlerId{1};
    std::atomic<uint64_t> m_publishCount{0};
};

} // namespace Wayfarer

#endif // STATE_BROADCASTER_HPP
