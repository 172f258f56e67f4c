/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for lightweight state-update consumers
 *
 * Controllers are application-scoped helpers that react to GameStateUpdate
 * notifications. They do NOT own game state and never talk to the engine.
 *
 * Key characteristics:
 * - Owned by GameEngine (not singletons)
 * - Auto-unsubscribe on destruction
 * - Minimal state (subscription tokens plus what they display)
 *
 * The StateBroadcaster passed to subscribe() must outlive the controller.
 */

#include "events/StateBroadcaster.hpp"
#include <string_view>
#include <vector>

class ControllerBase
{
public:
    /**
     * @brief Virtual destructor auto-unsubscribes from all handlers
     */
    virtual ~ControllerBase() { unsubscribe(); }

    // Non-copyable (handlers capture 'this')
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    /**
     * @brief Register this controller's handlers with @p broadcaster
     * @note Idempotent while subscribed
     */
    virtual void subscribe(Wayfarer::StateBroadcaster& broadcaster) = 0;

    [[nodiscard]] virtual std::string_view getName() const = 0;

    /**
     * @brief Unsubscribe from all registered handlers
     * @note Safe to call multiple times
     */
    void unsubscribe()
    {
        if (!m_subscribed) {
            return;
        }

        if (m_broadcaster) {
            for (const auto& token : m_handlerTokens) {
                m_broadcaster->removeHandler(token);
            }
        }
        m_handlerTokens.clear();
        m_broadcaster = nullptr;
        m_subscribed = false;
    }

    /**
     * @brief Check if currently subscribed
     */
    [[nodiscard]] bool isSubscribed() const { return m_subscribed; }

protected:
    ControllerBase() = default;

    /**
     * @brief Register a handler token for automatic cleanup
     * @param broadcaster The broadcaster that issued the token
     * @param token The token from StateBroadcaster::registerHandler
     */
    void addHandlerToken(Wayfarer::StateBroadcaster& broadcaster,
                         const Wayfarer::StateBroadcaster::HandlerToken& token)
    {
        m_broadcaster = &broadcaster;
        m_handlerTokens.push_back(token);
    }

    void setSubscribed(bool subscribed) { m_subscribed = subscribed; }

    /**
     * @brief Check if already subscribed (for idempotent subscribe)
     */
    [[nodiscard]] bool checkAlreadySubscribed() const { return m_subscribed; }

private:
    bool m_subscribed{false};
    Wayfarer::StateBroadcaster* m_broadcaster{nullptr};
    std::vector<Wayfarer::StateBroadcaster::HandlerToken> m_handlerTokens;
};

#endif // CONTROLLER_BASE_HPP
