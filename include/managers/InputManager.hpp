/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_MANAGER_HPP
#define INPUT_MANAGER_HPP

#include <SDL3/SDL.h>
#include <boost/container/small_vector.hpp>
#include <optional>
#include "engine/EngineTypes.hpp"

class InputManager {
 public:
    ~InputManager() {
        if (!m_isShutdown) {
            clean();
        }
    }

    static InputManager& Instance(){
        static InputManager instance;
        return instance;
    }

    // Clear per-frame state; GameEngine polls SDL events itself
    void update();

    // Clean up
    void clean();

    // Re-arm after clean() (tests reuse the singleton)
    void reset();

    // Check if InputManager has been shut down
    bool isShutdown() const { return m_isShutdown; }

    // Keyboard events, routed from GameEngine::handleEvents()
    void onKeyDown(const SDL_Event& event);
    void onKeyUp(const SDL_Event& event);

    bool isKeyDown(SDL_Keycode key) const;
    bool wasKeyPressed(SDL_Keycode key) const;  // True once per press (and per repeat)
    void clearFrameInput();  // Call once per frame to clear pressed keys

    /**
     * @brief Arrow keys and WASD to movement directions
     * @return std::nullopt for any other key
     */
    static std::optional<Wayfarer::Direction> directionForKey(SDL_Keycode key);

    /**
     * @brief Directions pressed this frame, in press order
     */
    boost::container::small_vector<Wayfarer::Direction, 4> getPressedDirections() const;

 private:

    // Keyboard specific
    boost::container::small_vector<SDL_Keycode, 16> m_pressedThisFrame{}; // Keys pressed this frame
    boost::container::small_vector<SDL_Keycode, 16> m_heldKeys{};         // Keys currently down

    // Shutdown state
    bool m_isShutdown{false};

    // Delete copy constructor and assignment operator
    InputManager(const InputManager&) = delete; // Prevent copying
    InputManager& operator=(const InputManager&) = delete; // Prevent assignment

    InputManager();
};

#endif  // INPUT_MANAGER_HPP
