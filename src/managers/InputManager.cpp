/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/InputManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>

InputManager::InputManager() {
  // Reserve capacity for performance optimization
  m_pressedThisFrame.reserve(16);  // Typical max keys pressed per frame
  m_heldKeys.reserve(16);
}

std::optional<Wayfarer::Direction> InputManager::directionForKey(SDL_Keycode key) {
  switch (key) {
    case SDLK_LEFT:
    case SDLK_A:
      return Wayfarer::Direction::Left;
    case SDLK_RIGHT:
    case SDLK_D:
      return Wayfarer::Direction::Right;
    case SDLK_UP:
    case SDLK_W:
      return Wayfarer::Direction::Up;
    case SDLK_DOWN:
    case SDLK_S:
      return Wayfarer::Direction::Down;
    default:
      return std::nullopt;
  }
}

bool InputManager::isKeyDown(SDL_Keycode key) const {
  return std::find(m_heldKeys.begin(), m_heldKeys.end(), key) != m_heldKeys.end();
}

bool InputManager::wasKeyPressed(SDL_Keycode key) const {
  // Check if this key was pressed this frame using std::any_of
  return std::any_of(m_pressedThisFrame.begin(), m_pressedThisFrame.end(),
                     [key](SDL_Keycode pressedKey) { return pressedKey == key; });
}

boost::container::small_vector<Wayfarer::Direction, 4> InputManager::getPressedDirections() const {
  boost::container::small_vector<Wayfarer::Direction, 4> directions;
  for (SDL_Keycode key : m_pressedThisFrame) {
    if (auto direction = directionForKey(key)) {
      directions.push_back(*direction);
    }
  }
  return directions;
}

void InputManager::clearFrameInput() {
  m_pressedThisFrame.clear();
}

void InputManager::update() {
  // SDL event polling lives in GameEngine::handleEvents()
  clearFrameInput();
}

void InputManager::onKeyDown(const SDL_Event& event) {
  if (m_isShutdown) {
    return;
  }

  const SDL_Keycode key = event.key.key;

  // Track this key as pressed this frame (for wasKeyPressed)
  // Check for duplicates to avoid multiple entries for the same key in one frame
  bool alreadyTracked = std::any_of(m_pressedThisFrame.begin(), m_pressedThisFrame.end(),
                                    [key](SDL_Keycode pressedKey) { return pressedKey == key; });
  if (!alreadyTracked) {
    m_pressedThisFrame.push_back(key);
  }

  if (!isKeyDown(key)) {
    m_heldKeys.push_back(key);
  }
}

void InputManager::onKeyUp(const SDL_Event& event) {
  const SDL_Keycode key = event.key.key;
  m_heldKeys.erase(std::remove(m_heldKeys.begin(), m_heldKeys.end(), key), m_heldKeys.end());
}

void InputManager::reset() {
  m_pressedThisFrame.clear();
  m_heldKeys.clear();
  m_isShutdown = false;
}

void InputManager::clean() {
  if (m_isShutdown) {
    return;
  }

  m_pressedThisFrame.clear();
  m_heldKeys.clear();
  m_isShutdown = true;
  INPUT_INFO("InputManager resources cleaned!");
}
