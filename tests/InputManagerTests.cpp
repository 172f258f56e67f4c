/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE InputManagerTests
#include <boost/test/unit_test.hpp>

#include <SDL3/SDL.h>
#include "managers/InputManager.hpp"

using Wayfarer::Direction;

// Per-test fixture: the singleton is re-armed and emptied for every case
struct InputManagerTestFixture {
    InputManagerTestFixture() {
        InputManager::Instance().reset();
    }

    ~InputManagerTestFixture() {
        InputManager::Instance().reset();
    }

    // Build a keyboard event the way SDL delivers it to GameEngine::handleEvents()
    static SDL_Event makeKeyEvent(SDL_Keycode key, bool isDown, bool repeat = false) {
        SDL_Event event;
        SDL_zero(event);
        event.type = isDown ? SDL_EVENT_KEY_DOWN : SDL_EVENT_KEY_UP;
        event.key.key = key;
        event.key.mod = SDL_KMOD_NONE;
        event.key.down = isDown;
        event.key.repeat = repeat;
        return event;
    }

    void press(SDL_Keycode key, bool repeat = false) {
        InputManager::Instance().onKeyDown(makeKeyEvent(key, true, repeat));
    }

    void release(SDL_Keycode key) {
        InputManager::Instance().onKeyUp(makeKeyEvent(key, false));
    }
};

// ============================================================================
// KEY MAPPING TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(KeyMappingTests)

BOOST_AUTO_TEST_CASE(TestArrowKeys) {
    BOOST_CHECK(InputManager::directionForKey(SDLK_LEFT) == Direction::Left);
    BOOST_CHECK(InputManager::directionForKey(SDLK_RIGHT) == Direction::Right);
    BOOST_CHECK(InputManager::directionForKey(SDLK_UP) == Direction::Up);
    BOOST_CHECK(InputManager::directionForKey(SDLK_DOWN) == Direction::Down);
}

BOOST_AUTO_TEST_CASE(TestWasdKeys) {
    BOOST_CHECK(InputManager::directionForKey(SDLK_A) == Direction::Left);
    BOOST_CHECK(InputManager::directionForKey(SDLK_D) == Direction::Right);
    BOOST_CHECK(InputManager::directionForKey(SDLK_W) == Direction::Up);
    BOOST_CHECK(InputManager::directionForKey(SDLK_S) == Direction::Down);
}

BOOST_AUTO_TEST_CASE(TestUnmappedKeys) {
    BOOST_CHECK(!InputManager::directionForKey(SDLK_SPACE).has_value());
    BOOST_CHECK(!InputManager::directionForKey(SDLK_ESCAPE).has_value());
    BOOST_CHECK(!InputManager::directionForKey(SDLK_1).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// KEYBOARD STATE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(KeyboardStateTests, InputManagerTestFixture)

BOOST_AUTO_TEST_CASE(TestPressAndRelease) {
    auto& input = InputManager::Instance();
    BOOST_CHECK(!input.isKeyDown(SDLK_A));

    press(SDLK_A);
    BOOST_CHECK(input.isKeyDown(SDLK_A));
    BOOST_CHECK(input.wasKeyPressed(SDLK_A));

    release(SDLK_A);
    BOOST_CHECK(!input.isKeyDown(SDLK_A));
    // Still counted as pressed for the rest of the frame
    BOOST_CHECK(input.wasKeyPressed(SDLK_A));
}

BOOST_AUTO_TEST_CASE(TestFrameClearKeepsHeldKeys) {
    auto& input = InputManager::Instance();
    press(SDLK_RIGHT);

    input.update();
    BOOST_CHECK(!input.wasKeyPressed(SDLK_RIGHT));
    BOOST_CHECK(input.isKeyDown(SDLK_RIGHT));
    BOOST_CHECK(input.getPressedDirections().empty());
}

BOOST_AUTO_TEST_CASE(TestPressedDirectionsInOrder) {
    auto& input = InputManager::Instance();
    press(SDLK_W);
    press(SDLK_SPACE);
    press(SDLK_LEFT);
    press(SDLK_W);  // Same key twice in a frame is reported once

    auto directions = input.getPressedDirections();
    BOOST_REQUIRE_EQUAL(directions.size(), 2u);
    BOOST_CHECK(directions[0] == Direction::Up);
    BOOST_CHECK(directions[1] == Direction::Left);
}

BOOST_AUTO_TEST_CASE(TestKeyRepeatCountsAsPress) {
    auto& input = InputManager::Instance();
    press(SDLK_DOWN);
    input.clearFrameInput();

    press(SDLK_DOWN, true);
    auto directions = input.getPressedDirections();
    BOOST_REQUIRE_EQUAL(directions.size(), 1u);
    BOOST_CHECK(directions[0] == Direction::Down);
}

BOOST_AUTO_TEST_CASE(TestCleanIgnoresFurtherInput) {
    auto& input = InputManager::Instance();
    press(SDLK_D);
    input.clean();
    BOOST_CHECK(input.isShutdown());
    BOOST_CHECK(!input.isKeyDown(SDLK_D));

    press(SDLK_D);
    BOOST_CHECK(!input.isKeyDown(SDLK_D));

    input.clean();  // Second clean is a no-op
    input.reset();
    BOOST_CHECK(!input.isShutdown());
    press(SDLK_D);
    BOOST_CHECK(input.isKeyDown(SDLK_D));
}

BOOST_AUTO_TEST_SUITE_END()
