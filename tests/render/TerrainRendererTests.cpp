/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TerrainRendererTests
#include <boost/test/unit_test.hpp>

#include "render/TerrainRenderer.hpp"
#include "world/WorldMap.hpp"
#include <SDL3/SDL.h>
#include <cmath>

using namespace Wayfarer;

// ============================================================================
// Test Fixture: software renderer over an in-memory surface (no window)
// ============================================================================

struct SoftwareCanvasFixture {
    static constexpr int WIDTH = 800;
    static constexpr int HEIGHT = 600;

    struct Pixel {
        Uint8 r{0};
        Uint8 g{0};
        Uint8 b{0};
        Uint8 a{0};

        bool matches(TerrainColor c) const { return r == c.r && g == c.g && b == c.b; }
        bool matches(uint32_t rgb) const {
            return r == ((rgb >> 16) & 0xFF) && g == ((rgb >> 8) & 0xFF) && b == (rgb & 0xFF);
        }
    };

    SoftwareCanvasFixture() {
        surface = SDL_CreateSurface(WIDTH, HEIGHT, SDL_PIXELFORMAT_RGBA8888);
        BOOST_REQUIRE_MESSAGE(surface != nullptr, SDL_GetError());
        renderer = SDL_CreateSoftwareRenderer(surface);
        BOOST_REQUIRE_MESSAGE(renderer != nullptr, SDL_GetError());

        params.worldMap = map.get();
        params.playerPosition = {2, 2};
        params.facing = Direction::Down;
        params.isMoving = false;
        params.tileSize = 40;
    }

    ~SoftwareCanvasFixture() {
        if (renderer) {
            SDL_DestroyRenderer(renderer);
        }
        if (surface) {
            SDL_DestroySurface(surface);
        }
    }

    void draw() {
        BOOST_REQUIRE(TerrainRenderer::drawFrame(renderer, params));
        BOOST_REQUIRE(SDL_FlushRenderer(renderer));
    }

    Pixel pixel(int x, int y) const {
        Pixel p;
        BOOST_REQUIRE(SDL_ReadSurfacePixel(surface, x, y, &p.r, &p.g, &p.b, &p.a));
        return p;
    }

    WorldMapPtr map{WorldMap::reference()};
    SDL_Surface* surface{nullptr};
    SDL_Renderer* renderer{nullptr};
    FrameParams params{};
};

// ============================================================================
// GUARD TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(GuardTests)

BOOST_AUTO_TEST_CASE(TestNothingToDraw) {
    FrameParams params;
    BOOST_CHECK(!TerrainRenderer::drawFrame(nullptr, params));
    params.worldMap = WorldMap::reference().get();
    BOOST_CHECK(!TerrainRenderer::drawFrame(nullptr, params));
}

BOOST_FIXTURE_TEST_CASE(TestMissingMapSkipsFrame, SoftwareCanvasFixture) {
    params.worldMap = nullptr;
    BOOST_CHECK(!TerrainRenderer::drawFrame(renderer, params));
}

BOOST_AUTO_TEST_CASE(TestBounce) {
    BOOST_CHECK_EQUAL(TerrainRenderer::bounceOffset(false, 236), 0.0f);
    const float peak = TerrainRenderer::bounceOffset(true, 236);
    BOOST_CHECK_CLOSE(peak, 2.0f, 0.1f);
    for (int64_t t = 0; t < 2000; t += 37) {
        BOOST_CHECK(std::fabs(TerrainRenderer::bounceOffset(true, t)) <= 2.0f);
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TERRAIN LAYER TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TerrainLayerTests, SoftwareCanvasFixture)

BOOST_AUTO_TEST_CASE(TestBaseColors) {
    draw();
    BOOST_CHECK(pixel(5, 5).matches(TerrainTable::color(TerrainKind::Water)));
    BOOST_CHECK(pixel(45, 85).matches(TerrainTable::color(TerrainKind::Beach)));
    BOOST_CHECK(pixel(41, 241).matches(TerrainTable::color(TerrainKind::Swamp)));
}

BOOST_AUTO_TEST_CASE(TestForestDetail) {
    // (4,2) is Forest
    draw();
    BOOST_CHECK(pixel(161, 81).matches(TerrainTable::color(TerrainKind::Forest)));
    BOOST_CHECK(pixel(180, 98).matches(0x52b788u));
    BOOST_CHECK(pixel(180, 110).matches(0x8B5E3Cu));
}

BOOST_AUTO_TEST_CASE(TestMountainSnowCap) {
    // (5,5) is Mountain
    draw();
    const auto snow = pixel(220, 218);
    BOOST_CHECK_GT(static_cast<int>(snow.r), 200);
    BOOST_CHECK(pixel(220, 228).matches(0x4e4e4eu));
}

BOOST_AUTO_TEST_CASE(TestWavesOnlyWhenEnabled) {
    // Column through Water cell (0,0); flat fill unless waves are on
    auto columnIsFlat = [this]() {
        for (int y = 0; y < 40; ++y) {
            if (!pixel(20, y).matches(TerrainTable::color(TerrainKind::Water))) {
                return false;
            }
        }
        return true;
    };

    draw();
    BOOST_CHECK(columnIsFlat());

    params.animation.wavesEnabled = true;
    params.waveOffset = 1.0;
    draw();
    BOOST_CHECK(!columnIsFlat());
}

BOOST_AUTO_TEST_CASE(TestPlayerCellDetailSkipped) {
    // River cell (1,5) with flow enabled; x=75 is clear of the sprite
    params.animation.riverEnabled = true;
    auto columnIsFlatRiver = [this]() {
        for (int y = 205; y < 235; ++y) {
            if (!pixel(75, y).matches(TerrainTable::color(TerrainKind::River))) {
                return false;
            }
        }
        return true;
    };

    draw();
    BOOST_CHECK(!columnIsFlatRiver());

    params.playerPosition = {1, 5};
    draw();
    BOOST_CHECK(columnIsFlatRiver());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SPRITE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SpriteTests, SoftwareCanvasFixture)

BOOST_AUTO_TEST_CASE(TestFrontPose) {
    draw();
    BOOST_CHECK(pixel(95, 92).matches(0xffb74du));   // Skin
    BOOST_CHECK(pixel(95, 86).matches(0x3e2723u));   // Hair
    BOOST_CHECK(pixel(95, 99).matches(0x90e0efu));   // Shirt
}

BOOST_AUTO_TEST_CASE(TestBackPoseShowsBackpack) {
    for (Direction facing : {Direction::Up, Direction::Back}) {
        params.facing = facing;
        draw();
        BOOST_CHECK(pixel(95, 99).matches(0x8d6e63u));
    }
    params.facing = Direction::Front;
    draw();
    BOOST_CHECK(pixel(95, 99).matches(0x90e0efu));
}

BOOST_AUTO_TEST_CASE(TestLeftIsMirroredRight) {
    params.facing = Direction::Right;
    draw();
    BOOST_CHECK(pixel(95, 99).matches(0x90e0efu));
    BOOST_CHECK(pixel(105, 99).matches(0x8d6e63u));

    params.facing = Direction::Left;
    draw();
    BOOST_CHECK(pixel(95, 99).matches(0x8d6e63u));
    BOOST_CHECK(pixel(105, 99).matches(0x90e0efu));
}

BOOST_AUTO_TEST_CASE(TestTreesDrawnOverPlayerInForest) {
    // (4,2) is Forest; the canopy covers the sprite's head area
    params.playerPosition = {4, 2};
    draw();
    BOOST_CHECK(pixel(180, 98).matches(0x52b788u));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CLOUD LAYER TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CloudLayerTests, SoftwareCanvasFixture)

BOOST_AUTO_TEST_CASE(TestCloudsDrawnLastWhenEnabled) {
    AnimationState::CloudArray clouds{};
    for (auto& cloud : clouds) {
        cloud = Cloud{-1000.0f, -1000.0f, 0.1f, 60.0f, 0.5f};
    }
    clouds[0] = Cloud{95.0f, 92.0f, 0.1f, 100.0f, 0.5f};  // Over the player's head
    params.clouds = &clouds;

    draw();
    const auto plain = pixel(95, 92);
    BOOST_CHECK(plain.matches(0xffb74du));

    params.animation.cloudsEnabled = true;
    draw();
    const auto clouded = pixel(95, 92);
    BOOST_CHECK(!clouded.matches(0xffb74du));
    BOOST_CHECK_GE(static_cast<int>(clouded.b), static_cast<int>(plain.b));
}

BOOST_AUTO_TEST_SUITE_END()
