/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRAIN_RENDERER_HPP
#define TERRAIN_RENDERER_HPP

/**
 * @file TerrainRenderer.hpp
 * @brief Stateless drawing of one frame: terrain, player sprite, clouds
 *
 * Layer order:
 *   1. Base colour of every cell
 *   2. Terrain detail (trees, peaks, waves, river flow) on every cell except
 *      the player's
 *   3. Player sprite (pose by facing, bounce while moving)
 *   4. Trees again over the player when standing in a forest
 *   5. Clouds, when enabled
 *
 * Everything is drawn with SDL_Renderer primitives so the same code runs on
 * a window renderer and on a software renderer over an SDL_Surface.
 */

#include "engine/EngineTypes.hpp"
#include "render/AnimationState.hpp"
#include "world/TerrainTable.hpp"
#include "world/WorldMap.hpp"
#include <cstdint>

struct SDL_Renderer;

namespace Wayfarer {

struct FrameParams {
    const WorldMap* worldMap{nullptr};
    Position playerPosition{};
    Direction facing{Direction::Down};
    bool isMoving{false};
    AnimationSettings animation{};
    double waveOffset{0.0};
    double riverOffset{0.0};
    const AnimationState::CloudArray* clouds{nullptr};
    int tileSize{DEFAULT_TILE_SIZE};
    int64_t nowMs{0};  // Drives the walking bounce
};

class TerrainRenderer {
public:
    /**
     * @brief Draw a full frame
     * @return false if there is no renderer or no map; nothing is drawn
     */
    static bool drawFrame(SDL_Renderer* renderer, const FrameParams& params);

    static void drawTrees(SDL_Renderer* renderer, float x, float y, float size);
    static void drawMountain(SDL_Renderer* renderer, float x, float y, float size);
    static void drawWaves(SDL_Renderer* renderer, float x, float y, float size, double waveOffset);
    static void drawRiver(SDL_Renderer* renderer, float x, float y, float size, double riverOffset);
    static void drawCloud(SDL_Renderer* renderer, const Cloud& cloud);
    static void drawCharacter(SDL_Renderer* renderer, float x, float y, float size,
                              Direction facing, bool isMoving, int64_t nowMs);

    // Vertical bounce in pixels for the walking animation
    [[nodiscard]] static float bounceOffset(bool isMoving, int64_t nowMs);
};

} // namespace Wayfarer

#endif // TERRAIN_RENDERER_HPP
