/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/TerrainRenderer.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <numbers>

namespace Wayfarer {

namespace {

struct Rgba {
    uint8_t r;
    uint8_t g;
    uint8_t b;
    uint8_t a;
};

constexpr Rgba hexColor(uint32_t rgb, uint8_t alpha = 255) {
    return Rgba{static_cast<uint8_t>((rgb >> 16) & 0xFF),
                static_cast<uint8_t>((rgb >> 8) & 0xFF),
                static_cast<uint8_t>(rgb & 0xFF), alpha};
}

constexpr uint8_t alphaByte(float alpha) {
    return static_cast<uint8_t>(alpha * 255.0f + 0.5f);
}

// Sprite palette
constexpr Rgba SKIN = hexColor(0xffb74d);
constexpr Rgba SHIRT = hexColor(0x90e0ef);
constexpr Rgba PANTS = hexColor(0x3f51b5);
constexpr Rgba BACKPACK = hexColor(0x8d6e63);
constexpr Rgba SHOES = hexColor(0x37474f);
constexpr Rgba HAIR = hexColor(0x3e2723);

// Terrain detail palette
constexpr Rgba TRUNK = hexColor(0x8B5E3C);
constexpr Rgba CANOPY = hexColor(0x52b788);
constexpr Rgba PEAK = hexColor(0x4e4e4e);
constexpr Rgba SNOW_CAP{255, 255, 255, alphaByte(0.8f)};
constexpr Rgba WAVE_TOP{0, 181, 216, alphaByte(0.6f)};
constexpr Rgba WAVE_BOTTOM{0, 105, 148, alphaByte(0.8f)};
constexpr Rgba RIVER_LEFT{100, 181, 246, alphaByte(0.6f)};
constexpr Rgba RIVER_RIGHT{30, 136, 229, alphaByte(0.8f)};
constexpr Rgba CLOUD_WHITE{255, 255, 255, alphaByte(0.4f)};

constexpr float WAVE_LINE_WIDTH = 8.0f;
constexpr float RIVER_LINE_WIDTH = 4.0f;
constexpr float RIVER_AMPLITUDE = 3.0f;

Rgba toRgba(TerrainColor color) {
    return Rgba{color.r, color.g, color.b, 255};
}

Rgba lerpColor(const Rgba& from, const Rgba& to, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    auto mix = [t](uint8_t a, uint8_t b) {
        return static_cast<uint8_t>(static_cast<float>(a) + (static_cast<float>(b) - static_cast<float>(a)) * t);
    };
    return Rgba{mix(from.r, to.r), mix(from.g, to.g), mix(from.b, to.b), mix(from.a, to.a)};
}

void fillRect(SDL_Renderer* renderer, float x, float y, float w, float h, const Rgba& color) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    const SDL_FRect rect{std::floor(x), std::floor(y), std::floor(w), std::floor(h)};
    SDL_RenderFillRect(renderer, &rect);
}

void fillTriangle(SDL_Renderer* renderer, SDL_FPoint a, SDL_FPoint b, SDL_FPoint c, const Rgba& color) {
    const SDL_FColor fc{color.r / 255.0f, color.g / 255.0f, color.b / 255.0f, color.a / 255.0f};
    const std::array<SDL_Vertex, 3> vertices{{
        {a, fc, {0.0f, 0.0f}},
        {b, fc, {0.0f, 0.0f}},
        {c, fc, {0.0f, 0.0f}},
    }};
    SDL_RenderGeometry(renderer, nullptr, vertices.data(), static_cast<int>(vertices.size()), nullptr, 0);
}

// Scanline fill; each row is one rect so alpha is applied once per pixel
void fillCircle(SDL_Renderer* renderer, float cx, float cy, float radius, const Rgba& color) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    const int r = static_cast<int>(std::ceil(radius));
    for (int dy = -r; dy <= r; ++dy) {
        const float fdy = static_cast<float>(dy);
        const float span = radius * radius - fdy * fdy;
        if (span < 0.0f) {
            continue;
        }
        const float half = std::sqrt(span);
        const SDL_FRect row{std::floor(cx - half), std::floor(cy + fdy), std::floor(2.0f * half), 1.0f};
        SDL_RenderFillRect(renderer, &row);
    }
}

} // namespace

float TerrainRenderer::bounceOffset(bool isMoving, int64_t nowMs) {
    if (!isMoving) {
        return 0.0f;
    }
    return static_cast<float>(std::sin(static_cast<double>(nowMs) / 150.0) * 2.0);
}

void TerrainRenderer::drawTrees(SDL_Renderer* renderer, float x, float y, float size) {
    fillRect(renderer, x + size / 3.0f, y + size / 2.0f, size / 3.0f, size / 2.0f, TRUNK);
    fillTriangle(renderer,
                 SDL_FPoint{x + size / 2.0f, y + size / 4.0f},
                 SDL_FPoint{x + size / 4.0f, y + size / 2.0f},
                 SDL_FPoint{x + 3.0f * size / 4.0f, y + size / 2.0f},
                 CANOPY);
}

void TerrainRenderer::drawMountain(SDL_Renderer* renderer, float x, float y, float size) {
    fillTriangle(renderer,
                 SDL_FPoint{x + size / 2.0f, y + size / 4.0f},
                 SDL_FPoint{x + size / 4.0f, y + 3.0f * size / 4.0f},
                 SDL_FPoint{x + 3.0f * size / 4.0f, y + 3.0f * size / 4.0f},
                 PEAK);
    fillTriangle(renderer,
                 SDL_FPoint{x + size / 2.0f, y + size / 4.0f},
                 SDL_FPoint{x + size / 3.0f, y + size / 2.0f},
                 SDL_FPoint{x + 2.0f * size / 3.0f, y + size / 2.0f},
                 SNOW_CAP);
}

void TerrainRenderer::drawWaves(SDL_Renderer* renderer, float x, float y, float size, double waveOffset) {
    for (int i = 0; i < 3; ++i) {
        const double phase = waveOffset + (i * std::numbers::pi) / 3.0;
        const float yOffset = (size / 3.0f) * static_cast<float>(i);

        for (int j = 0; j <= static_cast<int>(size); j += 2) {
            const float curveY =
                y + yOffset + static_cast<float>(std::sin(phase + j / 40.0) * 5.0);
            const Rgba color = lerpColor(WAVE_TOP, WAVE_BOTTOM, (curveY - y) / size);
            fillRect(renderer, x + static_cast<float>(j), curveY - WAVE_LINE_WIDTH / 2.0f,
                     2.0f, WAVE_LINE_WIDTH, color);
        }
    }
}

void TerrainRenderer::drawRiver(SDL_Renderer* renderer, float x, float y, float size, double riverOffset) {
    const double frequency = size / 80.0;
    for (int i = 0; i <= static_cast<int>(size); ++i) {
        const float yPos = y + size / 2.0f +
                           static_cast<float>(std::sin(riverOffset + i * frequency)) * RIVER_AMPLITUDE;
        const Rgba color = lerpColor(RIVER_LEFT, RIVER_RIGHT, static_cast<float>(i) / size);
        fillRect(renderer, x + static_cast<float>(i), yPos - RIVER_LINE_WIDTH / 2.0f,
                 1.0f, RIVER_LINE_WIDTH, color);
    }
}

void TerrainRenderer::drawCloud(SDL_Renderer* renderer, const Cloud& cloud) {
    const float s = cloud.size;
    fillCircle(renderer, cloud.x, cloud.y, s * 0.4f, CLOUD_WHITE);
    fillCircle(renderer, cloud.x + s * 0.3f, cloud.y - s * 0.1f, s * 0.4f, CLOUD_WHITE);
    fillCircle(renderer, cloud.x + s * 0.4f, cloud.y + s * 0.1f, s * 0.35f, CLOUD_WHITE);
    fillCircle(renderer, cloud.x + s * 0.6f, cloud.y, s * 0.3f, CLOUD_WHITE);
}

void TerrainRenderer::drawCharacter(SDL_Renderer* renderer, float x, float y, float size,
                                    Direction facing, bool isMoving, int64_t nowMs) {
    const float bounce = bounceOffset(isMoving, nowMs);
    const float scale = size / 40.0f;

    const float baseX = std::floor(x + size / 4.0f);
    const float baseY = std::floor(y + size / 4.0f + bounce);

    const float head = 10.0f * scale;
    const float body = 12.0f * scale;
    const float limb = 4.0f * scale;

    const bool sideView = facing == Direction::Left || facing == Direction::Right;
    const bool mirrored = facing == Direction::Left;
    const bool backView = facing == Direction::Up || facing == Direction::Back;

    // Left-facing is the right-facing pose mirrored about the tile centre
    auto rect = [&](float rx, float ry, float w, float h, const Rgba& color) {
        if (mirrored) {
            rx = 2.0f * x + size - rx - w;
        }
        fillRect(renderer, rx, ry, w, h, color);
    };

    const double swing = isMoving ? std::sin(static_cast<double>(nowMs) / 150.0) : 0.0;
    const float armOffset = static_cast<float>(swing * (sideView ? 3.0 : 2.0));
    const float feetY = baseY + head + body + limb * 2.0f;

    // Body
    rect(baseX, baseY + head, head, body, SHIRT);
    rect(baseX, baseY + head + body, head, limb * 2.0f, PANTS);

    if (sideView) {
        rect(baseX + head, baseY + head, limb * 1.5f, body * 0.7f, BACKPACK);
        rect(baseX, baseY, head, head, SKIN);
        rect(baseX, baseY, head, limb, HAIR);
    } else {
        if (backView) {
            rect(baseX - limb, baseY + head, head + limb * 2.0f, body * 0.7f, BACKPACK);
        }
        rect(baseX, baseY, head, head, SKIN);
        rect(baseX - scale, baseY, head + 2.0f * scale, limb, HAIR);
    }

    // Arms
    rect(baseX - limb, baseY + head + armOffset, limb, limb * 2.0f, SHIRT);
    rect(baseX + head, baseY + head - armOffset, limb, limb * 2.0f, SHIRT);

    // Shoes
    rect(baseX, feetY, limb * 1.5f, limb, SHOES);
    rect(baseX + limb * 1.5f, feetY, limb * 1.5f, limb, SHOES);
}

bool TerrainRenderer::drawFrame(SDL_Renderer* renderer, const FrameParams& params) {
    if (!renderer || !params.worldMap) {
        return false;
    }

    const WorldMap& map = *params.worldMap;
    const float tile = static_cast<float>(params.tileSize);

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    if (!SDL_RenderClear(renderer)) {
        RENDERER_ERROR(std::format("SDL_RenderClear failed: {}", SDL_GetError()));
        return false;
    }

    // Pass 1: base colours
    for (int row = 0; row < map.height(); ++row) {
        for (int col = 0; col < map.width(); ++col) {
            fillRect(renderer, col * tile, row * tile, tile, tile,
                     toRgba(TerrainTable::color(map.cell(col, row))));
        }
    }

    // Pass 2: details, skipping the player's cell so the sprite stays readable
    for (int row = 0; row < map.height(); ++row) {
        for (int col = 0; col < map.width(); ++col) {
            if (col == params.playerPosition.x && row == params.playerPosition.y) {
                continue;
            }

            const float x = col * tile;
            const float y = row * tile;
            const TerrainKind kind = map.cell(col, row);
            switch (kind) {
                case TerrainKind::Forest:
                    drawTrees(renderer, x, y, tile);
                    break;
                case TerrainKind::Mountain:
                    drawMountain(renderer, x, y, tile);
                    break;
                case TerrainKind::Water:
                    if (params.animation.wavesEnabled) {
                        drawWaves(renderer, x, y, tile, params.waveOffset);
                    } else {
                        fillRect(renderer, x, y, tile, tile, toRgba(TerrainTable::color(kind)));
                    }
                    break;
                case TerrainKind::River:
                    if (params.animation.riverEnabled) {
                        drawRiver(renderer, x, y, tile, params.riverOffset);
                    } else {
                        fillRect(renderer, x, y, tile, tile, toRgba(TerrainTable::color(kind)));
                    }
                    break;
                default:
                    break;
            }
        }
    }

    const float px = params.playerPosition.x * tile;
    const float py = params.playerPosition.y * tile;
    drawCharacter(renderer, px, py - tile / 8.0f, tile, params.facing, params.isMoving, params.nowMs);

    // Player stands among the trees, not on top of them
    if (map.inBounds(params.playerPosition) &&
        map.at(params.playerPosition) == TerrainKind::Forest) {
        drawTrees(renderer, px, py, tile);
    }

    if (params.animation.cloudsEnabled && params.clouds) {
        for (const auto& cloud : *params.clouds) {
            drawCloud(renderer, cloud);
        }
    }

    return true;
}

} // namespace Wayfarer
