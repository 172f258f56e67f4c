/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_STATE_UPDATE_HPP
#define GAME_STATE_UPDATE_HPP

/**
 * @file GameStateUpdate.hpp
 * @brief UI-facing view of the game, republished on every merged snapshot
 *
 * Presentation consumers (status line, legend, debug panel) read this and
 * nothing else. It is a copy; consumers never see engine-owned memory.
 */

#include "engine/EngineTypes.hpp"
#include "world/TerrainTable.hpp"
#include "world/WorldMap.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace Wayfarer {

struct GameStateUpdate {
    PlayerState state{};
    TerrainKind currentTerrain{TerrainKind::Grassland};
    WorldMapPtr worldMap{};
    std::array<TerrainColor, TERRAIN_KIND_COUNT> terrainColors{TerrainTable::colors()};
    std::array<std::string_view, TERRAIN_KIND_COUNT> terrainNames{TerrainTable::names()};
    std::string message{};

    // Latest demo progress seen on the channel
    std::optional<int> progressStep{};
    std::optional<int> progressTotal{};
    std::optional<int64_t> progressResult{};
};

} // namespace Wayfarer

#endif // GAME_STATE_UPDATE_HPP
