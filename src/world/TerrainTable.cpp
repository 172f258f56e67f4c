/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TerrainTable.hpp"
#include <limits>

namespace Wayfarer {

namespace {

constexpr float IMPASSABLE = std::numeric_limits<float>::infinity();

// Indexed by TerrainKind
constexpr std::array<TerrainProperties, TERRAIN_KIND_COUNT> kTerrainProperties{{
    {false, IMPASSABLE, "Water",     'W', {0x3b, 0x6c, 0x9e}},
    {true,  1.0f,       "Beach",     'B', {0xf2, 0xe1, 0xa5}},
    {true,  1.2f,       "Forest",    'F', {0x3b, 0x7a, 0x57}},
    {false, IMPASSABLE, "Mountain",  'M', {0x4e, 0x4e, 0x4e}},
    {true,  1.0f,       "Grassland", 'G', {0x4c, 0x9f, 0x70}},
    {true,  1.5f,       "River",     'R', {0x5e, 0x92, 0xa5}},
    {true,  2.0f,       "Swamp",     'S', {0x5a, 0x4f, 0x32}},
    {true,  1.3f,       "Hills",     'H', {0xd5, 0xc2, 0x9f}},
}};

constexpr std::array<TerrainKind, TERRAIN_KIND_COUNT> kAllKinds{
    TerrainKind::Water,     TerrainKind::Beach, TerrainKind::Forest,
    TerrainKind::Mountain,  TerrainKind::Grassland, TerrainKind::River,
    TerrainKind::Swamp,     TerrainKind::Hills};

} // anonymous namespace

const TerrainProperties& TerrainTable::get(TerrainKind kind) {
    auto index = static_cast<size_t>(kind);
    if (index >= TERRAIN_KIND_COUNT) {
        // COUNT is a sentinel, never stored in a map; treat as the outer boundary
        index = static_cast<size_t>(TerrainKind::Water);
    }
    return kTerrainProperties[index];
}

std::optional<TerrainKind> TerrainTable::fromCode(char code) {
    for (TerrainKind kind : kAllKinds) {
        if (kTerrainProperties[static_cast<size_t>(kind)].code == code) {
            return kind;
        }
    }
    return std::nullopt;
}

std::array<std::string_view, TERRAIN_KIND_COUNT> TerrainTable::names() {
    std::array<std::string_view, TERRAIN_KIND_COUNT> result{};
    for (size_t i = 0; i < TERRAIN_KIND_COUNT; ++i) {
        result[i] = kTerrainProperties[i].displayName;
    }
    return result;
}

std::array<TerrainColor, TERRAIN_KIND_COUNT> TerrainTable::colors() {
    std::array<TerrainColor, TERRAIN_KIND_COUNT> result{};
    for (size_t i = 0; i < TERRAIN_KIND_COUNT; ++i) {
        result[i] = kTerrainProperties[i].color;
    }
    return result;
}

const std::array<TerrainKind, TERRAIN_KIND_COUNT>& TerrainTable::allKinds() {
    return kAllKinds;
}

} // namespace Wayfarer
