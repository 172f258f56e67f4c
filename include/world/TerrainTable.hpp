/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TERRAIN_TABLE_HPP
#define TERRAIN_TABLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>

namespace Wayfarer {

// Display/spatial constants
constexpr int DEFAULT_TILE_SIZE = 40;  // Logical units per tile

enum class TerrainKind : uint8_t {
    Water = 0,
    Beach,
    Forest,
    Mountain,
    Grassland,
    River,
    Swamp,
    Hills,
    COUNT
};

constexpr size_t TERRAIN_KIND_COUNT = static_cast<size_t>(TerrainKind::COUNT);

struct TerrainColor {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};

    bool operator==(const TerrainColor&) const = default;
};

/**
 * Static per-kind properties. Impassable kinds carry an infinite movement cost.
 */
struct TerrainProperties {
    bool walkable;
    float movementCost;
    std::string_view displayName;
    char code;              // Single-character map code ('W', 'B', ...)
    TerrainColor color;
};

/**
 * @brief Immutable lookup of terrain kind -> properties
 *
 * The table is defined once at compile time; every function here is a pure
 * lookup and is safe to call from any thread.
 */
class TerrainTable {
public:
    [[nodiscard]] static const TerrainProperties& get(TerrainKind kind);

    [[nodiscard]] static bool isWalkable(TerrainKind kind) { return get(kind).walkable; }
    [[nodiscard]] static float movementCost(TerrainKind kind) { return get(kind).movementCost; }
    [[nodiscard]] static std::string_view displayName(TerrainKind kind) { return get(kind).displayName; }
    [[nodiscard]] static TerrainColor color(TerrainKind kind) { return get(kind).color; }
    [[nodiscard]] static char code(TerrainKind kind) { return get(kind).code; }

    /**
     * @brief Map code ('W', 'B', 'F', 'M', 'G', 'R', 'S', 'H') to a kind
     * @return std::nullopt for an unknown code
     */
    [[nodiscard]] static std::optional<TerrainKind> fromCode(char code);

    // Display names and colours indexed by kind, as handed to UI consumers
    [[nodiscard]] static std::array<std::string_view, TERRAIN_KIND_COUNT> names();
    [[nodiscard]] static std::array<TerrainColor, TERRAIN_KIND_COUNT> colors();

    // Every kind in declaration order, for table-driven iteration
    [[nodiscard]] static const std::array<TerrainKind, TERRAIN_KIND_COUNT>& allKinds();
};

[[nodiscard]] inline std::optional<TerrainKind> terrainFromCode(char code) {
    return TerrainTable::fromCode(code);
}

[[nodiscard]] inline std::string_view toString(TerrainKind kind) {
    return kind == TerrainKind::COUNT ? std::string_view("UNKNOWN") : TerrainTable::displayName(kind);
}

inline std::ostream& operator<<(std::ostream& os, const TerrainKind& kind) {
    if (kind == TerrainKind::COUNT) {
        return os << "UNKNOWN";
    }
    return os << TerrainTable::displayName(kind);
}

} // namespace Wayfarer

#endif // TERRAIN_TABLE_HPP
