/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_MAP_HPP
#define WORLD_MAP_HPP

#include "world/TerrainTable.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace Wayfarer {

struct Position {
    int x{0};
    int y{0};

    bool operator==(const Position&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Position& pos) {
    return os << "(" << pos.x << "," << pos.y << ")";
}

/**
 * @brief Fixed rectangular grid of terrain kinds, row-major
 *
 * Immutable once constructed. Construction enforces:
 * - at least one row and one column, all rows of equal length
 * - every code is a known terrain code
 * - every border cell is impassable, so no walk can leave the grid even
 *   without the explicit bounds check
 *
 * Violations throw std::invalid_argument.
 */
class WorldMap {
public:
    /**
     * @brief Build a map from rows of terrain codes ("WWBG...")
     * @throws std::invalid_argument if any invariant above is violated
     */
    explicit WorldMap(const std::vector<std::string>& rows);

    /**
     * @brief The shared 20x15 reference map
     */
    [[nodiscard]] static std::shared_ptr<const WorldMap> reference();

    [[nodiscard]] int width() const noexcept { return m_width; }
    [[nodiscard]] int height() const noexcept { return m_height; }

    [[nodiscard]] bool inBounds(const Position& pos) const noexcept {
        return pos.x >= 0 && pos.x < m_width && pos.y >= 0 && pos.y < m_height;
    }

    /**
     * @brief Terrain at a cell
     * @throws std::out_of_range if @p pos is outside the grid
     */
    [[nodiscard]] TerrainKind at(const Position& pos) const;

    // Unchecked access for hot loops that already iterate inside the bounds
    [[nodiscard]] TerrainKind cell(int x, int y) const noexcept {
        return m_cells[static_cast<size_t>(y) * static_cast<size_t>(m_width) +
                       static_cast<size_t>(x)];
    }

    /**
     * @brief Rows rendered back to terrain codes, for logging and UI consumers
     */
    [[nodiscard]] std::vector<std::string> rows() const;

    [[nodiscard]] const std::vector<TerrainKind>& cells() const noexcept { return m_cells; }

private:
    int m_width{0};
    int m_height{0};
    std::vector<TerrainKind> m_cells;
};

using WorldMapPtr = std::shared_ptr<const WorldMap>;

} // namespace Wayfarer

#endif // WORLD_MAP_HPP
