/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldMap.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

namespace Wayfarer {

namespace {

/*
 * W - Water: outer boundary, blocks movement
 * B - Beach: shoreline, fully traversable
 * F - Forest
 * M - Mountain: impassable peaks
 * G - Grassland
 * R - River: crossable
 * S - Swamp: slow going
 * H - Hills
 */
const std::vector<std::string> kReferenceRows{
    "WWWWWWWWWWWWWWWWWWWW",
    "WWBBBBBBBBBBBBBBBBWW",
    "WBGGFFFHHMHHFFFGGBBW",
    "WBGFFHHMMMMHHFFFGGBW",
    "WBFFHHMMMMMMHHFFFGBW",
    "WRRFHMMMMMMMMHHRFBBW",
    "WSRFHHMMMMMHRFFFGBBW",
    "WBGRFHHMMMMHRFFFGBBW",
    "WBGFRFHHHHHRFFFGBBWW",
    "WBGFFRFFFRRFFFGGBBWW",
    "WBGFFFRRRFFFFGGBBWWW",
    "WSRFFFFFFFFGGGBBWWWW",
    "WBBGGGGGGGGGBBBWWWWW",
    "WWBBBBBBBBBBBBWWWWWW",
    "WWWWWWWWWWWWWWWWWWWW",
};

} // anonymous namespace

WorldMap::WorldMap(const std::vector<std::string>& rows) {
    if (rows.empty() || rows.front().empty()) {
        throw std::invalid_argument("World map must have at least one row and one column");
    }

    m_height = static_cast<int>(rows.size());
    m_width = static_cast<int>(rows.front().size());
    m_cells.reserve(static_cast<size_t>(m_width) * static_cast<size_t>(m_height));

    for (int y = 0; y < m_height; ++y) {
        const std::string& row = rows[static_cast<size_t>(y)];
        if (static_cast<int>(row.size()) != m_width) {
            throw std::invalid_argument(std::format(
                "World map row {} has length {}, expected {}", y, row.size(), m_width));
        }

        for (int x = 0; x < m_width; ++x) {
            auto kind = TerrainTable::fromCode(row[static_cast<size_t>(x)]);
            if (!kind) {
                throw std::invalid_argument(std::format(
                    "Unknown terrain code '{}' at ({},{})", row[static_cast<size_t>(x)], x, y));
            }

            const bool border = (x == 0 || y == 0 || x == m_width - 1 || y == m_height - 1);
            if (border && TerrainTable::isWalkable(*kind)) {
                throw std::invalid_argument(std::format(
                    "Border cell ({},{}) is walkable {}; borders must be impassable",
                    x, y, TerrainTable::displayName(*kind)));
            }

            m_cells.push_back(*kind);
        }
    }

    WORLD_DEBUG(std::format("World map built: {}x{}", m_width, m_height));
}

std::shared_ptr<const WorldMap> WorldMap::reference() {
    // Built once, shared read-only by every engine instance
    static const std::shared_ptr<const WorldMap> s_reference =
        std::make_shared<WorldMap>(kReferenceRows);
    return s_reference;
}

TerrainKind WorldMap::at(const Position& pos) const {
    if (!inBounds(pos)) {
        throw std::out_of_range(std::format("Cell ({},{}) is outside the {}x{} world",
                                            pos.x, pos.y, m_width, m_height));
    }
    return cell(pos.x, pos.y);
}

std::vector<std::string> WorldMap::rows() const {
    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(m_height));
    for (int y = 0; y < m_height; ++y) {
        std::string row;
        row.reserve(static_cast<size_t>(m_width));
        for (int x = 0; x < m_width; ++x) {
            row.push_back(TerrainTable::code(cell(x, y)));
        }
        result.push_back(std::move(row));
    }
    return result;
}

} // namespace Wayfarer
