#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <glm/vec2.hpp>

#include "engine/scene/Components.hpp"

namespace game::portals
{
using GridCoord = glm::ivec2;

struct WallCell
{
    GridCoord coord{0, 0};
    engine::scene::Entity entity = engine::scene::kInvalidEntity;
};

[[nodiscard]] std::int64_t PackGridKey(int x, int y);
[[nodiscard]] inline std::int64_t PackGridKey(const GridCoord& coord) { return PackGridKey(coord.x, coord.y); }

// Cell coordinates are clamped to this magnitude so neighbour offsets never overflow int.
constexpr int kMaxGridCoord = 1 << 30;

/// Floor division of a world position by the tile size, clamped to +/-kMaxGridCoord.
[[nodiscard]] GridCoord CellFromWorld(const glm::vec2& position, float tileSize);

using ClaimedCellSet = std::unordered_set<std::int64_t>;

/// Sparse lookup of unclaimed wall cells keyed by grid coordinate.
/// Built fresh for every placement attempt.
class WallGrid
{
public:
    [[nodiscard]] static WallGrid Build(const std::vector<WallCell>& cells, const ClaimedCellSet& claimed);

    void Add(const WallCell& cell);

    [[nodiscard]] bool Has(int x, int y) const;
    [[nodiscard]] const WallCell* Get(int x, int y) const;

    // True when any cell in row y lies within [fromX, toX].
    [[nodiscard]] bool AnyOccupiedInRow(int y, int fromX, int toX) const;
    // True when any cell in column x lies within [fromY, toY].
    [[nodiscard]] bool AnyOccupiedInColumn(int x, int fromY, int toY) const;

    // Occupied cells ordered by (y, x) and by (x, y).
    [[nodiscard]] std::vector<WallCell> CellsByRow() const;
    [[nodiscard]] std::vector<WallCell> CellsByColumn() const;

    [[nodiscard]] bool Empty() const { return m_cells.empty(); }
    [[nodiscard]] std::size_t Size() const { return m_cells.size(); }

    [[nodiscard]] int MinX() const { return m_minX; }
    [[nodiscard]] int MaxX() const { return m_maxX; }
    [[nodiscard]] int MinY() const { return m_minY; }
    [[nodiscard]] int MaxY() const { return m_maxY; }

private:
    std::unordered_map<std::int64_t, WallCell> m_cells;
    int m_minX = INT_MAX;
    int m_maxX = INT_MIN;
    int m_minY = INT_MAX;
    int m_maxY = INT_MIN;
};
} // namespace game::portals
