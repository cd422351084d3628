#include "game/portals/WallGrid.hpp"

#include <algorithm>
#include <cmath>

namespace game::portals
{
std::int64_t PackGridKey(int x, int y)
{
    return static_cast<std::int64_t>((static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32U) |
                                     static_cast<std::uint64_t>(static_cast<std::uint32_t>(y)));
}

namespace
{
[[nodiscard]] int ClampedCell(float position, float tileSize)
{
    const double cell = std::floor(static_cast<double>(position) / static_cast<double>(tileSize));
    if (std::isnan(cell))
    {
        return 0;
    }
    return static_cast<int>(std::clamp(cell, static_cast<double>(-kMaxGridCoord), static_cast<double>(kMaxGridCoord)));
}
} // namespace

GridCoord CellFromWorld(const glm::vec2& position, float tileSize)
{
    return GridCoord{ClampedCell(position.x, tileSize), ClampedCell(position.y, tileSize)};
}

WallGrid WallGrid::Build(const std::vector<WallCell>& cells, const ClaimedCellSet& claimed)
{
    WallGrid grid;
    for (const WallCell& cell : cells)
    {
        if (claimed.contains(PackGridKey(cell.coord)))
        {
            continue;
        }
        grid.Add(cell);
    }
    return grid;
}

void WallGrid::Add(const WallCell& cell)
{
    m_cells[PackGridKey(cell.coord)] = cell;
    m_minX = std::min(m_minX, cell.coord.x);
    m_maxX = std::max(m_maxX, cell.coord.x);
    m_minY = std::min(m_minY, cell.coord.y);
    m_maxY = std::max(m_maxY, cell.coord.y);
}

bool WallGrid::Has(int x, int y) const
{
    return m_cells.contains(PackGridKey(x, y));
}

const WallCell* WallGrid::Get(int x, int y) const
{
    const auto it = m_cells.find(PackGridKey(x, y));
    if (it == m_cells.end())
    {
        return nullptr;
    }
    return &it->second;
}

std::vector<WallCell> WallGrid::CellsByRow() const
{
    std::vector<WallCell> cells;
    cells.reserve(m_cells.size());
    for (const auto& [key, cell] : m_cells)
    {
        cells.push_back(cell);
    }
    std::sort(cells.begin(), cells.end(), [](const WallCell& a, const WallCell& b) {
        return a.coord.y != b.coord.y ? a.coord.y < b.coord.y : a.coord.x < b.coord.x;
    });
    return cells;
}

std::vector<WallCell> WallGrid::CellsByColumn() const
{
    std::vector<WallCell> cells = CellsByRow();
    std::sort(cells.begin(), cells.end(), [](const WallCell& a, const WallCell& b) {
        return a.coord.x != b.coord.x ? a.coord.x < b.coord.x : a.coord.y < b.coord.y;
    });
    return cells;
}

bool WallGrid::AnyOccupiedInRow(int y, int fromX, int toX) const
{
    for (int x = fromX; x <= toX; ++x)
    {
        if (Has(x, y))
        {
            return true;
        }
    }
    return false;
}

bool WallGrid::AnyOccupiedInColumn(int x, int fromY, int toY) const
{
    for (int y = fromY; y <= toY; ++y)
    {
        if (Has(x, y))
        {
            return true;
        }
    }
    return false;
}
} // namespace game::portals
