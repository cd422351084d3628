#include "game/portals/WallRun.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>

namespace game::portals
{
namespace
{
[[nodiscard]] WallRun MakeRun(const std::vector<WallCell>& cells, std::size_t offset, std::size_t count, RunOrientation orientation)
{
    WallRun run;
    run.orientation = orientation;
    run.cells.assign(cells.begin() + static_cast<std::ptrdiff_t>(offset),
                     cells.begin() + static_cast<std::ptrdiff_t>(offset + count));
    run.start = run.cells.front().coord;
    run.length = static_cast<int>(count);
    return run;
}
} // namespace

const char* RunOrientationToText(RunOrientation orientation)
{
    switch (orientation)
    {
        case RunOrientation::Horizontal: return "horizontal";
        case RunOrientation::Vertical: return "vertical";
        default: return "unknown";
    }
}

WallRunDetector::WallRunDetector(int minLength, int maxLength)
    : m_minLength(minLength)
    , m_maxLength(maxLength)
{
}

std::vector<WallRun> WallRunDetector::FindRuns(const WallGrid& grid) const
{
    std::vector<WallRun> runs = FindHorizontalRuns(grid);
    std::vector<WallRun> vertical = FindVerticalRuns(grid);
    runs.insert(runs.end(), std::make_move_iterator(vertical.begin()), std::make_move_iterator(vertical.end()));
    return runs;
}

std::vector<WallRun> WallRunDetector::FindHorizontalRuns(const WallGrid& grid) const
{
    std::vector<WallRun> runs;
    if (grid.Empty() || !BoundsValid())
    {
        return runs;
    }
    ScanLines(runs, grid.CellsByRow(), RunOrientation::Horizontal);
    return runs;
}

std::vector<WallRun> WallRunDetector::FindVerticalRuns(const WallGrid& grid) const
{
    std::vector<WallRun> runs;
    if (grid.Empty() || !BoundsValid())
    {
        return runs;
    }
    ScanLines(runs, grid.CellsByColumn(), RunOrientation::Vertical);
    return runs;
}

void WallRunDetector::ScanLines(std::vector<WallRun>& out, const std::vector<WallCell>& sortedCells, RunOrientation orientation) const
{
    const bool horizontal = orientation == RunOrientation::Horizontal;
    std::vector<WallCell> current;
    for (const WallCell& cell : sortedCells)
    {
        if (!current.empty())
        {
            const GridCoord& previous = current.back().coord;
            const bool sameLine = horizontal ? previous.y == cell.coord.y : previous.x == cell.coord.x;
            const std::int64_t gap = horizontal
                ? static_cast<std::int64_t>(cell.coord.x) - previous.x
                : static_cast<std::int64_t>(cell.coord.y) - previous.y;
            if (!sameLine || gap != 1)
            {
                AppendSegments(out, current, orientation);
                current.clear();
            }
        }
        current.push_back(cell);
    }
    AppendSegments(out, current, orientation);
}

void WallRunDetector::AppendSegments(std::vector<WallRun>& out, const std::vector<WallCell>& maximalRun, RunOrientation orientation) const
{
    if (!BoundsValid())
    {
        return;
    }

    const std::size_t total = maximalRun.size();
    const auto minLength = static_cast<std::size_t>(m_minLength);
    const auto maxLength = static_cast<std::size_t>(m_maxLength);

    if (total < minLength)
    {
        return;
    }

    if (total <= maxLength)
    {
        out.push_back(MakeRun(maximalRun, 0, total, orientation));
        return;
    }

    for (std::size_t offset = 0; offset + minLength <= total; offset += maxLength)
    {
        const std::size_t segmentLength = std::min(maxLength, total - offset);
        if (segmentLength >= minLength)
        {
            out.push_back(MakeRun(maximalRun, offset, segmentLength, orientation));
        }
    }
}
} // namespace game::portals
