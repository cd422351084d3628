#pragma once

#include <vector>

#include "game/portals/WallGrid.hpp"

namespace game::portals
{
enum class RunOrientation
{
    Horizontal,
    Vertical
};

struct WallRun
{
    std::vector<WallCell> cells; // natural order: increasing x, or increasing y
    GridCoord start{0, 0};
    int length = 0;
    RunOrientation orientation = RunOrientation::Horizontal;
    int score = 0;

    [[nodiscard]] bool IsHorizontal() const { return orientation == RunOrientation::Horizontal; }
    [[nodiscard]] GridCoord End() const
    {
        return IsHorizontal() ? GridCoord{start.x + length - 1, start.y} : GridCoord{start.x, start.y + length - 1};
    }
};

[[nodiscard]] const char* RunOrientationToText(RunOrientation orientation);

class WallRunDetector
{
public:
    WallRunDetector(int minLength, int maxLength);

    /// Horizontal runs followed by vertical runs, each within [minLength, maxLength].
    [[nodiscard]] std::vector<WallRun> FindRuns(const WallGrid& grid) const;
    [[nodiscard]] std::vector<WallRun> FindHorizontalRuns(const WallGrid& grid) const;
    [[nodiscard]] std::vector<WallRun> FindVerticalRuns(const WallGrid& grid) const;

    /// Applies the length policy to one maximal run: drop when too short, keep when in
    /// range, otherwise cut into maxLength strides and drop a too-short remainder.
    void AppendSegments(std::vector<WallRun>& out, const std::vector<WallCell>& maximalRun, RunOrientation orientation) const;

    [[nodiscard]] int MinLength() const { return m_minLength; }
    [[nodiscard]] int MaxLength() const { return m_maxLength; }

private:
    // Splits cells sorted along the scan axis into maximal runs and segments each one.
    void ScanLines(std::vector<WallRun>& out, const std::vector<WallCell>& sortedCells, RunOrientation orientation) const;

    [[nodiscard]] bool BoundsValid() const { return m_minLength >= 1 && m_maxLength >= m_minLength; }

    int m_minLength = 1;
    int m_maxLength = 1;
};
} // namespace game::portals
