#include "game/portals/RunScorer.hpp"

#include <cstdlib>

namespace game::portals
{
int ScoreRun(WallRun& run, const WallGrid& grid, int preferredLength)
{
    int score = 0;
    const GridCoord end = run.End();

    if (run.IsHorizontal())
    {
        if (!grid.AnyOccupiedInRow(run.start.y + 1, run.start.x, end.x))
        {
            score += ScoreConstants::kClearSideBonus;
        }
        if (!grid.AnyOccupiedInRow(run.start.y - 1, run.start.x, end.x))
        {
            score += ScoreConstants::kClearSideBonus;
        }
    }
    else
    {
        if (!grid.AnyOccupiedInColumn(run.start.x - 1, run.start.y, end.y))
        {
            score += ScoreConstants::kClearSideBonus;
        }
        if (!grid.AnyOccupiedInColumn(run.start.x + 1, run.start.y, end.y))
        {
            score += ScoreConstants::kClearSideBonus;
        }
    }

    score -= std::abs(run.length - preferredLength);
    run.score = score;
    return score;
}

void ScoreRuns(std::vector<WallRun>& runs, const WallGrid& grid, int preferredLength)
{
    for (WallRun& run : runs)
    {
        ScoreRun(run, grid, preferredLength);
    }
}
} // namespace game::portals
