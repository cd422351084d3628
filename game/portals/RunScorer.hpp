#pragma once

#include <vector>

#include "game/portals/WallGrid.hpp"
#include "game/portals/WallRun.hpp"

namespace game::portals
{
namespace ScoreConstants
{
    constexpr int kClearSideBonus = 10; // per perpendicular side with no neighbouring wall
}

/// Boundary exposure bonus minus distance from the preferred length.
/// Writes the result into run.score and returns it.
int ScoreRun(WallRun& run, const WallGrid& grid, int preferredLength);

void ScoreRuns(std::vector<WallRun>& runs, const WallGrid& grid, int preferredLength);
} // namespace game::portals
