#include <catch2/catch.hpp>

#include "PortalTestUtils.hpp"
#include "game/portals/RunScorer.hpp"

using game::portals::ScoreRun;
using game::portals::ScoreRuns;
using game::portals::WallRunDetector;

TEST_CASE("Fully exposed run at the preferred length scores the maximum", "[run_scorer]")
{
    const auto grid = test_utils::GridFromAscii({"####"});
    auto runs = WallRunDetector(4, 5).FindRuns(grid);
    REQUIRE(runs.size() == 1);

    CHECK(ScoreRun(runs[0], grid, 4) == 20);
    CHECK(runs[0].score == 20);
}

TEST_CASE("Length penalty is the distance from the preferred length", "[run_scorer]")
{
    const auto grid = test_utils::GridFromAscii({"#####"});
    auto runs = WallRunDetector(4, 5).FindRuns(grid);
    REQUIRE(runs.size() == 1);

    CHECK(ScoreRun(runs[0], grid, 4) == 19);
    CHECK(ScoreRun(runs[0], grid, 5) == 20);
    CHECK(ScoreRun(runs[0], grid, 8) == 17);
}

TEST_CASE("Exposed run outscores an identical run enclosed on one side", "[run_scorer]")
{
    const auto exposedGrid = test_utils::GridFromAscii({"####"});
    const auto enclosedGrid = test_utils::GridFromAscii({
        "####",
        "..#.",
    });

    auto exposed = WallRunDetector(4, 5).FindHorizontalRuns(exposedGrid);
    auto enclosed = WallRunDetector(4, 5).FindHorizontalRuns(enclosedGrid);
    REQUIRE(exposed.size() == 1);
    REQUIRE(enclosed.size() == 1);

    const int exposedScore = ScoreRun(exposed[0], exposedGrid, 4);
    const int enclosedScore = ScoreRun(enclosed[0], enclosedGrid, 4);
    CHECK(exposedScore > enclosedScore);
    CHECK(enclosedScore == 10);
}

TEST_CASE("Run enclosed on both sides gets no boundary bonus", "[run_scorer]")
{
    const auto grid = test_utils::GridFromAscii({
        "#...",
        "####",
        "...#",
    });
    auto runs = WallRunDetector(4, 5).FindHorizontalRuns(grid);
    REQUIRE(runs.size() == 1);
    CHECK(ScoreRun(runs[0], grid, 4) == 0);
}

TEST_CASE("Vertical runs look left and right", "[run_scorer]")
{
    const auto grid = test_utils::GridFromAscii({
        ".#.",
        ".#.",
        ".##",
        ".#.",
    });
    auto runs = WallRunDetector(4, 5).FindVerticalRuns(grid);
    REQUIRE(runs.size() == 1);
    CHECK(ScoreRun(runs[0], grid, 4) == 10);
}

TEST_CASE("Neighbours beyond the run span do not count", "[run_scorer]")
{
    const auto grid = test_utils::GridFromAscii({
        ".####.",
        "#....#",
    });
    auto runs = WallRunDetector(4, 5).FindHorizontalRuns(grid);
    REQUIRE(runs.size() == 1);
    CHECK(ScoreRun(runs[0], grid, 4) == 20);
}

TEST_CASE("ScoreRuns annotates every run", "[run_scorer]")
{
    const auto grid = test_utils::GridFromAscii({
        "#####",
        "#....",
        "#....",
        "#....",
    });
    auto runs = WallRunDetector(4, 5).FindRuns(grid);
    REQUIRE(runs.size() == 2);

    ScoreRuns(runs, grid, 4);
    // Row (0,0)-(4,0): row below has (0,1) -> one side clear, length 5.
    CHECK(runs[0].score == 9);
    // Column (0,0)-(0,3): column to the right has (1,0) -> one side clear, length 4.
    CHECK(runs[1].score == 10);
}
