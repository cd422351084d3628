#include <catch2/catch.hpp>

#include <algorithm>
#include <string>
#include <utility>

#include "PortalTestUtils.hpp"
#include "game/portals/WallRun.hpp"

using game::portals::RunOrientation;
using game::portals::WallRun;
using game::portals::WallRunDetector;

namespace
{
std::string Row(int length)
{
    return std::string(static_cast<std::size_t>(length), '#');
}
} // namespace

TEST_CASE("Five cell row yields one unsplit run", "[wall_runs]")
{
    const auto grid = test_utils::GridFromAscii({Row(5)});
    const WallRunDetector detector(4, 5);

    const std::vector<WallRun> runs = detector.FindRuns(grid);

    REQUIRE(runs.size() == 1);
    CHECK(runs[0].length == 5);
    CHECK(runs[0].orientation == RunOrientation::Horizontal);
    CHECK(runs[0].start == glm::ivec2{0, 0});
    CHECK(runs[0].End() == glm::ivec2{4, 0});
    CHECK(test_utils::CoordsOf(runs[0]) ==
          std::vector<glm::ivec2>{{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}});
}

TEST_CASE("Over-long runs are cut into max-length strides", "[wall_runs]")
{
    const WallRunDetector detector(4, 5);

    SECTION("length 12 gives 5 + 5 and drops the remainder of 2")
    {
        const auto runs = detector.FindRuns(test_utils::GridFromAscii({Row(12)}));
        REQUIRE(test_utils::LengthsOf(runs) == std::vector<int>{5, 5});
        CHECK(runs[0].start == glm::ivec2{0, 0});
        CHECK(runs[1].start == glm::ivec2{5, 0});
    }

    SECTION("length 9 gives 5 + 4")
    {
        const auto runs = detector.FindRuns(test_utils::GridFromAscii({Row(9)}));
        REQUIRE(test_utils::LengthsOf(runs) == std::vector<int>{5, 4});
        CHECK(runs[1].start == glm::ivec2{5, 0});
    }

    SECTION("length 10 gives 5 + 5")
    {
        const auto runs = detector.FindRuns(test_utils::GridFromAscii({Row(10)}));
        CHECK(test_utils::LengthsOf(runs) == std::vector<int>{5, 5});
    }

    SECTION("length 14 gives 5 + 5 + 4")
    {
        const auto runs = detector.FindRuns(test_utils::GridFromAscii({Row(14)}));
        CHECK(test_utils::LengthsOf(runs) == std::vector<int>{5, 5, 4});
    }
}

TEST_CASE("Short runs are dropped and minimum-length runs kept", "[wall_runs]")
{
    const WallRunDetector detector(4, 5);
    CHECK(detector.FindRuns(test_utils::GridFromAscii({Row(3)})).empty());

    const auto runs = detector.FindRuns(test_utils::GridFromAscii({Row(4)}));
    CHECK(test_utils::LengthsOf(runs) == std::vector<int>{4});
}

TEST_CASE("Gaps split rows into separate runs", "[wall_runs]")
{
    const auto grid = test_utils::GridFromAscii({"####.#####"});
    const auto runs = WallRunDetector(4, 5).FindHorizontalRuns(grid);

    REQUIRE(runs.size() == 2);
    CHECK(runs[0].start == glm::ivec2{0, 0});
    CHECK(runs[0].length == 4);
    CHECK(runs[1].start == glm::ivec2{5, 0});
    CHECK(runs[1].length == 5);
}

TEST_CASE("Vertical runs are found top to bottom", "[wall_runs]")
{
    const auto grid = test_utils::GridFromAscii({
        "#",
        "#",
        "#",
        "#",
        "#",
    });
    const auto runs = WallRunDetector(4, 5).FindRuns(grid);

    REQUIRE(runs.size() == 1);
    CHECK(runs[0].orientation == RunOrientation::Vertical);
    CHECK(runs[0].start == glm::ivec2{0, 0});
    CHECK(test_utils::CoordsOf(runs[0]) ==
          std::vector<glm::ivec2>{{0, 0}, {0, 1}, {0, 2}, {0, 3}, {0, 4}});
}

TEST_CASE("Runs touching the bounding box edge are closed", "[wall_runs]")
{
    // Both runs end on maxX / maxY of the grid.
    const auto grid = test_utils::GridFromAscii({
        "..####",
        ".....#",
        ".....#",
        ".....#",
    });
    const WallRunDetector detector(4, 5);

    const auto horizontal = detector.FindHorizontalRuns(grid);
    REQUIRE(horizontal.size() == 1);
    CHECK(horizontal[0].End() == glm::ivec2{5, 0});

    const auto vertical = detector.FindVerticalRuns(grid);
    REQUIRE(vertical.size() == 1);
    CHECK(vertical[0].start == glm::ivec2{5, 0});
    CHECK(vertical[0].End() == glm::ivec2{5, 3});
}

TEST_CASE("Horizontal runs precede vertical runs", "[wall_runs]")
{
    const auto grid = test_utils::GridFromAscii({
        "#####",
        "#....",
        "#....",
        "#....",
    });
    const auto runs = WallRunDetector(4, 5).FindRuns(grid);

    REQUIRE(runs.size() == 2);
    CHECK(runs[0].orientation == RunOrientation::Horizontal);
    CHECK(runs[1].orientation == RunOrientation::Vertical);
    CHECK(runs[1].length == 4);
}

TEST_CASE("Every emitted run respects the length bounds", "[wall_runs]")
{
    const auto grid = test_utils::GridFromAscii({
        "##############",
        "#..#.....#...#",
        "#..#.....#...#",
        "#..#######...#",
        "#.......#....#",
        "#.......#....#",
        "##.###########",
    });

    for (const auto& bounds : std::vector<std::pair<int, int>>{{4, 5}, {2, 3}, {3, 7}, {1, 1}})
    {
        const auto runs = WallRunDetector(bounds.first, bounds.second).FindRuns(grid);
        REQUIRE_FALSE(runs.empty());
        for (const WallRun& run : runs)
        {
            CHECK(run.length >= bounds.first);
            CHECK(run.length <= bounds.second);
            CHECK(static_cast<int>(run.cells.size()) == run.length);
        }
    }
}

TEST_CASE("Custom bounds change the stride", "[wall_runs]")
{
    const auto runs = WallRunDetector(2, 3).FindRuns(test_utils::GridFromAscii({Row(7)}));
    CHECK(test_utils::LengthsOf(runs) == std::vector<int>{3, 3});
}

TEST_CASE("Invalid bounds yield no runs", "[wall_runs]")
{
    const auto grid = test_utils::GridFromAscii({Row(6)});
    CHECK(WallRunDetector(0, 5).FindRuns(grid).empty());
    CHECK(WallRunDetector(5, 4).FindRuns(grid).empty());
}

TEST_CASE("Sub-segments never share cells", "[wall_runs]")
{
    const auto runs = WallRunDetector(4, 5).FindHorizontalRuns(test_utils::GridFromAscii({Row(23)}));

    std::vector<int> seen;
    for (const WallRun& run : runs)
    {
        for (const auto& cell : run.cells)
        {
            CHECK(std::find(seen.begin(), seen.end(), cell.coord.x) == seen.end());
            seen.push_back(cell.coord.x);
        }
    }
    CHECK(test_utils::LengthsOf(runs) == std::vector<int>{5, 5, 5, 5});
}

TEST_CASE("Runs at the far edges of the grid are found", "[wall_runs]")
{
    using game::portals::kMaxGridCoord;
    using game::portals::WallCell;
    using game::portals::WallGrid;

    // Opposite corners of the coordinate range: scanning the bounding box would never finish.
    WallGrid grid;
    engine::scene::Entity entity = 1;
    for (int i = 0; i < 5; ++i)
    {
        grid.Add(WallCell{{kMaxGridCoord - 4 + i, kMaxGridCoord}, entity++});
        grid.Add(WallCell{{-kMaxGridCoord, -kMaxGridCoord + i}, entity++});
    }

    const std::vector<WallRun> runs = WallRunDetector(4, 5).FindRuns(grid);

    REQUIRE(runs.size() == 2);
    CHECK(runs[0].orientation == RunOrientation::Horizontal);
    CHECK(runs[0].start == glm::ivec2{kMaxGridCoord - 4, kMaxGridCoord});
    CHECK(runs[0].length == 5);
    CHECK(runs[1].orientation == RunOrientation::Vertical);
    CHECK(runs[1].start == glm::ivec2{-kMaxGridCoord, -kMaxGridCoord});
    CHECK(runs[1].length == 5);
}
