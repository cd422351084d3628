#include <catch2/catch.hpp>

#include "PortalTestUtils.hpp"
#include "game/portals/WallGrid.hpp"

using game::portals::CellFromWorld;
using game::portals::ClaimedCellSet;
using game::portals::PackGridKey;
using game::portals::WallCell;
using game::portals::WallGrid;

TEST_CASE("CellFromWorld floors toward negative infinity", "[wall_grid]")
{
    CHECK(CellFromWorld({0.0F, 0.0F}, 16.0F) == glm::ivec2{0, 0});
    CHECK(CellFromWorld({31.9F, 16.0F}, 16.0F) == glm::ivec2{1, 1});
    CHECK(CellFromWorld({-0.5F, -16.0F}, 16.0F) == glm::ivec2{-1, -1});
    CHECK(CellFromWorld({-16.5F, 8.0F}, 16.0F) == glm::ivec2{-2, 0});
}

TEST_CASE("Grid keys keep axes apart", "[wall_grid]")
{
    CHECK(PackGridKey(1, -1) != PackGridKey(-1, 1));
    CHECK(PackGridKey(0, 1) != PackGridKey(1, 0));
    CHECK(PackGridKey(glm::ivec2{-3, 7}) == PackGridKey(-3, 7));
}

TEST_CASE("Build indexes cells and tracks bounds", "[wall_grid]")
{
    const std::vector<WallCell> cells{
        {{2, 3}, 10},
        {{-1, 5}, 11},
        {{4, -2}, 12},
    };
    const WallGrid grid = WallGrid::Build(cells, {});

    REQUIRE(grid.Size() == 3);
    CHECK(grid.MinX() == -1);
    CHECK(grid.MaxX() == 4);
    CHECK(grid.MinY() == -2);
    CHECK(grid.MaxY() == 5);

    REQUIRE(grid.Get(2, 3) != nullptr);
    CHECK(grid.Get(2, 3)->entity == 10);
    CHECK(grid.Has(-1, 5));
    CHECK_FALSE(grid.Has(0, 0));
    CHECK(grid.Get(0, 0) == nullptr);
}

TEST_CASE("Build skips claimed coordinates", "[wall_grid]")
{
    const std::vector<WallCell> cells{
        {{0, 0}, 1},
        {{1, 0}, 2},
        {{2, 0}, 3},
    };
    const ClaimedCellSet claimed{PackGridKey(1, 0)};
    const WallGrid grid = WallGrid::Build(cells, claimed);

    CHECK(grid.Size() == 2);
    CHECK(grid.Has(0, 0));
    CHECK_FALSE(grid.Has(1, 0));
    CHECK(grid.Has(2, 0));
}

TEST_CASE("Empty grid reports empty", "[wall_grid]")
{
    const WallGrid grid = WallGrid::Build({}, {});
    CHECK(grid.Empty());
    CHECK(grid.Size() == 0);
}

TEST_CASE("Range queries look at the inclusive span only", "[wall_grid]")
{
    const WallGrid grid = test_utils::GridFromAscii({
        "....#",
        ".....",
        "#....",
    });

    CHECK(grid.AnyOccupiedInRow(0, 0, 4));
    CHECK_FALSE(grid.AnyOccupiedInRow(0, 0, 3));
    CHECK_FALSE(grid.AnyOccupiedInRow(1, 0, 4));
    CHECK(grid.AnyOccupiedInColumn(0, 0, 2));
    CHECK_FALSE(grid.AnyOccupiedInColumn(0, 0, 1));
    CHECK(grid.AnyOccupiedInColumn(4, -5, 0));
}

TEST_CASE("Extreme positions clamp to the grid limit", "[wall_grid]")
{
    using game::portals::kMaxGridCoord;

    CHECK(CellFromWorld({1.0e30F, -1.0e30F}, 16.0F) == glm::ivec2{kMaxGridCoord, -kMaxGridCoord});
    CHECK(CellFromWorld({1.0e10F, 0.0F}, 1.0e-30F) == glm::ivec2{kMaxGridCoord, 0});
    CHECK(CellFromWorld({-1.0e10F, 5.0F}, 1.0e-30F).x == -kMaxGridCoord);
}

TEST_CASE("Cells come back in row and column order", "[wall_grid]")
{
    const std::vector<WallCell> cells{
        {{1, 1}, 1},
        {{0, 2}, 2},
        {{2, 0}, 3},
        {{0, 1}, 4},
    };
    const WallGrid grid = WallGrid::Build(cells, {});

    std::vector<glm::ivec2> byRow;
    for (const WallCell& cell : grid.CellsByRow())
    {
        byRow.push_back(cell.coord);
    }
    CHECK(byRow == std::vector<glm::ivec2>{{2, 0}, {0, 1}, {1, 1}, {0, 2}});

    std::vector<glm::ivec2> byColumn;
    for (const WallCell& cell : grid.CellsByColumn())
    {
        byColumn.push_back(cell.coord);
    }
    CHECK(byColumn == std::vector<glm::ivec2>{{0, 1}, {0, 2}, {1, 1}, {2, 0}});
}
