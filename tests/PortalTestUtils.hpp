#pragma once

#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "engine/scene/World.hpp"
#include "game/maps/WallLayout.hpp"
#include "game/portals/PortalConfig.hpp"
#include "game/portals/PortalSpawner.hpp"
#include "game/portals/WallGrid.hpp"
#include "game/portals/WallRun.hpp"

namespace test_utils
{
constexpr float kTileSize = game::portals::PortalConfig::kDefaultTileSize;

inline game::portals::PortalConfig EnabledConfig()
{
    game::portals::PortalConfig config;
    config.featureEnabled = true;
    return config;
}

// Horizontal (or vertical) line of wall tiles starting at start.
inline std::vector<engine::scene::Entity> SpawnLine(engine::scene::World& world, glm::ivec2 start, int length, bool horizontal)
{
    std::vector<engine::scene::Entity> entities;
    for (int i = 0; i < length; ++i)
    {
        const glm::ivec2 cell = horizontal ? glm::ivec2{start.x + i, start.y} : glm::ivec2{start.x, start.y + i};
        entities.push_back(game::maps::SpawnWallTile(world, cell, kTileSize));
    }
    return entities;
}

inline game::portals::WallGrid GridFromAscii(const std::vector<std::string>& rows)
{
    engine::scene::World world;
    const std::vector<engine::scene::Entity> entities = game::maps::SpawnWallsFromAscii(world, rows, kTileSize);

    std::vector<game::portals::WallCell> cells;
    for (const engine::scene::Entity entity : entities)
    {
        cells.push_back({game::portals::CellFromWorld(world.Transforms().at(entity).position, kTileSize), entity});
    }
    return game::portals::WallGrid::Build(cells, {});
}

inline std::vector<glm::ivec2> CoordsOf(const game::portals::WallRun& run)
{
    std::vector<glm::ivec2> coords;
    for (const game::portals::WallCell& cell : run.cells)
    {
        coords.push_back(cell.coord);
    }
    return coords;
}

inline std::vector<glm::ivec2> CoordsOf(const game::portals::PortalClaim& claim)
{
    std::vector<glm::ivec2> coords;
    for (const game::portals::ClaimedCell& cell : claim.cells)
    {
        coords.push_back(cell.coord);
    }
    return coords;
}

inline std::vector<int> LengthsOf(const std::vector<game::portals::WallRun>& runs)
{
    std::vector<int> lengths;
    for (const game::portals::WallRun& run : runs)
    {
        lengths.push_back(run.length);
    }
    return lengths;
}
} // namespace test_utils
