#include "game/maps/WallLayout.hpp"

#include <algorithm>

#include "game/portals/PortalRenderSync.hpp"

namespace game::maps
{
namespace
{
constexpr char kWallGlyph = '#';
}

engine::scene::Entity SpawnWallTile(engine::scene::World& world, const glm::ivec2& cell, float tileSize)
{
    const engine::scene::Entity entity = world.CreateEntity();
    world.Transforms()[entity] = engine::scene::Transform{glm::vec2{cell} * tileSize};
    world.Walls()[entity] = engine::scene::WallComponent{};
    world.Renderables()[entity] = engine::scene::RenderableComponent{game::portals::PortalColors::kWall};
    return entity;
}

std::vector<engine::scene::Entity> SpawnWallsFromAscii(
    engine::scene::World& world,
    const std::vector<std::string>& rows,
    float tileSize,
    const glm::ivec2& origin
)
{
    std::vector<engine::scene::Entity> spawned;
    for (std::size_t row = 0; row < rows.size(); ++row)
    {
        const std::string& line = rows[row];
        for (std::size_t column = 0; column < line.size(); ++column)
        {
            if (line[column] != kWallGlyph)
            {
                continue;
            }
            const glm::ivec2 cell = origin + glm::ivec2{static_cast<int>(column), static_cast<int>(row)};
            spawned.push_back(SpawnWallTile(world, cell, tileSize));
        }
    }
    return spawned;
}

std::vector<engine::scene::Entity> SpawnRoomOutline(
    engine::scene::World& world,
    const glm::ivec2& minCell,
    const glm::ivec2& maxCell,
    float tileSize
)
{
    std::vector<engine::scene::Entity> spawned;
    const glm::ivec2 lo{std::min(minCell.x, maxCell.x), std::min(minCell.y, maxCell.y)};
    const glm::ivec2 hi{std::max(minCell.x, maxCell.x), std::max(minCell.y, maxCell.y)};

    for (int y = lo.y; y <= hi.y; ++y)
    {
        for (int x = lo.x; x <= hi.x; ++x)
        {
            const bool onEdge = x == lo.x || x == hi.x || y == lo.y || y == hi.y;
            if (onEdge)
            {
                spawned.push_back(SpawnWallTile(world, glm::ivec2{x, y}, tileSize));
            }
        }
    }
    return spawned;
}
} // namespace game::maps
