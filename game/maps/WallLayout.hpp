#pragma once

#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "engine/scene/World.hpp"

namespace game::maps
{
/// Creates one wall tile entity (Transform + WallComponent + RenderableComponent) at a grid cell.
engine::scene::Entity SpawnWallTile(engine::scene::World& world, const glm::ivec2& cell, float tileSize);

/// Spawns a wall for every '#' in rows. Column index is x, row index is y.
/// @return Spawned entities in row-major order.
std::vector<engine::scene::Entity> SpawnWallsFromAscii(
    engine::scene::World& world,
    const std::vector<std::string>& rows,
    float tileSize,
    const glm::ivec2& origin = glm::ivec2{0, 0}
);

/// Spawns the one-tile-thick outline of the rectangle [minCell, maxCell].
std::vector<engine::scene::Entity> SpawnRoomOutline(
    engine::scene::World& world,
    const glm::ivec2& minCell,
    const glm::ivec2& maxCell,
    float tileSize
);
} // namespace game::maps
