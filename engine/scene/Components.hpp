#pragma once

#include <cstdint>
#include <string>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

namespace engine::scene
{
using Entity = std::uint32_t;

constexpr Entity kInvalidEntity = 0;

struct Transform
{
    // World-space position of the tile's lower-left corner.
    glm::vec2 position{0.0F, 0.0F};
};

struct WallComponent
{
    bool solid = true;
};

struct PortalComponent
{
    std::string puzzleId;
    std::string portalGroupId;
    int segmentIndex = 0;
    int segmentLength = 1;
    bool active = false;

    [[nodiscard]] bool HasPuzzle() const { return !puzzleId.empty(); }
};

struct RenderableComponent
{
    glm::vec4 color{0.5F, 0.5F, 0.5F, 1.0F};
};
} // namespace engine::scene
