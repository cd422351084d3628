#pragma once

#include <unordered_map>
#include <vector>

#include "engine/scene/Components.hpp"

namespace engine::scene
{
class World
{
public:
    Entity CreateEntity();
    void Clear();

    std::unordered_map<Entity, Transform>& Transforms() { return m_transforms; }
    std::unordered_map<Entity, WallComponent>& Walls() { return m_walls; }
    std::unordered_map<Entity, PortalComponent>& Portals() { return m_portals; }
    std::unordered_map<Entity, RenderableComponent>& Renderables() { return m_renderables; }

    [[nodiscard]] const std::unordered_map<Entity, Transform>& Transforms() const { return m_transforms; }
    [[nodiscard]] const std::unordered_map<Entity, WallComponent>& Walls() const { return m_walls; }
    [[nodiscard]] const std::unordered_map<Entity, PortalComponent>& Portals() const { return m_portals; }
    [[nodiscard]] const std::unordered_map<Entity, RenderableComponent>& Renderables() const { return m_renderables; }

    [[nodiscard]] std::vector<Entity> Entities() const;

    // Entities carrying both a Transform and a WallComponent, ascending by id.
    [[nodiscard]] std::vector<Entity> WallEntities() const;

private:
    Entity m_nextEntity = 1;
    std::unordered_map<Entity, Transform> m_transforms;
    std::unordered_map<Entity, WallComponent> m_walls;
    std::unordered_map<Entity, PortalComponent> m_portals;
    std::unordered_map<Entity, RenderableComponent> m_renderables;
};
} // namespace engine::scene
