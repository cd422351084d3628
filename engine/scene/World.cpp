#include "engine/scene/World.hpp"

#include <algorithm>
#include <unordered_set>

namespace engine::scene
{
Entity World::CreateEntity()
{
    return m_nextEntity++;
}

void World::Clear()
{
    m_nextEntity = 1;
    m_transforms.clear();
    m_walls.clear();
    m_portals.clear();
    m_renderables.clear();
}

std::vector<Entity> World::Entities() const
{
    std::unordered_set<Entity> dedup;
    dedup.reserve(m_transforms.size() + m_walls.size() + m_portals.size() + m_renderables.size());

    auto collect = [&dedup](const auto& map) {
        for (const auto& [entity, _] : map)
        {
            dedup.insert(entity);
        }
    };

    collect(m_transforms);
    collect(m_walls);
    collect(m_portals);
    collect(m_renderables);

    std::vector<Entity> entities{dedup.begin(), dedup.end()};
    std::sort(entities.begin(), entities.end());
    return entities;
}

std::vector<Entity> World::WallEntities() const
{
    std::vector<Entity> entities;
    entities.reserve(m_walls.size());
    for (const auto& [entity, _] : m_walls)
    {
        if (m_transforms.contains(entity))
        {
            entities.push_back(entity);
        }
    }
    std::sort(entities.begin(), entities.end());
    return entities;
}
} // namespace engine::scene
