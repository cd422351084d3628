#pragma once

#include <glm/vec4.hpp>

#include "engine/scene/World.hpp"

namespace game::portals
{
class PortalSpawner;
struct PortalActivation;

namespace PortalColors
{
    inline const glm::vec4 kActive{0.2F, 0.9F, 0.3F, 1.0F};
    inline const glm::vec4 kWall{0.5F, 0.5F, 0.5F, 1.0F};
}

/// Restyles wall tiles when their portal activates.
class PortalRenderSync
{
public:
    explicit PortalRenderSync(engine::scene::World& world);

    void Attach(PortalSpawner& spawner);
    void OnActivation(const PortalActivation& activation);

    [[nodiscard]] int RecoloredCount() const { return m_recolored; }

private:
    engine::scene::World& m_world;
    int m_recolored = 0;
};
} // namespace game::portals
