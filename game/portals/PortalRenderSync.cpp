#include "game/portals/PortalRenderSync.hpp"

#include "game/portals/PortalSpawner.hpp"

namespace game::portals
{
PortalRenderSync::PortalRenderSync(engine::scene::World& world)
    : m_world(world)
{
}

void PortalRenderSync::Attach(PortalSpawner& spawner)
{
    spawner.AddActivationListener([this](const PortalActivation& activation) { OnActivation(activation); });
}

void PortalRenderSync::OnActivation(const PortalActivation& activation)
{
    const auto it = m_world.Renderables().find(activation.entity);
    if (it == m_world.Renderables().end())
    {
        return;
    }
    it->second.color = PortalColors::kActive;
    ++m_recolored;
}
} // namespace game::portals
