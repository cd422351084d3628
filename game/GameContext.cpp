#include "game/GameContext.hpp"

namespace game
{
GameContext::GameContext()
    : m_puzzleService(m_puzzles, m_handlers, m_eventBus)
    , m_renderSync(m_world)
    , m_portalSpawner(m_world, m_config)
{
    m_renderSync.Attach(m_portalSpawner);
    m_portalSpawner.BindEvents(m_eventBus);
}

void GameContext::Update()
{
    m_eventBus.DispatchQueued();
}

void GameContext::ResetLevel()
{
    m_world.Clear();
    m_puzzles.Clear();
    m_puzzleService.Reset();
    m_portalSpawner.Reset();
}
} // namespace game
