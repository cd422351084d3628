#pragma once

#include "engine/core/EventBus.hpp"
#include "engine/scene/World.hpp"
#include "game/portals/PortalConfig.hpp"
#include "game/portals/PortalRenderSync.hpp"
#include "game/portals/PortalSpawner.hpp"
#include "game/puzzles/PuzzleHandlerRegistry.hpp"
#include "game/puzzles/PuzzleRegistry.hpp"
#include "game/puzzles/PuzzleService.hpp"

namespace game
{
/// Owns the state shared by the puzzle and portal subsystems for one session.
/// Member order matters: listeners are destroyed after the spawner that calls them.
class GameContext
{
public:
    GameContext();

    GameContext(const GameContext&) = delete;
    GameContext& operator=(const GameContext&) = delete;

    /// Drains queued events (puzzle_solved -> portal placement).
    void Update();

    /// Clears the level: world, puzzles, claims and solved state. Config and handlers are kept.
    void ResetLevel();

    [[nodiscard]] engine::core::EventBus& GetEventBus() { return m_eventBus; }
    [[nodiscard]] engine::scene::World& GetWorld() { return m_world; }
    [[nodiscard]] portals::PortalConfig& GetConfig() { return m_config; }
    [[nodiscard]] puzzles::PuzzleRegistry& GetPuzzles() { return m_puzzles; }
    [[nodiscard]] puzzles::PuzzleHandlerRegistry& GetHandlers() { return m_handlers; }
    [[nodiscard]] puzzles::PuzzleService& GetPuzzleService() { return m_puzzleService; }
    [[nodiscard]] portals::PortalSpawner& GetPortalSpawner() { return m_portalSpawner; }
    [[nodiscard]] portals::PortalRenderSync& GetRenderSync() { return m_renderSync; }

private:
    engine::core::EventBus m_eventBus;
    engine::scene::World m_world;
    portals::PortalConfig m_config;
    puzzles::PuzzleRegistry m_puzzles;
    puzzles::PuzzleHandlerRegistry m_handlers;
    puzzles::PuzzleService m_puzzleService;
    portals::PortalRenderSync m_renderSync;
    portals::PortalSpawner m_portalSpawner;
};
} // namespace game
