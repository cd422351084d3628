#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine/core/EventBus.hpp"
#include "engine/scene/World.hpp"
#include "game/portals/PortalConfig.hpp"
#include "game/portals/WallGrid.hpp"
#include "game/portals/WallRun.hpp"

namespace game::portals
{
enum class PortalState
{
    Unclaimed,
    ClaimedInactive,
    ClaimedActive
};

struct ClaimedCell
{
    GridCoord coord{0, 0};
    engine::scene::Entity entity = engine::scene::kInvalidEntity;
    int segmentIndex = 0;
};

struct PortalClaim
{
    std::string puzzleId;
    std::string groupId;
    std::vector<ClaimedCell> cells; // ordered by segmentIndex
    bool active = false;
};

/// Sent once per claimed tile whenever a claim becomes active.
struct PortalActivation
{
    engine::scene::Entity entity = engine::scene::kInvalidEntity;
    std::string puzzleId;
    std::string groupId;
    int segmentIndex = 0;
    int segmentLength = 0;
};

/// Turns a run of wall tiles into a portal exit when a puzzle is solved.
///
/// Each puzzle id owns at most one claim. PortalComponent markers in the world are
/// authoritative: tiles already marked for an id become that id's claim instead of a
/// new placement. A claimed tile is never offered to another puzzle. Solving is
/// idempotent: a second solve of the same id returns true and leaves the claim untouched.
class PortalSpawner
{
public:
    using ActivationListener = std::function<void(const PortalActivation&)>;

    PortalSpawner(engine::scene::World& world, const PortalConfig& config);
    ~PortalSpawner();

    PortalSpawner(const PortalSpawner&) = delete;
    PortalSpawner& operator=(const PortalSpawner&) = delete;

    /// Subscribes OnPuzzleSolved to puzzle_solved events and announces activations on the bus.
    void BindEvents(engine::core::EventBus& eventBus);
    void UnbindEvents();

    void AddActivationListener(ActivationListener listener);

    /// @return True when the puzzle has an active portal after the call.
    bool OnPuzzleSolved(const std::string& puzzleId);

    /// Marks level-authored tiles as an inactive portal for puzzleId.
    /// @return False for an empty id, an existing claim, a non-wall entity or an already claimed tile.
    bool RegisterDormantPortal(const std::string& puzzleId, const std::vector<engine::scene::Entity>& entities);

    /// Current unclaimed wall occupancy.
    [[nodiscard]] WallGrid BuildGrid() const;

    /// Runs detection, scoring and selection without claiming anything.
    [[nodiscard]] std::optional<WallRun> FindPortalWallSegment(const std::string& puzzleId) const;

    [[nodiscard]] bool HasClaim(const std::string& puzzleId) const;
    [[nodiscard]] bool IsActive(const std::string& puzzleId) const;
    [[nodiscard]] PortalState State(const std::string& puzzleId) const;
    [[nodiscard]] const PortalClaim* GetClaim(const std::string& puzzleId) const;

    [[nodiscard]] std::size_t ClaimCount() const { return m_claims.size(); }
    [[nodiscard]] int ActivePortalTileCount() const;
    [[nodiscard]] int InactivePortalTileCount() const;

    /// Forgets all claims (level reload). Portal markers in the world are left as they are;
    /// the next solve of a marked puzzle id rebuilds its claim from them.
    void Reset();

    [[nodiscard]] static std::string MakeGroupId(const std::string& puzzleId) { return "portal_" + puzzleId; }

private:
    [[nodiscard]] std::vector<WallCell> CollectWallCells() const;
    [[nodiscard]] ClaimedCellSet ClaimedCells() const;
    [[nodiscard]] bool HasWorldMarkers(const std::string& puzzleId) const;

    // Builds a claim from PortalComponent markers already carrying puzzleId.
    bool AdoptWorldPortal(const std::string& puzzleId);

    PortalClaim& CreateClaim(const std::string& puzzleId, const std::vector<WallCell>& cells);
    void Activate(PortalClaim& claim);

    engine::scene::World& m_world;
    const PortalConfig& m_config;
    engine::core::EventBus* m_eventBus = nullptr;
    engine::core::EventBus::SubscriptionId m_solvedSubscription = 0;
    std::vector<ActivationListener> m_listeners;
    std::unordered_map<std::string, PortalClaim> m_claims;
};

[[nodiscard]] const char* PortalStateToText(PortalState state);
} // namespace game::portals
