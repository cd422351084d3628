#include "game/portals/PortalSpawner.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <unordered_set>
#include <utility>

#include "game/GameEvents.hpp"
#include "game/portals/RunScorer.hpp"
#include "game/portals/RunSelector.hpp"

namespace game::portals
{
PortalSpawner::PortalSpawner(engine::scene::World& world, const PortalConfig& config)
    : m_world(world)
    , m_config(config)
{
}

PortalSpawner::~PortalSpawner()
{
    UnbindEvents();
}

void PortalSpawner::BindEvents(engine::core::EventBus& eventBus)
{
    UnbindEvents();
    m_eventBus = &eventBus;
    m_solvedSubscription = m_eventBus->Subscribe(events::kPuzzleSolved, [this](const engine::core::Event& event) {
        if (event.args.empty())
        {
            std::cout << "[PORTAL] WARNING - puzzle_solved event without puzzle id\n";
            return;
        }
        (void)OnPuzzleSolved(event.args.front());
    });
}

void PortalSpawner::UnbindEvents()
{
    if (m_eventBus != nullptr)
    {
        (void)m_eventBus->Unsubscribe(m_solvedSubscription);
    }
    m_eventBus = nullptr;
    m_solvedSubscription = 0;
}

void PortalSpawner::AddActivationListener(ActivationListener listener)
{
    if (listener)
    {
        m_listeners.push_back(std::move(listener));
    }
}

bool PortalSpawner::OnPuzzleSolved(const std::string& puzzleId)
{
    if (!m_config.featureEnabled || puzzleId.empty())
    {
        return false;
    }

    auto existing = m_claims.find(puzzleId);
    if (existing == m_claims.end() && AdoptWorldPortal(puzzleId))
    {
        existing = m_claims.find(puzzleId);
    }
    if (existing != m_claims.end())
    {
        if (!existing->second.active)
        {
            std::cout << "[PORTAL] Activating dormant portal " << existing->second.groupId << "\n";
            Activate(existing->second);
        }
        return true;
    }

    const std::optional<WallRun> segment = FindPortalWallSegment(puzzleId);
    if (!segment.has_value())
    {
        std::cout << "[PORTAL] No eligible wall segment for puzzle '" << puzzleId << "'\n";
        return false;
    }

    PortalClaim& claim = CreateClaim(puzzleId, segment->cells);
    std::cout << "[PORTAL] Placed " << claim.groupId << ": " << segment->length << " "
              << RunOrientationToText(segment->orientation) << " tiles at (" << segment->start.x << ", "
              << segment->start.y << "), score " << segment->score << "\n";
    Activate(claim);
    return true;
}

bool PortalSpawner::RegisterDormantPortal(const std::string& puzzleId, const std::vector<engine::scene::Entity>& entities)
{
    if (puzzleId.empty() || entities.empty() || m_claims.contains(puzzleId) || HasWorldMarkers(puzzleId))
    {
        return false;
    }

    const ClaimedCellSet claimed = ClaimedCells();
    std::unordered_set<std::int64_t> seen;
    std::vector<WallCell> cells;
    cells.reserve(entities.size());
    for (const engine::scene::Entity entity : entities)
    {
        const auto transform = m_world.Transforms().find(entity);
        if (transform == m_world.Transforms().end() || !m_world.Walls().contains(entity) ||
            m_world.Portals().contains(entity))
        {
            std::cout << "[PORTAL] WARNING - Entity " << entity << " cannot be part of portal for '" << puzzleId << "'\n";
            return false;
        }

        const GridCoord coord = CellFromWorld(transform->second.position, m_config.tileSize);
        const std::int64_t key = PackGridKey(coord);
        if (claimed.contains(key) || !seen.insert(key).second)
        {
            std::cout << "[PORTAL] WARNING - Tile (" << coord.x << ", " << coord.y << ") already claimed\n";
            return false;
        }
        cells.push_back(WallCell{coord, entity});
    }

    const PortalClaim& claim = CreateClaim(puzzleId, cells);
    std::cout << "[PORTAL] Registered dormant portal " << claim.groupId << " (" << claim.cells.size() << " tiles)\n";
    return true;
}

WallGrid PortalSpawner::BuildGrid() const
{
    return WallGrid::Build(CollectWallCells(), ClaimedCells());
}

std::optional<WallRun> PortalSpawner::FindPortalWallSegment(const std::string& puzzleId) const
{
    std::string error;
    if (!m_config.Validate(&error))
    {
        std::cout << "[PORTAL] WARNING - Invalid portal config: " << error << "\n";
        return std::nullopt;
    }

    const WallGrid grid = BuildGrid();
    if (grid.Empty())
    {
        return std::nullopt;
    }

    const WallRunDetector detector(m_config.minSegmentLength, m_config.maxSegmentLength);
    std::vector<WallRun> runs = detector.FindRuns(grid);
    if (runs.empty())
    {
        return std::nullopt;
    }

    ScoreRuns(runs, grid, m_config.preferredSegmentLength);
    return SelectRun(std::move(runs), puzzleId, m_config.baseSeed);
}

bool PortalSpawner::HasClaim(const std::string& puzzleId) const
{
    return m_claims.contains(puzzleId);
}

bool PortalSpawner::IsActive(const std::string& puzzleId) const
{
    const PortalClaim* claim = GetClaim(puzzleId);
    return claim != nullptr && claim->active;
}

PortalState PortalSpawner::State(const std::string& puzzleId) const
{
    const PortalClaim* claim = GetClaim(puzzleId);
    if (claim == nullptr)
    {
        return PortalState::Unclaimed;
    }
    return claim->active ? PortalState::ClaimedActive : PortalState::ClaimedInactive;
}

const PortalClaim* PortalSpawner::GetClaim(const std::string& puzzleId) const
{
    const auto it = m_claims.find(puzzleId);
    if (it == m_claims.end())
    {
        return nullptr;
    }
    return &it->second;
}

int PortalSpawner::ActivePortalTileCount() const
{
    int count = 0;
    for (const auto& [entity, portal] : m_world.Portals())
    {
        if (portal.active)
        {
            ++count;
        }
    }
    return count;
}

int PortalSpawner::InactivePortalTileCount() const
{
    int count = 0;
    for (const auto& [entity, portal] : m_world.Portals())
    {
        if (!portal.active)
        {
            ++count;
        }
    }
    return count;
}

void PortalSpawner::Reset()
{
    m_claims.clear();
}

bool PortalSpawner::HasWorldMarkers(const std::string& puzzleId) const
{
    for (const auto& [entity, portal] : m_world.Portals())
    {
        if (portal.puzzleId == puzzleId)
        {
            return true;
        }
    }
    return false;
}

bool PortalSpawner::AdoptWorldPortal(const std::string& puzzleId)
{
    std::vector<ClaimedCell> cells;
    bool allActive = true;
    for (const auto& [entity, portal] : m_world.Portals())
    {
        if (portal.puzzleId != puzzleId)
        {
            continue;
        }
        const auto transform = m_world.Transforms().find(entity);
        if (transform == m_world.Transforms().end())
        {
            continue;
        }
        cells.push_back(ClaimedCell{CellFromWorld(transform->second.position, m_config.tileSize), entity, portal.segmentIndex});
        allActive = allActive && portal.active;
    }
    if (cells.empty())
    {
        return false;
    }

    std::sort(cells.begin(), cells.end(), [](const ClaimedCell& a, const ClaimedCell& b) {
        return a.segmentIndex != b.segmentIndex ? a.segmentIndex < b.segmentIndex : a.entity < b.entity;
    });

    PortalClaim claim;
    claim.puzzleId = puzzleId;
    claim.groupId = MakeGroupId(puzzleId);
    claim.active = allActive;
    const int segmentLength = static_cast<int>(cells.size());
    int index = 0;
    for (ClaimedCell& cell : cells)
    {
        cell.segmentIndex = index;
        engine::scene::PortalComponent& portal = m_world.Portals().at(cell.entity);
        portal.portalGroupId = claim.groupId;
        portal.segmentIndex = index;
        portal.segmentLength = segmentLength;
        ++index;
    }
    claim.cells = std::move(cells);

    std::cout << "[PORTAL] Rebuilt " << claim.groupId << " from " << segmentLength << " marked tiles\n";
    m_claims.emplace(puzzleId, std::move(claim));
    return true;
}

std::vector<WallCell> PortalSpawner::CollectWallCells() const
{
    std::vector<WallCell> cells;
    const std::vector<engine::scene::Entity> walls = m_world.WallEntities();
    cells.reserve(walls.size());
    for (const engine::scene::Entity entity : walls)
    {
        const engine::scene::Transform& transform = m_world.Transforms().at(entity);
        cells.push_back(WallCell{CellFromWorld(transform.position, m_config.tileSize), entity});
    }
    return cells;
}

ClaimedCellSet PortalSpawner::ClaimedCells() const
{
    ClaimedCellSet claimed;
    for (const auto& [puzzleId, claim] : m_claims)
    {
        for (const ClaimedCell& cell : claim.cells)
        {
            claimed.insert(PackGridKey(cell.coord));
        }
    }

    // Tiles carrying a portal marker from elsewhere (e.g. before a Reset) stay excluded.
    for (const auto& [entity, portal] : m_world.Portals())
    {
        const auto transform = m_world.Transforms().find(entity);
        if (transform != m_world.Transforms().end())
        {
            claimed.insert(PackGridKey(CellFromWorld(transform->second.position, m_config.tileSize)));
        }
    }
    return claimed;
}

PortalClaim& PortalSpawner::CreateClaim(const std::string& puzzleId, const std::vector<WallCell>& cells)
{
    PortalClaim claim;
    claim.puzzleId = puzzleId;
    claim.groupId = MakeGroupId(puzzleId);
    claim.cells.reserve(cells.size());

    const int segmentLength = static_cast<int>(cells.size());
    int index = 0;
    for (const WallCell& cell : cells)
    {
        claim.cells.push_back(ClaimedCell{cell.coord, cell.entity, index});

        engine::scene::PortalComponent portal;
        portal.puzzleId = puzzleId;
        portal.portalGroupId = claim.groupId;
        portal.segmentIndex = index;
        portal.segmentLength = segmentLength;
        m_world.Portals()[cell.entity] = std::move(portal);
        ++index;
    }

    const auto result = m_claims.emplace(puzzleId, std::move(claim));
    return result.first->second;
}

void PortalSpawner::Activate(PortalClaim& claim)
{
    claim.active = true;
    const int segmentLength = static_cast<int>(claim.cells.size());

    // Listeners may register further listeners; iterate a snapshot.
    const std::vector<ActivationListener> listeners = m_listeners;
    for (const ClaimedCell& cell : claim.cells)
    {
        const auto portal = m_world.Portals().find(cell.entity);
        if (portal != m_world.Portals().end())
        {
            portal->second.active = true;
        }

        const PortalActivation activation{cell.entity, claim.puzzleId, claim.groupId, cell.segmentIndex, segmentLength};
        for (const ActivationListener& listener : listeners)
        {
            listener(activation);
        }
    }

    if (m_eventBus != nullptr)
    {
        m_eventBus->Publish(engine::core::Event{
            events::kPortalActivated,
            {claim.puzzleId, claim.groupId, std::to_string(segmentLength)},
        });
    }
}

const char* PortalStateToText(PortalState state)
{
    switch (state)
    {
        case PortalState::Unclaimed: return "unclaimed";
        case PortalState::ClaimedInactive: return "claimed_inactive";
        case PortalState::ClaimedActive: return "claimed_active";
        default: return "unknown";
    }
}
} // namespace game::portals
