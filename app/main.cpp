#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "game/GameContext.hpp"
#include "game/maps/WallLayout.hpp"

namespace
{
constexpr const char* kDefaultConfigPath = "config/portals.json";
constexpr const char* kDefaultPuzzlesPath = "config/puzzles.json";

void PrintClaim(const game::portals::PortalSpawner& spawner, const std::string& puzzleId)
{
    const game::portals::PortalClaim* claim = spawner.GetClaim(puzzleId);
    std::cout << puzzleId << ": " << game::portals::PortalStateToText(spawner.State(puzzleId));
    if (claim == nullptr)
    {
        std::cout << "\n";
        return;
    }
    std::cout << " " << claim->groupId << " [";
    for (const game::portals::ClaimedCell& cell : claim->cells)
    {
        std::cout << " (" << cell.coord.x << "," << cell.coord.y << ")#" << cell.segmentIndex;
    }
    std::cout << " ]\n";
}
} // namespace

int main(int argc, char** argv)
{
    const std::string configPath = argc > 1 ? argv[1] : kDefaultConfigPath;
    const std::string puzzlesPath = argc > 2 ? argv[2] : kDefaultPuzzlesPath;

    game::GameContext context;

    std::string error;
    if (!context.GetConfig().LoadFromJsonFile(configPath, &error))
    {
        std::cout << "[CONFIG] WARNING - " << error << ", using defaults with portals enabled\n";
        context.GetConfig().ResetDefaults();
        context.GetConfig().featureEnabled = true;
    }

    if (!context.GetPuzzles().LoadFromJsonFile(puzzlesPath, &error))
    {
        std::cerr << "Failed to load puzzles: " << error << "\n";
        return 1;
    }

    std::cout << "legacy exits " << (context.GetConfig().ShouldHideLegacyExits() ? "hidden" : "visible") << "\n";

    const float tileSize = context.GetConfig().tileSize;
    game::maps::SpawnRoomOutline(context.GetWorld(), {0, 0}, {11, 7}, tileSize);
    game::maps::SpawnWallsFromAscii(
        context.GetWorld(),
        {
            "######",
            "#",
            "#",
        },
        tileSize,
        {3, 3}
    );

    const std::vector<std::pair<std::string, std::string>> attempts{
        {"vault_door", "access"},
        {"vault_door", "access ok"},
        {"lab_gate", "attack at dawn"},
        {"vault_door", "ACCESSOK"},
    };

    for (const auto& [puzzleId, answer] : attempts)
    {
        const game::puzzles::SubmitResult result = context.GetPuzzleService().SubmitAnswer(puzzleId, answer);
        std::cout << "submit '" << answer << "' to " << puzzleId << ": " << game::puzzles::SubmitResultToText(result) << "\n";
        context.Update();
    }

    for (const std::string& puzzleId : context.GetPuzzles().ListIds())
    {
        PrintClaim(context.GetPortalSpawner(), puzzleId);
    }

    std::cout << "active portal tiles: " << context.GetPortalSpawner().ActivePortalTileCount()
              << ", recolored: " << context.GetRenderSync().RecoloredCount() << "\n";
    return 0;
}
