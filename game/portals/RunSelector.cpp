#include "game/portals/RunSelector.hpp"

#include <algorithm>
#include <random>

namespace game::portals
{
std::uint64_t Fnv1a64(std::string_view text)
{
    std::uint64_t hash = SelectorConstants::kFnvOffsetBasis;
    for (const char ch : text)
    {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
        hash *= SelectorConstants::kFnvPrime;
    }
    return hash;
}

std::uint64_t MakePlacementSeed(std::uint64_t baseSeed, std::string_view puzzleId)
{
    return baseSeed ^ Fnv1a64(puzzleId);
}

std::vector<WallRun> EligibleRuns(std::vector<WallRun> runs)
{
    if (runs.empty())
    {
        return runs;
    }

    std::stable_sort(runs.begin(), runs.end(), [](const WallRun& a, const WallRun& b) {
        return a.score > b.score;
    });

    const int topScore = runs.front().score;
    const auto firstBelow = std::find_if(runs.begin(), runs.end(), [topScore](const WallRun& run) {
        return run.score < topScore - SelectorConstants::kScoreSlack;
    });
    runs.erase(firstBelow, runs.end());
    return runs;
}

std::optional<WallRun> SelectRun(std::vector<WallRun> runs, std::string_view puzzleId, std::uint64_t baseSeed)
{
    std::vector<WallRun> eligible = EligibleRuns(std::move(runs));
    if (eligible.empty())
    {
        return std::nullopt;
    }

    // Raw engine output reduced by hand: distributions are not portable across standard libraries.
    std::mt19937_64 rng(MakePlacementSeed(baseSeed, puzzleId));
    const std::size_t index = static_cast<std::size_t>(rng() % eligible.size());
    return std::move(eligible[index]);
}
} // namespace game::portals
