#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "game/portals/WallRun.hpp"

namespace game::portals
{
namespace SelectorConstants
{
    constexpr int kScoreSlack = 2; // runs within this many points of the best stay eligible
    constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
    constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;
}

/// FNV-1a 64-bit over the raw bytes of text. Stable across platforms and runs.
[[nodiscard]] std::uint64_t Fnv1a64(std::string_view text);

[[nodiscard]] std::uint64_t MakePlacementSeed(std::uint64_t baseSeed, std::string_view puzzleId);

/// Runs scoring within kScoreSlack of the best, best first. Ties keep input order.
[[nodiscard]] std::vector<WallRun> EligibleRuns(std::vector<WallRun> runs);

/// Picks one eligible run with a generator seeded from baseSeed and puzzleId.
/// Same runs + same puzzleId always give the same run.
[[nodiscard]] std::optional<WallRun> SelectRun(std::vector<WallRun> runs, std::string_view puzzleId, std::uint64_t baseSeed);
} // namespace game::portals
