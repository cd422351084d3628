#pragma once

namespace game::events
{
// args: {puzzleId}
constexpr const char* kPuzzleSolved = "puzzle_solved";
// args: {puzzleId, portalGroupId, segmentLength}
constexpr const char* kPortalActivated = "portal_activated";
} // namespace game::events
