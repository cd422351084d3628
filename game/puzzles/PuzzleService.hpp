#pragma once

#include <string>
#include <unordered_set>

#include "engine/core/EventBus.hpp"
#include "game/puzzles/PuzzleHandlerRegistry.hpp"
#include "game/puzzles/PuzzleRegistry.hpp"

namespace game::puzzles
{
enum class SubmitResult
{
    Solved,
    WrongAnswer,
    UnknownPuzzle,
    NoHandler
};

[[nodiscard]] const char* SubmitResultToText(SubmitResult result);

/// Checks player answers and publishes puzzle_solved for correct ones.
class PuzzleService
{
public:
    PuzzleService(const PuzzleRegistry& puzzles, const PuzzleHandlerRegistry& handlers, engine::core::EventBus& eventBus);

    /// A correct answer publishes puzzle_solved every time, including re-solves.
    SubmitResult SubmitAnswer(const std::string& puzzleId, const std::string& answer);

    [[nodiscard]] bool IsSolved(const std::string& puzzleId) const { return m_solved.contains(puzzleId); }
    void Reset() { m_solved.clear(); }

private:
    const PuzzleRegistry& m_puzzles;
    const PuzzleHandlerRegistry& m_handlers;
    engine::core::EventBus& m_eventBus;
    std::unordered_set<std::string> m_solved;
};
} // namespace game::puzzles
