#include "game/puzzles/PuzzleService.hpp"

#include <iostream>

#include "game/GameEvents.hpp"

namespace game::puzzles
{
const char* SubmitResultToText(SubmitResult result)
{
    switch (result)
    {
        case SubmitResult::Solved: return "solved";
        case SubmitResult::WrongAnswer: return "wrong_answer";
        case SubmitResult::UnknownPuzzle: return "unknown_puzzle";
        case SubmitResult::NoHandler: return "no_handler";
        default: return "unknown";
    }
}

PuzzleService::PuzzleService(const PuzzleRegistry& puzzles, const PuzzleHandlerRegistry& handlers, engine::core::EventBus& eventBus)
    : m_puzzles(puzzles)
    , m_handlers(handlers)
    , m_eventBus(eventBus)
{
}

SubmitResult PuzzleService::SubmitAnswer(const std::string& puzzleId, const std::string& answer)
{
    const Puzzle* puzzle = m_puzzles.Get(puzzleId);
    if (puzzle == nullptr)
    {
        return SubmitResult::UnknownPuzzle;
    }
    if (!m_handlers.HasHandler(puzzle->type))
    {
        std::cout << "[PUZZLE] WARNING - No handler for puzzle type '" << puzzle->type << "'\n";
        return SubmitResult::NoHandler;
    }
    if (!m_handlers.CheckAnswer(*puzzle, answer))
    {
        return SubmitResult::WrongAnswer;
    }

    m_solved.insert(puzzleId);
    std::cout << "[PUZZLE] Solved '" << puzzleId << "'\n";
    m_eventBus.Publish(engine::core::Event{events::kPuzzleSolved, {puzzleId}});
    return SubmitResult::Solved;
}
} // namespace game::puzzles
