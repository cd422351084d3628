#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>

#include "game/puzzles/Puzzle.hpp"

namespace game::puzzles
{
/// Answer-checking strategy for one puzzle type.
struct PuzzleHandler
{
    std::string type;
    // Defaults to TrimAndUppercase when empty.
    std::function<std::string(const std::string&)> normalize;
    // Defaults to comparing the normalized strings when empty.
    std::function<bool(const std::string& expected, const std::string& submitted)> validate;
};

[[nodiscard]] std::string TrimAndUppercase(const std::string& answer);

/// "cipher": whitespace-insensitive, case-insensitive comparison.
[[nodiscard]] PuzzleHandler MakeCipherHandler();

/// "vigenere": same comparison as cipher; the expected answer may be derived from
/// ciphertext + key (see ResolveExpectedAnswer).
[[nodiscard]] PuzzleHandler MakeVigenereHandler();

class PuzzleHandlerRegistry
{
public:
    PuzzleHandlerRegistry();

    void RegisterBuiltinHandlers();

    /// Types are matched case-insensitively. A later handler replaces an earlier one.
    bool RegisterHandler(PuzzleHandler handler);

    [[nodiscard]] const PuzzleHandler* FindHandler(const std::string& type) const;
    [[nodiscard]] bool HasHandler(const std::string& type) const { return FindHandler(type) != nullptr; }

    [[nodiscard]] std::string Normalize(const std::string& type, const std::string& answer) const;

    /// False when the type has no handler or the puzzle has no expected answer.
    [[nodiscard]] bool CheckAnswer(const Puzzle& puzzle, const std::string& submitted) const;

    [[nodiscard]] std::size_t Size() const { return m_handlers.size(); }

    void Clear();
    void Reset();

private:
    std::unordered_map<std::string, PuzzleHandler> m_handlers;
};
} // namespace game::puzzles
