#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "game/puzzles/Puzzle.hpp"

namespace game::puzzles
{
/// Puzzles of the current level, looked up by id.
class PuzzleRegistry
{
public:
    /// Ignores puzzles with an empty id. Re-registering an id replaces the puzzle.
    bool Register(Puzzle puzzle);

    [[nodiscard]] const Puzzle* Get(const std::string& puzzleId) const;
    [[nodiscard]] bool Contains(const std::string& puzzleId) const;
    bool Remove(const std::string& puzzleId);
    void Clear();

    [[nodiscard]] std::size_t Size() const { return m_puzzles.size(); }
    [[nodiscard]] std::vector<std::string> ListIds() const;

    /// Expects {"asset_version": 1, "puzzles": [{"id", "type", "data": {...}}]}.
    /// @return Number of puzzles registered, or -1 on a malformed document.
    int LoadFromJson(const nlohmann::json& root, std::string* outError = nullptr);
    bool LoadFromJsonFile(const std::string& path, std::string* outError = nullptr);

private:
    std::unordered_map<std::string, Puzzle> m_puzzles;
};
} // namespace game::puzzles
