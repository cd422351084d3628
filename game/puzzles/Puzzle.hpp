#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace game::puzzles
{
struct Puzzle
{
    std::string puzzleId;
    std::string type; // "cipher", "vigenere", ...
    std::unordered_map<std::string, std::string> data;

    [[nodiscard]] std::optional<std::string> GetData(const std::string& key) const;
    [[nodiscard]] std::string GetData(const std::string& key, const std::string& defaultValue) const;
};

/// data["answer"] when present. Only "vigenere" puzzles fall back to decrypting
/// data["ciphertext"] with data["key"]. Empty optional otherwise.
[[nodiscard]] std::optional<std::string> ResolveExpectedAnswer(const Puzzle& puzzle);
} // namespace game::puzzles
