#include "game/puzzles/Puzzle.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "game/puzzles/VigenereCipher.hpp"

namespace game::puzzles
{
namespace
{
[[nodiscard]] bool IsVigenereType(const std::string& type)
{
    constexpr std::string_view kVigenere = "vigenere";
    return std::equal(type.begin(), type.end(), kVigenere.begin(), kVigenere.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}
} // namespace

std::optional<std::string> Puzzle::GetData(const std::string& key) const
{
    const auto it = data.find(key);
    if (it == data.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::string Puzzle::GetData(const std::string& key, const std::string& defaultValue) const
{
    const auto it = data.find(key);
    return it != data.end() ? it->second : defaultValue;
}

std::optional<std::string> ResolveExpectedAnswer(const Puzzle& puzzle)
{
    if (std::optional<std::string> answer = puzzle.GetData("answer"))
    {
        return answer;
    }

    if (!IsVigenereType(puzzle.type))
    {
        return std::nullopt;
    }

    const std::optional<std::string> ciphertext = puzzle.GetData("ciphertext");
    const std::optional<std::string> key = puzzle.GetData("key");
    if (!ciphertext.has_value() || !key.has_value())
    {
        return std::nullopt;
    }

    std::string plaintext = VigenereCipher::Decrypt(*ciphertext, *key);
    if (plaintext.empty())
    {
        return std::nullopt;
    }
    return plaintext;
}
} // namespace game::puzzles
