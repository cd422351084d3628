#include "game/puzzles/VigenereCipher.hpp"

#include <cctype>
#include <vector>

namespace game::puzzles
{
namespace
{
constexpr int kAlphabetSize = 26;

[[nodiscard]] char ToUpper(char ch)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
}

[[nodiscard]] bool IsAsciiLetter(char ch)
{
    const char upper = ToUpper(ch);
    return upper >= 'A' && upper <= 'Z';
}
} // namespace

std::string VigenereCipher::Encrypt(const std::string& plaintext, const std::string& key)
{
    return Apply(plaintext, key, false);
}

std::string VigenereCipher::Decrypt(const std::string& ciphertext, const std::string& key)
{
    return Apply(ciphertext, key, true);
}

std::string VigenereCipher::Normalize(const std::string& input)
{
    std::string result;
    result.reserve(input.size());
    for (const char ch : input)
    {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0)
        {
            continue;
        }
        result.push_back(ToUpper(ch));
    }
    return result;
}

std::string VigenereCipher::Apply(const std::string& text, const std::string& key, bool decrypt)
{
    std::vector<int> shifts;
    shifts.reserve(key.size());
    for (const char ch : key)
    {
        if (IsAsciiLetter(ch))
        {
            shifts.push_back(ToUpper(ch) - 'A');
        }
    }
    if (shifts.empty())
    {
        return {};
    }

    std::string result;
    result.reserve(text.size());
    std::size_t keyIndex = 0;
    for (const char raw : text)
    {
        const char ch = ToUpper(raw);
        if (!IsAsciiLetter(ch))
        {
            result.push_back(ch);
            continue;
        }

        const int value = ch - 'A';
        const int shift = shifts[keyIndex % shifts.size()];
        const int shifted = decrypt ? (value - shift + kAlphabetSize) % kAlphabetSize : (value + shift) % kAlphabetSize;
        result.push_back(static_cast<char>('A' + shifted));
        ++keyIndex;
    }
    return result;
}
} // namespace game::puzzles
