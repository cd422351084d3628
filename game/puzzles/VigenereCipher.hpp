#pragma once

#include <string>

namespace game::puzzles
{
/// Vigenere cipher over A-Z (A=0 ... Z=25). Output is uppercase; characters that are
/// not letters pass through and do not advance the key. Non-letters in the key are
/// ignored. An empty (or letterless) key yields an empty string.
class VigenereCipher
{
public:
    [[nodiscard]] static std::string Encrypt(const std::string& plaintext, const std::string& key);
    [[nodiscard]] static std::string Decrypt(const std::string& ciphertext, const std::string& key);

    /// Removes whitespace and uppercases.
    [[nodiscard]] static std::string Normalize(const std::string& input);

private:
    [[nodiscard]] static std::string Apply(const std::string& text, const std::string& key, bool decrypt);
};
} // namespace game::puzzles
