#include "game/puzzles/PuzzleHandlerRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

#include "game/puzzles/VigenereCipher.hpp"

namespace game::puzzles
{
namespace
{
[[nodiscard]] std::string ToLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}
} // namespace

std::string TrimAndUppercase(const std::string& answer)
{
    const auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    const auto first = std::find_if_not(answer.begin(), answer.end(), isSpace);
    const auto last = std::find_if_not(answer.rbegin(), answer.rend(), isSpace).base();
    if (first >= last)
    {
        return {};
    }

    std::string result(first, last);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

PuzzleHandler MakeCipherHandler()
{
    PuzzleHandler handler;
    handler.type = "cipher";
    handler.normalize = [](const std::string& answer) { return VigenereCipher::Normalize(answer); };
    handler.validate = [](const std::string& expected, const std::string& submitted) {
        return VigenereCipher::Normalize(expected) == VigenereCipher::Normalize(submitted);
    };
    return handler;
}

PuzzleHandler MakeVigenereHandler()
{
    PuzzleHandler handler = MakeCipherHandler();
    handler.type = "vigenere";
    return handler;
}

PuzzleHandlerRegistry::PuzzleHandlerRegistry()
{
    RegisterBuiltinHandlers();
}

void PuzzleHandlerRegistry::RegisterBuiltinHandlers()
{
    (void)RegisterHandler(MakeCipherHandler());
    (void)RegisterHandler(MakeVigenereHandler());
}

bool PuzzleHandlerRegistry::RegisterHandler(PuzzleHandler handler)
{
    if (handler.type.empty())
    {
        return false;
    }

    if (!handler.normalize)
    {
        handler.normalize = TrimAndUppercase;
    }
    if (!handler.validate)
    {
        const auto normalize = handler.normalize;
        handler.validate = [normalize](const std::string& expected, const std::string& submitted) {
            return normalize(expected) == normalize(submitted);
        };
    }

    const std::string key = ToLower(handler.type);
    m_handlers[key] = std::move(handler);
    return true;
}

const PuzzleHandler* PuzzleHandlerRegistry::FindHandler(const std::string& type) const
{
    if (type.empty())
    {
        return nullptr;
    }
    const auto it = m_handlers.find(ToLower(type));
    if (it == m_handlers.end())
    {
        return nullptr;
    }
    return &it->second;
}

std::string PuzzleHandlerRegistry::Normalize(const std::string& type, const std::string& answer) const
{
    const PuzzleHandler* handler = FindHandler(type);
    return handler != nullptr ? handler->normalize(answer) : TrimAndUppercase(answer);
}

bool PuzzleHandlerRegistry::CheckAnswer(const Puzzle& puzzle, const std::string& submitted) const
{
    const PuzzleHandler* handler = FindHandler(puzzle.type);
    if (handler == nullptr)
    {
        std::cout << "[PUZZLE] WARNING - No handler for puzzle type '" << puzzle.type << "'\n";
        return false;
    }

    const std::optional<std::string> expected = ResolveExpectedAnswer(puzzle);
    if (!expected.has_value())
    {
        return false;
    }
    return handler->validate(*expected, submitted);
}

void PuzzleHandlerRegistry::Clear()
{
    m_handlers.clear();
}

void PuzzleHandlerRegistry::Reset()
{
    Clear();
    RegisterBuiltinHandlers();
}
} // namespace game::puzzles
