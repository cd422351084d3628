#include "game/puzzles/PuzzleRegistry.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

namespace game::puzzles
{
namespace
{
using json = nlohmann::json;

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}
} // namespace

bool PuzzleRegistry::Register(Puzzle puzzle)
{
    if (puzzle.puzzleId.empty())
    {
        return false;
    }
    const std::string id = puzzle.puzzleId;
    m_puzzles[id] = std::move(puzzle);
    return true;
}

const Puzzle* PuzzleRegistry::Get(const std::string& puzzleId) const
{
    const auto it = m_puzzles.find(puzzleId);
    if (it == m_puzzles.end())
    {
        return nullptr;
    }
    return &it->second;
}

bool PuzzleRegistry::Contains(const std::string& puzzleId) const
{
    return m_puzzles.contains(puzzleId);
}

bool PuzzleRegistry::Remove(const std::string& puzzleId)
{
    return m_puzzles.erase(puzzleId) > 0;
}

void PuzzleRegistry::Clear()
{
    m_puzzles.clear();
}

std::vector<std::string> PuzzleRegistry::ListIds() const
{
    std::vector<std::string> ids;
    ids.reserve(m_puzzles.size());
    for (const auto& [id, _] : m_puzzles)
    {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

int PuzzleRegistry::LoadFromJson(const json& root, std::string* outError)
{
    if (!root.is_object() || !root.contains("puzzles") || !root["puzzles"].is_array())
    {
        SetError(outError, "Missing puzzles array");
        return -1;
    }

    int assetVersion = 1;
    try
    {
        assetVersion = root.value("asset_version", 1);
    }
    catch (const json::exception& ex)
    {
        SetError(outError, std::string{"Invalid asset_version: "} + ex.what());
        return -1;
    }
    if (assetVersion != 1)
    {
        std::cout << "[PUZZLE] WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
    }

    int loaded = 0;
    for (const json& node : root["puzzles"])
    {
        if (!node.is_object())
        {
            continue;
        }

        Puzzle puzzle;
        try
        {
            puzzle.puzzleId = node.value("id", "");
            puzzle.type = node.value("type", "");
        }
        catch (const json::exception& ex)
        {
            std::cout << "[PUZZLE] WARNING - Skipping malformed puzzle: " << ex.what() << "\n";
            continue;
        }
        if (node.contains("data") && node["data"].is_object())
        {
            for (const auto& [key, value] : node["data"].items())
            {
                if (value.is_string())
                {
                    puzzle.data[key] = value.get<std::string>();
                }
            }
        }

        if (Register(std::move(puzzle)))
        {
            ++loaded;
        }
        else
        {
            std::cout << "[PUZZLE] WARNING - Skipping puzzle without id\n";
        }
    }
    return loaded;
}

bool PuzzleRegistry::LoadFromJsonFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Cannot open puzzles file: " + path);
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string{"Invalid puzzles JSON: "} + ex.what());
        return false;
    }

    const int loaded = LoadFromJson(root, outError);
    if (loaded < 0)
    {
        return false;
    }
    std::cout << "[PUZZLE] Loaded " << loaded << " puzzles from " << path << "\n";
    return true;
}
} // namespace game::puzzles
