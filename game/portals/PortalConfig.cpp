#include "game/portals/PortalConfig.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace game::portals
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

void PortalConfig::ResetDefaults()
{
    *this = PortalConfig{};
}

bool PortalConfig::Validate(std::string* outError) const
{
    if (minSegmentLength < 1)
    {
        SetError(outError, "min_segment_length must be at least 1");
        return false;
    }
    if (maxSegmentLength < minSegmentLength)
    {
        SetError(outError, "max_segment_length must not be smaller than min_segment_length");
        return false;
    }
    if (preferredSegmentLength < 1)
    {
        SetError(outError, "preferred_segment_length must be at least 1");
        return false;
    }
    if (!(tileSize > 0.0F))
    {
        SetError(outError, "tile_size must be positive");
        return false;
    }
    return true;
}

json PortalConfig::ToJson() const
{
    json root;
    root["asset_version"] = kAssetVersion;
    root["min_segment_length"] = minSegmentLength;
    root["max_segment_length"] = maxSegmentLength;
    root["preferred_segment_length"] = preferredSegmentLength;
    root["feature_enabled"] = featureEnabled;
    root["hide_legacy_exits"] = hideLegacyExits;
    root["base_seed"] = baseSeed;
    root["tile_size"] = tileSize;
    return root;
}

bool PortalConfig::FromJson(const json& root, PortalConfig& outConfig, std::string* outError)
{
    if (!root.is_object())
    {
        SetError(outError, "Portal config root must be an object");
        return false;
    }

    PortalConfig parsed = outConfig;
    try
    {
        const int assetVersion = root.value("asset_version", kAssetVersion);
        if (assetVersion != kAssetVersion)
        {
            std::cout << "[CONFIG] WARNING - Unexpected portal config version " << assetVersion << ", expected "
                      << kAssetVersion << "\n";
        }

        parsed.minSegmentLength = root.value("min_segment_length", parsed.minSegmentLength);
        parsed.maxSegmentLength = root.value("max_segment_length", parsed.maxSegmentLength);
        parsed.preferredSegmentLength = root.value("preferred_segment_length", parsed.preferredSegmentLength);
        parsed.featureEnabled = root.value("feature_enabled", parsed.featureEnabled);
        parsed.hideLegacyExits = root.value("hide_legacy_exits", parsed.hideLegacyExits);
        parsed.baseSeed = root.value("base_seed", parsed.baseSeed);
        parsed.tileSize = root.value("tile_size", parsed.tileSize);
    }
    catch (const json::exception& ex)
    {
        SetError(outError, std::string{"Invalid portal config value: "} + ex.what());
        return false;
    }

    if (!parsed.Validate(outError))
    {
        return false;
    }

    outConfig = parsed;
    return true;
}

bool PortalConfig::LoadFromJsonFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Cannot open portal config file: " + path);
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string{"Invalid portal config JSON: "} + ex.what());
        return false;
    }

    return FromJson(root, *this, outError);
}

bool PortalConfig::SaveToJsonFile(const std::string& path, std::string* outError) const
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Cannot write portal config file: " + path);
        return false;
    }

    stream << ToJson().dump(2) << "\n";
    return true;
}
} // namespace game::portals
