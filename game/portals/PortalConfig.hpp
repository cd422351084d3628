#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace game::portals
{
/// Runtime settings for wall-segment portal placement.
/// All values may be changed between placement attempts.
struct PortalConfig
{
    static constexpr int kAssetVersion = 1;

    static constexpr int kDefaultMinSegmentLength = 4;
    static constexpr int kDefaultMaxSegmentLength = 5;
    static constexpr int kDefaultPreferredSegmentLength = 4;
    static constexpr std::uint64_t kDefaultBaseSeed = 42U;
    static constexpr float kDefaultTileSize = 16.0F;

    int minSegmentLength = kDefaultMinSegmentLength;
    int maxSegmentLength = kDefaultMaxSegmentLength;
    int preferredSegmentLength = kDefaultPreferredSegmentLength;

    // Global kill-switch. When false every solve request is a no-op and another
    // progression mechanism (gates) is expected to take over.
    bool featureEnabled = false;

    // Legacy exit entities stay hidden until a portal activates.
    bool hideLegacyExits = true;

    std::uint64_t baseSeed = kDefaultBaseSeed;
    float tileSize = kDefaultTileSize;

    void ResetDefaults();

    /// Level loaders hide legacy exits only while portals replace them.
    [[nodiscard]] bool ShouldHideLegacyExits() const { return featureEnabled && hideLegacyExits; }

    /// @return False (with a reason in outError) when the bounds cannot produce a run.
    [[nodiscard]] bool Validate(std::string* outError = nullptr) const;

    [[nodiscard]] nlohmann::json ToJson() const;

    /// Reads known keys from root; missing keys keep their current value.
    [[nodiscard]] static bool FromJson(const nlohmann::json& root, PortalConfig& outConfig, std::string* outError = nullptr);

    [[nodiscard]] bool LoadFromJsonFile(const std::string& path, std::string* outError = nullptr);
    [[nodiscard]] bool SaveToJsonFile(const std::string& path, std::string* outError = nullptr) const;
};
} // namespace game::portals
