#pragma once
// include/reactions/core/Config.hpp
//
// User-editable engine settings, persisted as <dir>/config.ini (key=value).

#include "reactions/rules/ConditionEvaluator.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace reactions {

enum class ComboCountMode {
    PerCombo,  // rule TriggerCount, GlobalComboTarget when unset
    Fixed,     // GlobalComboTarget for every rule
};

[[nodiscard]] const char* ComboCountModeName(ComboCountMode m) noexcept;
[[nodiscard]] ComboCountMode ParseComboCountMode(std::string_view s) noexcept;

struct Config {
    int  eventDistance    = 3;     // tiles
    int  emoteDelayMs     = 700;
    int  reactionJitterMs = 300;   // exclusive upper bound of the random extra delay
    int  signalToTextPauseMs = 1200;
    int  textFragmentPauseMs = 1800;

    bool        playReplySound = true;
    std::string replySound     = "pickUpItem";

    int  friendshipGainAmount      = 10;
    bool showFriendshipGainMessage = true;

    bool           emoteCombo        = true;
    ComboCountMode comboCountMode    = ComboCountMode::PerCombo;
    int            globalComboTarget = 3;
    int            comboTimeoutMs    = 2100;

    bool enableWeatherConditions    = true;
    bool enableSeasonConditions     = true;
    bool enableFriendshipConditions = true;

    [[nodiscard]] ConditionToggles Toggles() const noexcept
    {
        return ConditionToggles{enableSeasonConditions, enableWeatherConditions, enableFriendshipConditions};
    }

    // Pulls every numeric setting into its supported range.
    void Clamp() noexcept;
};

// Missing file -> false (first run); unparseable values keep their previous value.
bool LoadConfig(Config& cfg, const std::filesystem::path& dir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& dir);

} // namespace reactions
