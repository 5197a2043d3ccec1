// src/reactions/core/Config.cpp
#include "reactions/core/Config.hpp"

#include "reactions/core/FileIo.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

namespace reactions {

namespace {

std::filesystem::path Path(const std::filesystem::path& dir) {
    return dir / "config.ini";
}

std::string_view Trim(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool ParseInt(std::string_view sv, int& out) noexcept
{
    sv = Trim(sv);

    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = Trim(sv);

    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

// Strips "# ...", "; ..." and "// ..." trailing comments.
std::string_view StripInlineComment(std::string_view v) noexcept
{
    std::size_t cut = std::string_view::npos;
    for (std::string_view marker : {std::string_view("#"), std::string_view(";"), std::string_view("//")})
    {
        const std::size_t p = v.find(marker);
        if (p != std::string_view::npos && (cut == std::string_view::npos || p < cut))
            cut = p;
    }
    return cut == std::string_view::npos ? v : Trim(v.substr(0, cut));
}

void WarnInvalid(std::string_view key, std::string_view value)
{
    spdlog::warn("LoadConfig: ignoring invalid value '{}' for {}", value, key);
}

} // namespace

const char* ComboCountModeName(ComboCountMode m) noexcept
{
    switch (m)
    {
    case ComboCountMode::PerCombo: return "PerCombo";
    case ComboCountMode::Fixed:    return "Fixed";
    }
    return "PerCombo";
}

ComboCountMode ParseComboCountMode(std::string_view s) noexcept
{
    return EqualsI(Trim(s), "Fixed") ? ComboCountMode::Fixed : ComboCountMode::PerCombo;
}

void Config::Clamp() noexcept
{
    eventDistance        = std::clamp(eventDistance, 1, 15);
    emoteDelayMs         = std::clamp(emoteDelayMs, 0, 5000);
    reactionJitterMs     = std::max(reactionJitterMs, 0);
    signalToTextPauseMs  = std::max(signalToTextPauseMs, 0);
    textFragmentPauseMs  = std::max(textFragmentPauseMs, 0);
    friendshipGainAmount = std::clamp(friendshipGainAmount, 0, 250);
    globalComboTarget    = std::clamp(globalComboTarget, 2, 10);
    comboTimeoutMs       = std::clamp(comboTimeoutMs, 600, 6000);
}

bool LoadConfig(Config& cfg, const std::filesystem::path& dir)
{
    const auto path = Path(dir);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false; // first run

    std::string text;
    std::string err;
    if (!io::read_all(path, text, &err))
    {
        spdlog::warn("LoadConfig: failed to read {} ({})", path.string(), err);
        return false;
    }

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line))
    {
        const std::string_view tmp = Trim(line);
        if (tmp.empty() || tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[')
            continue;

        const auto pos = tmp.find('=');
        if (pos == std::string_view::npos)
            continue;

        const std::string_view k = Trim(tmp.substr(0, pos));
        const std::string_view v = StripInlineComment(Trim(tmp.substr(pos + 1)));
        if (k.empty())
            continue;

        auto readInt = [&](int& field) {
            int parsed = field;
            if (ParseInt(v, parsed))
                field = parsed;
            else
                WarnInvalid(k, v);
        };
        auto readBool = [&](bool& field) {
            bool parsed = field;
            if (ParseBool(v, parsed))
                field = parsed;
            else
                WarnInvalid(k, v);
        };

        if      (k == "EventDistance")              readInt(cfg.eventDistance);
        else if (k == "EmoteDelay")                 readInt(cfg.emoteDelayMs);
        else if (k == "ReactionJitter")             readInt(cfg.reactionJitterMs);
        else if (k == "SignalToTextPause")          readInt(cfg.signalToTextPauseMs);
        else if (k == "TextFragmentPause")          readInt(cfg.textFragmentPauseMs);
        else if (k == "PlayReplySound")             readBool(cfg.playReplySound);
        else if (k == "ReplySound")                 cfg.replySound = std::string(v);
        else if (k == "FriendshipGainAmount")       readInt(cfg.friendshipGainAmount);
        else if (k == "ShowFriendshipGainMessage")  readBool(cfg.showFriendshipGainMessage);
        else if (k == "EmoteCombo")                 readBool(cfg.emoteCombo);
        else if (k == "ComboCountMode")             cfg.comboCountMode = ParseComboCountMode(v);
        else if (k == "GlobalComboTarget")          readInt(cfg.globalComboTarget);
        else if (k == "ComboTimeout")               readInt(cfg.comboTimeoutMs);
        else if (k == "EnableWeatherConditions")    readBool(cfg.enableWeatherConditions);
        else if (k == "EnableSeasonConditions")     readBool(cfg.enableSeasonConditions);
        else if (k == "EnableFriendshipConditions") readBool(cfg.enableFriendshipConditions);
        else
            spdlog::debug("LoadConfig: unknown key '{}'", k);
    }

    cfg.Clamp();
    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& dir)
{
    std::ostringstream oss;
    oss << "EventDistance="              << cfg.eventDistance << "\n";
    oss << "EmoteDelay="                 << cfg.emoteDelayMs << "\n";
    oss << "ReactionJitter="             << cfg.reactionJitterMs << "\n";
    oss << "SignalToTextPause="          << cfg.signalToTextPauseMs << "\n";
    oss << "TextFragmentPause="          << cfg.textFragmentPauseMs << "\n";
    oss << "PlayReplySound="             << (cfg.playReplySound ? "true" : "false") << "\n";
    oss << "ReplySound="                 << cfg.replySound << "\n";
    oss << "FriendshipGainAmount="       << cfg.friendshipGainAmount << "\n";
    oss << "ShowFriendshipGainMessage="  << (cfg.showFriendshipGainMessage ? "true" : "false") << "\n";
    oss << "EmoteCombo="                 << (cfg.emoteCombo ? "true" : "false") << "\n";
    oss << "ComboCountMode="             << ComboCountModeName(cfg.comboCountMode) << "\n";
    oss << "GlobalComboTarget="          << cfg.globalComboTarget << "\n";
    oss << "ComboTimeout="               << cfg.comboTimeoutMs << "\n";
    oss << "EnableWeatherConditions="    << (cfg.enableWeatherConditions ? "true" : "false") << "\n";
    oss << "EnableSeasonConditions="     << (cfg.enableSeasonConditions ? "true" : "false") << "\n";
    oss << "EnableFriendshipConditions=" << (cfg.enableFriendshipConditions ? "true" : "false") << "\n";

    std::string err;
    if (!io::write_atomic(Path(dir), oss.str(), &err))
    {
        spdlog::error("SaveConfig: {}", err);
        return false;
    }
    return true;
}

} // namespace reactions
