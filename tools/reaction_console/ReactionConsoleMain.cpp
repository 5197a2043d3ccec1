// tools/reaction_console/ReactionConsoleMain.cpp
//
// Interactive driver for the reaction engine.
//
//   reaction_console [dataDir]
//
// dataDir (default: ./assets) holds config.ini, reactions.json, combos.json,
// i18n/default.json and world.json. Commands are read from stdin:
//
//   emote <initiator> <signal>         signal every actor in world.json
//   tick <ms>                          advance the clock and run due steps
//   day                                start a new day (reward ledger reset)
//   reload | reset                     re-read / reset the rule files
//   inspect <initiator> <target> <signal>
//   quit

#include "ConsoleWorld.hpp"

#include "reactions/core/Config.hpp"
#include "reactions/engine/Engine.hpp"
#include "reactions/i18n/JsonLocalization.hpp"
#include "reactions/logging/Log.hpp"
#include "reactions/rules/RuleStore.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace reactions;

namespace {

void PrintHelp()
{
    std::printf("commands:\n"
                "  emote <initiator> <signal>\n"
                "  tick <ms>\n"
                "  day\n"
                "  reload | reset\n"
                "  inspect <initiator> <target> <signal>\n"
                "  quit\n");
}

bool ParseMs(const std::string& s, long long& out)
{
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size() && out >= 0;
}

void ReportLoad(const RuleLoadResult& r)
{
    for (const auto& e : r.errors)
        std::printf("  [%s] %s: %s\n", RuleLoadErrorCodeName(e.code), e.source.c_str(), e.message.c_str());
    if (!r.complete())
    {
        std::printf("  rule files unusable, previous rules kept\n");
        return;
    }
    std::printf("  %zu signal(s), %zu malformed, %zu dropped\n",
                r.rules.SignalCount(), r.malformedRules, r.droppedRules);
}

} // namespace

int main(int argc, char** argv)
{
    const fs::path dataDir = argc >= 2 ? fs::path(argv[1]) : fs::path("assets");

    logsys::LogOptions logOptions;
    logOptions.level = spdlog::level::debug;
    logsys::Init(dataDir / "logs", logOptions);

    Config cfg;
    if (!LoadConfig(cfg, dataDir))
    {
        spdlog::info("No config.ini in {}; writing defaults.", dataDir.string());
        if (!SaveConfig(cfg, dataDir))
            spdlog::warn("Could not write default config.ini.");
    }

    console::ConsoleWorld world;
    std::string err;
    if (!world.LoadFromFile(dataDir / "world.json", &err))
    {
        spdlog::error("Cannot load world: {}", err);
        logsys::Shutdown();
        return 1;
    }

    JsonLocalization i18n;
    if (!i18n.LoadFromFile(dataDir / "i18n" / "default.json", &err))
        spdlog::warn("Translations unavailable: {}", err);

    console::LoggingPorts effects;

    EffectPorts ports;
    ports.signal        = &effects;
    ports.animation     = &effects;
    ports.text          = &effects;
    ports.localization  = &i18n;
    ports.relationships = &world;
    ports.sound         = &effects;
    ports.notifications = &effects;

    RuleStore store(dataDir);
    Engine engine(cfg, store, world, ports);
    ReportLoad(engine.ReloadRules());

    TimeMs now{0};
    PrintHelp();

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line))
    {
        std::istringstream in(line);
        std::string cmd;
        if (!(in >> cmd))
            continue;

        if (cmd == "quit" || cmd == "exit")
            break;

        if (cmd == "emote")
        {
            std::string initiator;
            std::string signal;
            if (!(in >> initiator >> signal))
            {
                std::printf("usage: emote <initiator> <signal>\n");
                continue;
            }
            const std::size_t n = engine.OnSignal(initiator, signal, world.ActorIds(), now);
            std::printf("t=%lld ms: %zu reaction(s) scheduled\n", static_cast<long long>(now.count()), n);
        }
        else if (cmd == "tick")
        {
            std::string arg;
            long long ms = 0;
            if (!(in >> arg) || !ParseMs(arg, ms))
            {
                std::printf("usage: tick <ms>\n");
                continue;
            }
            now += TimeMs{ms};
            engine.Tick(now);
            std::printf("t=%lld ms, %zu pending\n", static_cast<long long>(now.count()), engine.PendingTasks());
        }
        else if (cmd == "day")
        {
            engine.OnDayStarted();
            std::printf("new day\n");
        }
        else if (cmd == "reload")
        {
            ReportLoad(engine.ReloadRules());
        }
        else if (cmd == "reset")
        {
            ReportLoad(engine.ResetRules());
        }
        else if (cmd == "inspect")
        {
            std::string initiator;
            std::string target;
            std::string signal;
            if (!(in >> initiator >> target >> signal))
            {
                std::printf("usage: inspect <initiator> <target> <signal>\n");
                continue;
            }
            std::printf("%s", engine.Inspect(initiator, target, signal).Describe().c_str());
        }
        else
        {
            PrintHelp();
        }
    }

    logsys::Shutdown();
    return 0;
}
