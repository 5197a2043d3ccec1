// src/reactions/logging/Log.cpp
#include "reactions/logging/Log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace reactions::logsys {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

} // namespace

void Init(const fs::path& logDir, const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    std::string fileError;

    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (options.file)
    {
        std::error_code ec;
        fs::create_directories(logDir, ec);
        try
        {
            const auto file = (logDir / "reactions.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, options.maxFileBytes, options.maxFiles));
        }
        catch (const spdlog::spdlog_ex& e)
        {
            // A missing log file must not stop the host.
            fileError = e.what();
        }
    }

    if (sinks.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    g_logger = std::make_shared<spdlog::logger>("reactions", sinks.begin(), sinks.end());
    g_logger->set_level(options.level);
    g_logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("Logging started");
    if (!fileError.empty())
        spdlog::warn("Log file unavailable: {}", fileError);
}

void Shutdown()
{
    if (g_logger)
        g_logger->flush();
    g_logger.reset();
}

std::shared_ptr<spdlog::logger> Get()
{
    return g_logger ? g_logger : spdlog::default_logger();
}

} // namespace reactions::logsys
