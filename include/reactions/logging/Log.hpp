#pragma once
// include/reactions/logging/Log.hpp
//
// Process-wide spdlog setup. Library code logs through spdlog's default logger
// (spdlog::info(...)); hosts call Init() once to route it to files/console.

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace reactions::logsys {

struct LogOptions {
    bool                      console      = true;
    bool                      file         = true;
    std::size_t               maxFileBytes = 1u << 20;  // per rotated file
    std::size_t               maxFiles     = 4;
    spdlog::level::level_enum level        = spdlog::level::info;
};

// Installs a logger named "reactions" as spdlog's default, writing to
// <logDir>/reactions.log (rotating) and/or stdout.
void Init(const std::filesystem::path& logDir, const LogOptions& options = {});

void Shutdown();

std::shared_ptr<spdlog::logger> Get();

} // namespace reactions::logsys
