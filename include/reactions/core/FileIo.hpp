#pragma once
// include/reactions/core/FileIo.hpp
//
// Whole-file reads and atomic writes for the engine's data files
// (config.ini, rule JSON, i18n JSON).

#include <filesystem>
#include <string>

namespace reactions::io {

namespace fs = std::filesystem;

/// Read the entire file at `path` into `out`. A leading UTF-8 BOM is stripped.
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool read_all(const fs::path& path, std::string& out, std::string* err = nullptr);

/// Write `bytes` to a sibling temp file, then rename it over `final_path`.
/// Parent directories are created as needed.
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path, const std::string& bytes, std::string* err = nullptr);

} // namespace reactions::io
