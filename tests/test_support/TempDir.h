#pragma once
//
// Scratch directories for file-backed tests. Each call returns a fresh
// directory under the system temp path; ScopedTempDir removes it afterwards.
//
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace reactions::testing {

inline std::filesystem::path make_unique_temp_dir(const std::string& tag)
{
    namespace fs = std::filesystem;

    static std::atomic<unsigned> counter{0};

    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("reactions_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    fs::create_directories(dir, ec);
    return dir;
}

class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& tag) : m_path(make_unique_temp_dir(tag)) {}
    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScopedTempDir(const ScopedTempDir&)            = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace reactions::testing
