#pragma once
// include/reactions/i18n/JsonLocalization.hpp
//
// Localization backed by a flat JSON object: { "reaction.hello": "Hi @!", ... }.

#include "reactions/exec/Ports.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace reactions {

class JsonLocalization final : public Localization {
public:
    JsonLocalization() = default;

    // Replaces the current table. Non-string values are skipped with a warning.
    // On failure the current table is left untouched and `outError` explains why.
    bool LoadFromJsonText(std::string_view text, std::string* outError = nullptr);
    bool LoadFromFile(const std::filesystem::path& path, std::string* outError = nullptr);

    // Missing keys resolve to a visible placeholder and are logged once.
    std::string Resolve(const TextKey& key) override;

    [[nodiscard]] bool Has(const TextKey& key) const { return m_strings.count(key) != 0; }
    [[nodiscard]] std::size_t Size() const noexcept { return m_strings.size(); }

private:
    std::unordered_map<TextKey, std::string> m_strings;
    std::unordered_set<TextKey>              m_reportedMissing;
};

} // namespace reactions
