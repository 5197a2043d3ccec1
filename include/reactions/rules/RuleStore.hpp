#pragma once
// include/reactions/rules/RuleStore.hpp
//
// Owns the active RuleSet. Readers take a shared snapshot, so a reload never
// invalidates a rule list that is being walked. Only the rule lists swap;
// combo streaks and busy flags live elsewhere and survive a reload.

#include "reactions/rules/RuleLoader.hpp"
#include "reactions/rules/Rules.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

namespace reactions {

class RuleStore {
public:
    RuleStore();
    explicit RuleStore(std::filesystem::path rulesDir);

    [[nodiscard]] std::shared_ptr<const RuleSet> Snapshot() const;

    void Replace(RuleSet rules);

    // Re-reads both rule files. If either file cannot be read or parsed the
    // active set is kept and the errors are returned. Individual broken
    // entries do not block the swap.
    RuleLoadResult Reload();

    // Deletes the rule files, recreates empty defaults and reloads, with the
    // same keep-on-failure rule as Reload.
    RuleLoadResult ResetToDefaults();

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return m_dir; }

private:
    bool ApplyIfComplete(const RuleLoadResult& result);

    std::filesystem::path m_dir;

    mutable std::mutex             m_mutex;
    std::shared_ptr<const RuleSet> m_rules;
};

} // namespace reactions
