// src/reactions/rules/RuleStore.cpp
#include "reactions/rules/RuleStore.hpp"

#include <spdlog/spdlog.h>

namespace reactions {

RuleStore::RuleStore()
    : m_rules(std::make_shared<const RuleSet>())
{
}

RuleStore::RuleStore(std::filesystem::path rulesDir)
    : m_dir(std::move(rulesDir))
    , m_rules(std::make_shared<const RuleSet>())
{
}

std::shared_ptr<const RuleSet> RuleStore::Snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rules;
}

void RuleStore::Replace(RuleSet rules)
{
    auto next = std::make_shared<const RuleSet>(std::move(rules));
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rules = std::move(next);
}

bool RuleStore::ApplyIfComplete(const RuleLoadResult& result)
{
    if (!result.complete())
    {
        spdlog::error("{} rule file(s) could not be loaded; keeping the current rules.",
                      result.unusableDocuments);
        return false;
    }
    Replace(result.rules);
    return true;
}

RuleLoadResult RuleStore::Reload()
{
    if (m_dir.empty())
    {
        spdlog::warn("RuleStore::Reload: no rules directory configured; keeping current rules.");
        return {};
    }

    RuleLoadResult result = LoadRuleFiles(m_dir);
    if (ApplyIfComplete(result))
        spdlog::info("Reaction and combo rules have been reloaded and applied.");
    return result;
}

RuleLoadResult RuleStore::ResetToDefaults()
{
    if (m_dir.empty())
    {
        spdlog::warn("RuleStore::ResetToDefaults: no rules directory configured.");
        return {};
    }

    std::vector<RuleLoadError> deleteErrors;
    DeleteRuleFiles(m_dir, &deleteErrors);

    RuleLoadResult result = LoadRuleFiles(m_dir);
    result.errors.insert(result.errors.begin(), deleteErrors.begin(), deleteErrors.end());
    if (ApplyIfComplete(result))
        spdlog::info("Reaction and combo rules have been reset and applied.");
    return result;
}

} // namespace reactions
