// src/reactions/i18n/JsonLocalization.cpp
#include "reactions/i18n/JsonLocalization.hpp"

#include "reactions/core/FileIo.hpp"
#include "reactions/rules/Rules.hpp"

#include <spdlog/spdlog.h>

namespace reactions {

bool JsonLocalization::LoadFromJsonText(std::string_view text, std::string* outError)
{
    const json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (doc.is_discarded())
    {
        if (outError)
            *outError = "translation file is not valid JSON";
        return false;
    }
    if (!doc.is_object())
    {
        if (outError)
            *outError = std::string("translation file must be an object, got ") + doc.type_name();
        return false;
    }

    std::unordered_map<TextKey, std::string> strings;
    strings.reserve(doc.size());
    for (const auto& [key, value] : doc.items())
    {
        if (!value.is_string())
        {
            spdlog::warn("i18n: '{}' is not a string and was skipped.", key);
            continue;
        }
        strings.emplace(key, value.get<std::string>());
    }

    m_strings = std::move(strings);
    m_reportedMissing.clear();
    return true;
}

bool JsonLocalization::LoadFromFile(const std::filesystem::path& path, std::string* outError)
{
    std::string text;
    std::string err;
    if (!io::read_all(path, text, &err))
    {
        if (outError)
            *outError = "failed to read " + path.string() + ": " + err;
        return false;
    }
    return LoadFromJsonText(text, outError);
}

std::string JsonLocalization::Resolve(const TextKey& key)
{
    const auto it = m_strings.find(key);
    if (it != m_strings.end())
        return it->second;

    if (m_reportedMissing.insert(key).second)
        spdlog::warn("i18n: no translation for '{}'.", key);
    return "(no translation:" + key + ")";
}

} // namespace reactions
