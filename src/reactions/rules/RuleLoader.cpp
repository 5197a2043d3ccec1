// src/reactions/rules/RuleLoader.cpp
#include "reactions/rules/RuleLoader.hpp"

#include "reactions/core/FileIo.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace reactions {

namespace fs = std::filesystem;

namespace {

void AddError(RuleLoadResult& out, RuleLoadError::Code code, std::string_view source, std::string message)
{
    spdlog::error("Rules [{}] {}: {}", RuleLoadErrorCodeName(code), source, message);
    out.errors.push_back(RuleLoadError{code, std::string(source), std::move(message)});
}

bool ParseDocument(std::string_view text, std::string_view sourceName, RuleLoadResult& out, json& doc)
{
    doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (doc.is_discarded())
    {
        AddError(out, RuleLoadError::Code::JsonParseError, sourceName, "document is not valid JSON");
        ++out.unusableDocuments;
        return false;
    }
    if (!doc.is_object())
    {
        AddError(out, RuleLoadError::Code::JsonTypeError, sourceName,
                 std::string("top level must be an object keyed by signal, got ") + doc.type_name());
        ++out.unusableDocuments;
        return false;
    }
    return true;
}

// Parses doc[signal][listKey] into `dst`, dropping entries that are not objects.
template <class RuleT>
void ParseRuleList(const json& doc, const char* listKey, std::string_view sourceName,
                   RuleLoadResult& out, std::vector<RuleT> SignalRules::*member)
{
    for (const auto& [signal, entry] : doc.items())
    {
        if (!entry.is_object())
        {
            AddError(out, RuleLoadError::Code::JsonTypeError, sourceName,
                     "signal '" + signal + "' must map to an object");
            continue;
        }

        const auto list = entry.find(listKey);
        if (list == entry.end() || list->is_null())
            continue;

        if (!list->is_array())
        {
            AddError(out, RuleLoadError::Code::JsonTypeError, sourceName,
                     "signal '" + signal + "': " + listKey + " must be an array");
            continue;
        }

        std::vector<RuleT> rules;
        rules.reserve(list->size());

        std::size_t index = 0;
        for (const auto& item : *list)
        {
            try
            {
                RuleT rule = item.template get<RuleT>();
                if (rule.IsMalformed())
                {
                    ++out.malformedRules;
                    spdlog::warn("Rules {}: '{}' {}[{}] is malformed and will never match.",
                                 sourceName, signal, listKey, index);
                }
                rules.push_back(std::move(rule));
            }
            catch (const json::exception& e)
            {
                ++out.droppedRules;
                AddError(out, RuleLoadError::Code::JsonTypeError, sourceName,
                         "signal '" + signal + "' " + listKey + "[" + std::to_string(index) + "] dropped: " + e.what());
            }
            ++index;
        }

        (out.rules.Upsert(signal).*member) = std::move(rules);
    }
}

bool LoadOrCreate(const fs::path& file, std::string& text, RuleLoadResult& out)
{
    std::error_code ec;
    if (!fs::exists(file, ec))
    {
        spdlog::warn("Could not find '{}'. A default one will be created.", file.filename().string());

        std::string err;
        if (!io::write_atomic(file, "{}\n", &err))
            AddError(out, RuleLoadError::Code::IoWriteFail, file.filename().string(), err);
        else
            out.createdFiles.push_back(file.filename().string());

        text = "{}";
        return true;
    }

    std::string err;
    if (!io::read_all(file, text, &err))
    {
        AddError(out, RuleLoadError::Code::IoOpenFail, file.filename().string(), err);
        ++out.unusableDocuments;
        return false;
    }
    return true;
}

} // namespace

const char* RuleLoadErrorCodeName(RuleLoadError::Code code) noexcept
{
    switch (code)
    {
    case RuleLoadError::Code::IoOpenFail:     return "IoOpenFail";
    case RuleLoadError::Code::IoWriteFail:    return "IoWriteFail";
    case RuleLoadError::Code::JsonParseError: return "JsonParseError";
    case RuleLoadError::Code::JsonTypeError:  return "JsonTypeError";
    }
    return "Unknown";
}

bool ParseReactionsJson(std::string_view text, std::string_view sourceName, RuleLoadResult& out)
{
    json doc;
    if (!ParseDocument(text, sourceName, out, doc))
        return false;

    ParseRuleList<ReactionRule>(doc, "Reactions", sourceName, out, &SignalRules::reactions);
    return true;
}

bool ParseCombosJson(std::string_view text, std::string_view sourceName, RuleLoadResult& out)
{
    json doc;
    if (!ParseDocument(text, sourceName, out, doc))
        return false;

    ParseRuleList<ComboRule>(doc, "ComboReactions", sourceName, out, &SignalRules::comboReactions);
    return true;
}

RuleLoadResult LoadRuleFiles(const fs::path& dir)
{
    RuleLoadResult out;

    std::string text;
    if (LoadOrCreate(dir / kReactionsFileName, text, out))
        ParseReactionsJson(text, kReactionsFileName, out);

    if (LoadOrCreate(dir / kCombosFileName, text, out))
        ParseCombosJson(text, kCombosFileName, out);

    if (out.ok())
        spdlog::info("Successfully loaded and merged '{}' and '{}' ({} signals).",
                     kReactionsFileName, kCombosFileName, out.rules.SignalCount());
    else
        spdlog::warn("Loaded rules with {} error(s) ({} signals usable).",
                     out.errors.size(), out.rules.SignalCount());

    return out;
}

bool DeleteRuleFiles(const fs::path& dir, std::vector<RuleLoadError>* errors)
{
    bool ok = true;
    for (const char* name : {kReactionsFileName, kCombosFileName})
    {
        std::error_code ec;
        fs::remove(dir / name, ec);
        if (ec)
        {
            ok = false;
            spdlog::error("Could not delete '{}': {}", name, ec.message());
            if (errors)
                errors->push_back(RuleLoadError{RuleLoadError::Code::IoWriteFail, name, ec.message()});
        }
    }
    return ok;
}

} // namespace reactions
