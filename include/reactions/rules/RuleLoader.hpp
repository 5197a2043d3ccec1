#pragma once
// include/reactions/rules/RuleLoader.hpp
//
// Loads and merges the two rule files:
//
//   reactions.json  { "<signal>": { "Reactions":      [ ReactionRule... ] }, ... }
//   combos.json     { "<signal>": { "ComboReactions": [ ComboRule...    ] }, ... }
//
// Loading is tolerant: a broken file or entry is reported in `errors` and
// skipped, the rest of the data still loads.

#include "reactions/rules/Rules.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace reactions {

inline constexpr const char* kReactionsFileName = "reactions.json";
inline constexpr const char* kCombosFileName    = "combos.json";

struct RuleLoadError {
    enum class Code {
        IoOpenFail,
        IoWriteFail,
        JsonParseError,
        JsonTypeError,
    } code{};
    std::string source;   // file name or "<text>"
    std::string message;
};

[[nodiscard]] const char* RuleLoadErrorCodeName(RuleLoadError::Code code) noexcept;

struct RuleLoadResult {
    RuleSet                    rules;
    std::vector<RuleLoadError> errors;
    std::size_t                droppedRules   = 0;  // entries that were not objects
    std::size_t                malformedRules = 0;  // kept, never match
    std::size_t                unusableDocuments = 0;  // unreadable, not JSON, or not an object
    std::vector<std::string>   createdFiles;        // defaults written for missing files

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }

    // False when a whole document was lost; `rules` is then only part of what
    // the files describe.
    [[nodiscard]] bool complete() const noexcept { return unusableDocuments == 0; }
};

// Parses one document of either kind into `out`. `sourceName` is used for
// diagnostics only. Returns false if the document itself is unusable.
bool ParseReactionsJson(std::string_view text, std::string_view sourceName, RuleLoadResult& out);
bool ParseCombosJson(std::string_view text, std::string_view sourceName, RuleLoadResult& out);

// Reads <dir>/reactions.json and <dir>/combos.json and merges them per signal.
// A missing file is created as "{}" and logged as a warning.
[[nodiscard]] RuleLoadResult LoadRuleFiles(const std::filesystem::path& dir);

// Deletes both rule files so the next load recreates empty defaults.
bool DeleteRuleFiles(const std::filesystem::path& dir, std::vector<RuleLoadError>* errors = nullptr);

} // namespace reactions
