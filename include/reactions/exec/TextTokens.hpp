#pragma once
// include/reactions/exec/TextTokens.hpp
//
// Localized reaction text helpers.
//
//   "Hi @!|How is %farm?"  ->  ["Hi Alex!", "How is Sunny Farm?"]
//
// Tokens (applied to each fragment independently):
//   a^b              gender branch: a for male initiators, b otherwise (when present)
//   @                initiator name
//   %farm            initiator's farm / organization name
//   %favorite_thing  initiator's favorite thing
//   %pet             initiator's companion name (only if they have one)
//   %spouse          the speaking target's partner (only if it has one)

#include "reactions/rules/Facts.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace reactions {

inline constexpr char kFragmentSplitter = '|';
inline constexpr char kGenderSplitter   = '^';

// Splits on '|'. Text without a splitter yields a single fragment; empty
// fragments are kept so authored pauses stay intact.
[[nodiscard]] std::vector<std::string> SplitFragments(std::string_view text);

[[nodiscard]] std::string ExpandTokens(std::string_view fragment, const FactSnapshot& facts);

} // namespace reactions
