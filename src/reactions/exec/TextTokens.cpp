// src/reactions/exec/TextTokens.cpp
#include "reactions/exec/TextTokens.hpp"

namespace reactions {

namespace {

void ReplaceAll(std::string& s, std::string_view from, std::string_view to)
{
    if (from.empty())
        return;

    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos)
    {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::vector<std::string> SplitFragments(std::string_view text)
{
    std::vector<std::string> parts;

    std::size_t start = 0;
    for (;;)
    {
        const std::size_t pos = text.find(kFragmentSplitter, start);
        if (pos == std::string_view::npos)
        {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string ExpandTokens(std::string_view fragment, const FactSnapshot& facts)
{
    const InitiatorProfile& who = facts.initiator;

    std::string text;
    if (const std::size_t caret = fragment.find(kGenderSplitter); caret != std::string_view::npos)
    {
        const std::string_view male = fragment.substr(0, caret);
        std::string_view rest = fragment.substr(caret + 1);
        // Only the first two branches are meaningful.
        const std::string_view female = rest.substr(0, rest.find(kGenderSplitter));
        text = std::string(who.isMale ? male : female);
    }
    else
    {
        text = std::string(fragment);
    }

    ReplaceAll(text, "@", who.name);
    ReplaceAll(text, "%farm", who.farmName);
    ReplaceAll(text, "%favorite_thing", who.favoriteThing);
    if (who.petName)
        ReplaceAll(text, "%pet", *who.petName);
    if (facts.speakerSpouseName)
        ReplaceAll(text, "%spouse", *facts.speakerSpouseName);

    return text;
}

} // namespace reactions
