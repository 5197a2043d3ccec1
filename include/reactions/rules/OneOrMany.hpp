#pragma once
// include/reactions/rules/OneOrMany.hpp
//
// Rule files accept either a single value or a list of alternatives for the
// same field ("Emote": "happy" vs "Emote": ["happy", "heart"]). OneOrMany keeps
// that shape explicit; ResolveChoice is the only place that interprets it.

#include "reactions/core/Rng.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace reactions {

template <class T>
class OneOrMany {
public:
    OneOrMany() = default;
    OneOrMany(T single) : m_value(std::move(single)) {}
    OneOrMany(std::vector<T> many) : m_value(std::move(many)) {}

    [[nodiscard]] bool empty() const noexcept
    {
        if (std::holds_alternative<std::monostate>(m_value))
            return true;
        if (const auto* list = std::get_if<std::vector<T>>(&m_value))
            return list->empty();
        return false;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        if (std::holds_alternative<T>(m_value))
            return 1;
        if (const auto* list = std::get_if<std::vector<T>>(&m_value))
            return list->size();
        return 0;
    }

    [[nodiscard]] bool isSingle() const noexcept { return std::holds_alternative<T>(m_value); }
    [[nodiscard]] bool isList() const noexcept { return std::holds_alternative<std::vector<T>>(m_value); }

    [[nodiscard]] const T* single() const noexcept { return std::get_if<T>(&m_value); }
    [[nodiscard]] const std::vector<T>* list() const noexcept { return std::get_if<std::vector<T>>(&m_value); }

    // Element access in authored order, valid for i < size().
    [[nodiscard]] const T& at(std::size_t i) const
    {
        if (const auto* s = single())
            return *s;
        return std::get<std::vector<T>>(m_value).at(i);
    }

    [[nodiscard]] bool contains(const T& v) const
    {
        if (const auto* s = single())
            return *s == v;
        if (const auto* l = list())
        {
            for (const auto& e : *l)
                if (e == v)
                    return true;
        }
        return false;
    }

private:
    std::variant<std::monostate, T, std::vector<T>> m_value;
};

// Empty -> nullopt, one -> that value, many -> uniformly random alternative.
template <class T>
[[nodiscard]] std::optional<T> ResolveChoice(const OneOrMany<T>& choice, rng::Pcg32& rng)
{
    const std::size_t n = choice.size();
    if (n == 0)
        return std::nullopt;
    if (n == 1)
        return choice.at(0);
    return choice.at(rng.next_bounded(static_cast<std::uint32_t>(n)));
}

// JSON: null -> empty, string -> single, array of strings -> list.
// Any other shape is a type error (the caller decides how to fail closed).
inline void from_json(const nlohmann::json& j, OneOrMany<std::string>& v)
{
    if (j.is_null())
    {
        v = OneOrMany<std::string>{};
    }
    else if (j.is_string())
    {
        v = OneOrMany<std::string>{j.get<std::string>()};
    }
    else if (j.is_array())
    {
        std::vector<std::string> values;
        values.reserve(j.size());
        for (const auto& item : j)
        {
            if (!item.is_string())
                throw nlohmann::json::type_error::create(302, "expected an array of strings", &j);
            values.push_back(item.get<std::string>());
        }
        v = OneOrMany<std::string>{std::move(values)};
    }
    else
    {
        throw nlohmann::json::type_error::create(302, "expected a string or an array of strings", &j);
    }
}

inline void to_json(nlohmann::json& j, const OneOrMany<std::string>& v)
{
    if (const auto* s = v.single())
        j = *s;
    else if (const auto* l = v.list())
        j = *l;
    else
        j = nullptr;
}

} // namespace reactions
