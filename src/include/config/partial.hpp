#pragma once
/**
 * @file partial.hpp
 * @brief Override-merge combinators for partial configuration fields.
 *
 * Every partial configuration type in pgtemp is a monoid: it has an empty
 * value (its default-constructed state) and an associative `combine(a, b)` in
 * which `b` is the override layer. The aggregate types write their `combine`
 * out field by field using the helpers below.
 *
 *  - `combine_last`   single-valued optional field: rightmost set value wins.
 *  - `combine_map`    key-wise union; on a key collision the right entry wins.
 *  - `combine_append` ordered list: left entries, then right entries.
 *  - `combine_nested` optional sub-record: if both are set, their fields are
 *                     combined recursively; otherwise whichever one is set.
 */

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace pgtemp::config
{

template <typename T>
[[nodiscard]] std::optional<T> combine_last(const std::optional<T> &a, const std::optional<T> &b)
{
    return b.has_value() ? b : a;
}

template <typename K, typename V>
[[nodiscard]] std::map<K, V> combine_map(const std::map<K, V> &a, const std::map<K, V> &b)
{
    std::map<K, V> out = b;
    out.insert(a.begin(), a.end()); // insert() keeps existing keys, so b wins.
    return out;
}

template <typename T>
[[nodiscard]] std::vector<T> combine_append(const std::vector<T> &a, const std::vector<T> &b)
{
    std::vector<T> out;
    out.reserve(a.size() + b.size());
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

/// Requires an ADL-visible `combine(const T&, const T&)`.
template <typename T>
[[nodiscard]] std::optional<T> combine_nested(const std::optional<T> &a, const std::optional<T> &b)
{
    if (a.has_value() && b.has_value())
    {
        return combine(*a, *b);
    }
    return b.has_value() ? b : a;
}

/// Folds any number of layers left to right: `combine_layers(a, b, c) == combine(combine(a, b), c)`.
template <typename T, typename... Rest>
[[nodiscard]] T combine_layers(const T &first, const Rest &...rest)
{
    T out = first;
    ((out = combine(out, rest)), ...);
    return out;
}

} // namespace pgtemp::config
