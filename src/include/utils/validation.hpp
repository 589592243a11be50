/**
 * @file validation.hpp
 * @brief Validation<T>: a value, or every reason it could not be produced.
 *
 * Unlike a short-circuiting result type, failures here are meant to be
 * collected. `accumulate()` evaluates all of its inputs and concatenates their
 * error lists, so a completion step reports every missing field in one pass.
 *
 * @code
 * auto both = accumulate(require("std_in", cfg.std_in), require("std_out", cfg.std_out));
 * if (both.is_error())
 *     return Validation<Complete>::failure(both.errors());
 * auto [in, out] = std::move(both).content();
 * @endcode
 */

#pragma once

#include <fmt/format.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pgtemp::utils
{

/// Human-readable error messages, in the order they were found.
using ErrorList = std::vector<std::string>;

template <typename T>
class Validation
{
  public:
    using value_type = T;

    [[nodiscard]] static Validation ok(T value)
    {
        return Validation(Storage(std::in_place_index<0>, std::move(value)));
    }

    /**
     * @brief Create a failed Validation.
     * @param errors Must be non-empty; an empty list would be indistinguishable
     *               from "nothing to report".
     * @throws std::logic_error if @p errors is empty.
     */
    [[nodiscard]] static Validation failure(ErrorList errors)
    {
        if (errors.empty())
        {
            throw std::logic_error("Validation::failure() requires at least one error");
        }
        return Validation(Storage(std::in_place_index<1>, Failure{std::move(errors)}));
    }

    [[nodiscard]] static Validation failure(std::string error)
    {
        return failure(ErrorList{std::move(error)});
    }

    Validation(Validation &&) noexcept = default;
    Validation &operator=(Validation &&) noexcept = default;
    Validation(const Validation &) = default;
    Validation &operator=(const Validation &) = default;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /// @throws std::logic_error if in the error state.
    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Validation::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /// @throws std::logic_error if in the error state.
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Validation::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    /// @throws std::logic_error if in the success state.
    [[nodiscard]] const ErrorList &errors() const
    {
        if (is_ok())
        {
            throw std::logic_error("Validation::errors() called on success state");
        }
        return std::get<Failure>(m_data).errors;
    }

    /**
     * @brief Prefix every error with @p context, e.g. "postgres_plan: ".
     *        A success passes through untouched.
     */
    [[nodiscard]] Validation with_context(std::string_view context) &&
    {
        if (is_error())
        {
            for (auto &e : std::get<Failure>(m_data).errors)
            {
                e.insert(0, context);
            }
        }
        return std::move(*this);
    }

  private:
    struct Failure
    {
        ErrorList errors;
    };

    using Storage = std::variant<T, Failure>;

    explicit Validation(Storage data) : m_data(std::move(data)) {}

    Storage m_data;
};

/**
 * @brief Succeeds with the contained value iff @p value is set.
 * @return On failure, the single error "Missing <name> option".
 */
template <typename T>
[[nodiscard]] Validation<T> require(std::string_view name, const std::optional<T> &value)
{
    if (value.has_value())
    {
        return Validation<T>::ok(*value);
    }
    return Validation<T>::failure(fmt::format("Missing {} option", name));
}

/**
 * @brief Completes an optional sub-value: absent stays absent, present must
 *        validate. Errors from @p complete are returned unchanged.
 */
template <typename In, typename Fn>
[[nodiscard]] auto complete_optional(const std::optional<In> &value, Fn &&complete)
    -> Validation<std::optional<typename std::invoke_result_t<Fn, const In &>::value_type>>
{
    using Out = typename std::invoke_result_t<Fn, const In &>::value_type;
    if (!value.has_value())
    {
        return Validation<std::optional<Out>>::ok(std::nullopt);
    }
    auto inner = std::forward<Fn>(complete)(*value);
    if (inner.is_error())
    {
        return Validation<std::optional<Out>>::failure(inner.errors());
    }
    return Validation<std::optional<Out>>::ok(std::optional<Out>(std::move(inner).content()));
}

/**
 * @brief Combines independent validations. Every argument is inspected; the
 *        result fails with the concatenation of all their errors, in argument
 *        order, if any one fails.
 */
template <typename... Ts>
[[nodiscard]] Validation<std::tuple<Ts...>> accumulate(Validation<Ts>... parts)
{
    ErrorList errors;
    (
        [&errors](const auto &part) {
            if (part.is_error())
            {
                const auto &e = part.errors();
                errors.insert(errors.end(), e.begin(), e.end());
            }
        }(parts),
        ...);
    if (!errors.empty())
    {
        return Validation<std::tuple<Ts...>>::failure(std::move(errors));
    }
    return Validation<std::tuple<Ts...>>::ok(std::tuple<Ts...>(std::move(parts).content()...));
}

} // namespace pgtemp::utils
