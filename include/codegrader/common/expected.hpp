#pragma once

#include <fmt/base.h>
#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace codegrader {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
    // void values are stored as std::monostate so that the variant stays well-formed
    using StoredT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{std::in_place_index<0>} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<StoredT, Args...>)
        : data_{std::in_place_index<0>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, StoredT> && !std::convertible_to<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::convertible_to<Eu, StoredT>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }

    constexpr bool has_error() const noexcept { return !has_value(); }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    template <typename U = T>
    U& value() &
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "Attempted to access the value of an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
    const U& value() const&
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "Attempted to access the value of an erroneous Expected");
        return std::get<0>(data_);
    }

    template <typename U = T>
    U&& value() &&
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "Attempted to access the value of an erroneous Expected");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
    void value() const&
        requires(std::is_void_v<U>)
    {
        ASSERT(has_value(), "Attempted to access the value of an erroneous Expected");
    }

    template <typename U = T>
    U& operator*() &
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    const U& operator*() const&
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    const E& error() const {
        ASSERT(has_error(), "Attempted to access the error of a successful Expected");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    /// Apply ``func`` to the contained value, if there is one. Errors are forwarded unchanged.
    template <typename Func>
    Expected<std::invoke_result_t<Func, const T&>, E> transform(const Func& func) const
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return error();
        }

        return func(value());
    }

    /// Map the contained error with ``func``, if there is one.
    template <typename Func>
    Expected<T, std::invoke_result_t<Func, const E&>> transform_error(const Func& func) const {
        if (has_value()) {
            if constexpr (std::is_void_v<T>) {
                return {};
            } else {
                return value();
            }
        }

        return func(error());
    }

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && std::equality_comparable<StoredT>)
    {
        return data_ == rhs.data_;
    }

    template <typename Tu>
    bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T> &&
                 !std::equality_comparable_with<Tu, E>)
    {
        return has_value() && value() == rhs;
    }

    template <typename Eu>
    bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E>)
    {
        return has_error() && error() == rhs;
    }

private:
    std::variant<StoredT, E> data_;
};

} // namespace codegrader

template <typename T, typename E>
struct fmt::formatter<::codegrader::Expected<T, E>> : fmt::formatter<std::string>
{
    auto format(const ::codegrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::codegrader::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::formattable<E>) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::is_void_v<T>) {
            return "Expected(void)";
        } else if constexpr (fmt::formattable<T>) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
