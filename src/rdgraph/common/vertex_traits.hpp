/**
 * @file vertex_traits.hpp
 * @brief Compile-time helpers for vertex and reference value types.
 */
#pragma once
#include "rdgraph/common/common.hpp"

namespace rdgraph
{

namespace detail
{

/**
 * @brief Type trait detecting `std::shared_ptr` specializations.
 */
template <typename T>
struct is_shared_ptr : std::false_type
{
};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_shared_ptr_v = is_shared_ptr<T>::value;

/**
 * @brief Type trait detecting whether `std::ostream << T` is well-formed.
 */
template <typename T, typename = void>
struct is_streamable : std::false_type
{
};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type
{
};

template <typename T>
inline constexpr bool is_streamable_v = is_streamable<T>::value;

} // namespace detail

/**
 * @brief Check whether a vertex or reference value is null.
 *
 * @details
 * Raw pointers, `std::nullptr_t` and `std::shared_ptr` can hold a null value
 * and are checked. All other types are plain values and are never null.
 */
template <typename T>
bool is_null_value([[maybe_unused]] const T& value) noexcept
{
    if constexpr (std::is_pointer_v<T> || detail::is_shared_ptr_v<T>)
    {
        return value == nullptr;
    }
    else if constexpr (std::is_null_pointer_v<T>)
    {
        return true;
    }
    else
    {
        return false;
    }
}

/**
 * @brief Render a value for diagnostics.
 * @param value The value to render.
 * @param fallback Text returned when `T` has no `operator<<`.
 * @return The streamed text of `value`, or `fallback`.
 */
template <typename T>
std::string display_string(const T& value, const std::string& fallback = "?")
{
    if constexpr (detail::is_streamable_v<T>)
    {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
    else
    {
        return fallback;
    }
}

/**
 * @brief Join rendered values with a separator.
 */
template <typename Container>
std::string join_display(const Container& values, const std::string& separator = ", ")
{
    std::string result;
    bool first = true;
    for (const auto& value : values)
    {
        if (!first)
        {
            result += separator;
        }
        result += display_string(value);
        first = false;
    }
    return result;
}

} // namespace rdgraph
