#ifndef XMLDOCLET_STRINGS_HPP
#define XMLDOCLET_STRINGS_HPP

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory_resource>
#include <string>
#include <string_view>

namespace xmldoclet {

[[nodiscard]]
constexpr bool is_ascii_upper_alpha(char c) noexcept
{
    return c >= 'A' && c <= 'Z';
}

[[nodiscard]]
constexpr bool is_ascii_lower_alpha(char c) noexcept
{
    return c >= 'a' && c <= 'z';
}

[[nodiscard]]
constexpr bool is_ascii_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]]
constexpr bool is_ascii_alphanumeric(char c) noexcept
{
    return is_ascii_upper_alpha(c) || is_ascii_lower_alpha(c) || is_ascii_digit(c);
}

[[nodiscard]]
constexpr char to_ascii_upper(char c) noexcept
{
    return is_ascii_lower_alpha(c) ? char(c - 'a' + 'A') : c;
}

[[nodiscard]]
constexpr char to_ascii_lower(char c) noexcept
{
    return is_ascii_upper_alpha(c) ? char(c - 'A' + 'a') : c;
}

/// @brief Returns `true` iff `x` and `y` are equal when ASCII letters are compared
/// without regard to case.
[[nodiscard]]
constexpr bool equals_ascii_ignore_case(std::string_view x, std::string_view y) noexcept
{
    return x.size() == y.size()
        && std::ranges::equal(x, y, [](char a, char b) { //
               return to_ascii_lower(a) == to_ascii_lower(b);
           });
}

/// @brief Returns the concatenation of `parts`.
[[nodiscard]]
inline std::pmr::string
concat(std::pmr::memory_resource* memory, std::initializer_list<std::string_view> parts)
{
    std::size_t length = 0;
    for (const std::string_view part : parts) {
        length += part.size();
    }
    std::pmr::string result { memory };
    result.reserve(length);
    for (const std::string_view part : parts) {
        result += part;
    }
    return result;
}

/// @brief Invokes `f` with every `delimiter`-separated part of `str`, in order.
/// Empty parts are passed to `f` as well,
/// so `"a::b"` yields `"a"`, `""`, and `"b"`.
template <typename F>
constexpr void for_each_split(std::string_view str, char delimiter, F f)
{
    while (true) {
        const std::size_t pos = str.find(delimiter);
        if (pos == std::string_view::npos) {
            f(str);
            return;
        }
        f(str.substr(0, pos));
        str.remove_prefix(pos + 1);
    }
}

} // namespace xmldoclet

#endif
