#ifndef XMLDOCLET_OPTION_SPEC_HPP
#define XMLDOCLET_OPTION_SPEC_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

/// @brief Describes one command-line option understood by the doclet.
struct Option_Info {
    /// @brief The option name, including the leading dash, like `"-d"`.
    std::string_view name;
    /// @brief The number of command-line tokens the option occupies,
    /// counting the option name itself.
    /// Flags have length `1`, options with one value have length `2`.
    int length;
    /// @brief A placeholder for the value, like `"<directory>"`.
    /// Empty for flags.
    std::string_view parameter;
    /// @brief A short, human-readable description.
    std::string_view description;

    [[nodiscard]]
    constexpr bool is_flag() const noexcept
    {
        return length == 1;
    }
};

/// @brief Returns every option understood by the doclet, in documentation order.
[[nodiscard]]
std::span<const Option_Info> all_options() noexcept;

/// @brief Returns the names of `all_options()`, in the same order.
[[nodiscard]]
std::span<const std::string_view> all_option_names() noexcept;

/// @brief Returns the option with the given `name`,
/// or `nullptr` if there is no such option.
/// The match is exact and case-sensitive.
[[nodiscard]]
const Option_Info* find_option(std::string_view name) noexcept;

/// @brief Returns the number of command-line tokens that the option `name` occupies,
/// including the name itself, or `0` if `name` is not an option of this doclet.
[[nodiscard]]
int option_length(std::string_view name) noexcept;

/// @brief Returns a usage line for the given option,
/// like `"-d <directory> Destination directory for output files"`.
[[nodiscard]]
std::pmr::string usage_line(const Option_Info& option, std::pmr::memory_resource* memory);

} // namespace xmldoclet

#endif
