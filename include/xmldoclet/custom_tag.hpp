#ifndef XMLDOCLET_CUSTOM_TAG_HPP
#define XMLDOCLET_CUSTOM_TAG_HPP

#include <cstddef>
#include <optional>
#include <string_view>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

/// @brief The definition of a user tag, as given by a `-tag` option.
/// All members are views into the parsed definition string.
struct Custom_Tag_Definition {
    /// @brief The tag name, like `"todo"`.
    std::string_view name;
    /// @brief The scope letters, like `"a"` or `"tcm"`, if any.
    std::optional<std::string_view> scope;
    /// @brief The heading under which the tag is presented, like `"To Do:"`, if any.
    std::optional<std::string_view> title;

    [[nodiscard]]
    friend bool operator==(const Custom_Tag_Definition&, const Custom_Tag_Definition&)
        = default;
};

/// @brief Parses a tag definition of the form `name[:scope[:title]]`.
///
/// The name extends to the first colon, or to the end if there is none.
/// The scope extends from there to the next colon,
/// and everything past that colon is the title, colons included.
/// For example, `"see:type:See Also"` yields the name `"see"`,
/// the scope `"type"`, and the title `"See Also"`.
[[nodiscard]]
constexpr Custom_Tag_Definition parse_custom_tag(std::string_view definition) noexcept
{
    const std::size_t name_end = definition.find(':');
    if (name_end == std::string_view::npos) {
        return { .name = definition, .scope = {}, .title = {} };
    }

    const std::string_view name = definition.substr(0, name_end);
    const std::string_view rest = definition.substr(name_end + 1);
    const std::size_t scope_end = rest.find(':');
    if (scope_end == std::string_view::npos) {
        return { .name = name, .scope = rest, .title = {} };
    }
    return {
        .name = name,
        .scope = rest.substr(0, scope_end),
        .title = rest.substr(scope_end + 1),
    };
}

} // namespace xmldoclet

#endif
