#ifndef XMLDOCLET_CHARSET_HPP
#define XMLDOCLET_CHARSET_HPP

#include <optional>
#include <string>
#include <string_view>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

/// @brief A character encoding for output files, identified by its canonical name.
struct Charset {
    std::string name;

    [[nodiscard]]
    friend bool operator==(const Charset&, const Charset&)
        = default;
};

/// @brief The default encoding of output files.
[[nodiscard]]
Charset utf8_charset();

/// @brief Resolves a user-supplied encoding name like `"utf8"` or `"Latin1"`
/// to a charset with a canonical name like `"UTF-8"` or `"ISO-8859-1"`.
///
/// Names which are not syntactically valid charset names are rejected outright.
/// This includes converter modifiers like `"UTF-8//IGNORE"`.
/// Names are matched without regard to ASCII case against the standard charsets and their
/// common aliases.
/// Other names are accepted if the platform's converters support them,
/// in which case the upper-cased name is used as the canonical name.
/// @returns The charset, or `std::nullopt` if `name` is not supported.
[[nodiscard]]
std::optional<Charset> resolve_charset(std::string_view name);

} // namespace xmldoclet

#endif
