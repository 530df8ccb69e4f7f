#ifndef XMLDOCLET_SETTINGS_HPP
#define XMLDOCLET_SETTINGS_HPP

#include <cstddef>
#include <string_view>

namespace xmldoclet {

/// @brief The file name used for single-file output when `-filename` is not given.
inline constexpr std::string_view default_filename = "xmldoclet.xml";

/// @brief The maximum Levenshtein distance at which an unknown name
/// is still considered a typo of a known one.
inline constexpr std::size_t max_typo_distance = 2;

} // namespace xmldoclet

#endif
