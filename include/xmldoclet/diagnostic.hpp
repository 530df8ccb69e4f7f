#ifndef XMLDOCLET_DIAGNOSTIC_HPP
#define XMLDOCLET_DIAGNOSTIC_HPP

#include <string_view>

#include "xmldoclet/util/severity.hpp"

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::string_view id;
    /// @brief The diagnostic message.
    std::string_view message;
};

namespace diagnostic {

// OPTION GROUPING =================================================================================

/// @brief While grouping the command line into options,
/// a token was found that is not a known option.
inline constexpr std::string_view option_unknown = "option.unknown";

/// @brief While grouping the command line into options,
/// the command line ended before all values of an option were provided.
inline constexpr std::string_view option_value_missing = "option.value.missing";

// CONFIGURATION ===================================================================================

/// @brief The `-d` option was not provided.
inline constexpr std::string_view directory_missing = "d.missing";
/// @brief The `-d` option was provided without a value.
inline constexpr std::string_view directory_value_missing = "d.value.missing";
/// @brief The output directory was set.
inline constexpr std::string_view directory = "d";

/// @brief The `-docencoding` option was provided without a value.
inline constexpr std::string_view encoding_value_missing = "docencoding.value.missing";
/// @brief The `-docencoding` value does not name a supported charset.
inline constexpr std::string_view encoding_unsupported = "docencoding.unsupported";
/// @brief The output encoding was set.
inline constexpr std::string_view encoding = "docencoding";

/// @brief The `-filename` option was provided without a value,
/// or together with `-multiple`, which has no single output file.
inline constexpr std::string_view filename_ignored = "filename.ignored";
/// @brief The single output file name was set.
inline constexpr std::string_view filename = "filename";

/// @brief The `-extends` option was provided without a value.
inline constexpr std::string_view extends_ignored = "extends.ignored";
/// @brief The superclass filter was set.
inline constexpr std::string_view extends = "extends";

/// @brief The `-annotated` option was provided without a value.
inline constexpr std::string_view annotated_ignored = "annotated.ignored";
/// @brief The annotation filter was set.
inline constexpr std::string_view annotated = "annotated";

/// @brief The `-implements` option was provided without a value.
inline constexpr std::string_view implements_ignored = "implements.ignored";
/// @brief The interface filter was set.
inline constexpr std::string_view implements = "implements";

/// @brief A custom tag was registered.
inline constexpr std::string_view tag = "tag";

/// @brief The `-taglet` option was provided without a value.
inline constexpr std::string_view taglet_ignored = "taglet.ignored";
/// @brief A taglet provider could not be resolved,
/// or it failed while registering its taglets.
inline constexpr std::string_view taglet_error = "taglet.error";
/// @brief A taglet provider registered its taglets.
inline constexpr std::string_view taglet = "taglet";

} // namespace diagnostic

} // namespace xmldoclet

#endif
