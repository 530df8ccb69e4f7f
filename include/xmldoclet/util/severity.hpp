#ifndef XMLDOCLET_SEVERITY_HPP
#define XMLDOCLET_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

enum struct Severity : Default_Underlying {
    min,
    trace = min,
    debug,
    /// @brief Informational confirmation of an applied option ("notice").
    info,
    /// @brief An option was ignored or misapplied; processing continues.
    warning,
    /// @brief A single item failed (e.g. one taglet provider); processing continues.
    error,
    /// @brief The configuration cannot be built.
    fatal,
    max = fatal,
    none,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

[[nodiscard]]
constexpr std::string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case trace: return "TRACE";
    case debug: return "DEBUG";
    case info: return "NOTICE";
    case warning: return "WARNING";
    case error: return "ERROR";
    case fatal: return "FATAL";
    case none: break;
    }
    return "???";
}

} // namespace xmldoclet

#endif
