#ifndef XMLDOCLET_SERVICES_HPP
#define XMLDOCLET_SERVICES_HPP

#include <string_view>

#include "xmldoclet/util/assert.hpp"
#include "xmldoclet/util/severity.hpp"

#include "xmldoclet/diagnostic.hpp"
#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

/// @brief The diagnostic sink through which configuration problems and confirmations
/// are reported.
struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        XMLDOCLET_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;

    void try_emit(Severity severity, std::string_view id, std::string_view message)
    {
        XMLDOCLET_ASSERT(severity_is_emittable(severity));
        if (can_log(severity)) {
            (*this)(Diagnostic { severity, id, message });
        }
    }

    void try_info(std::string_view id, std::string_view message)
    {
        try_emit(Severity::info, id, message);
    }

    void try_warning(std::string_view id, std::string_view message)
    {
        try_emit(Severity::warning, id, message);
    }

    void try_error(std::string_view id, std::string_view message)
    {
        try_emit(Severity::error, id, message);
    }

    void try_fatal(std::string_view id, std::string_view message)
    {
        try_emit(Severity::fatal, id, message);
    }
};

} // namespace xmldoclet

#endif
