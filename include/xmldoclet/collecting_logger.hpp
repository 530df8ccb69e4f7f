#ifndef XMLDOCLET_COLLECTING_LOGGER_HPP
#define XMLDOCLET_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "xmldoclet/util/severity.hpp"

#include "xmldoclet/diagnostic.hpp"
#include "xmldoclet/services.hpp"

namespace xmldoclet {

struct Collected_Diagnostic {
    Severity severity;
    std::pmr::string id;
    std::pmr::string message;

    [[nodiscard]]
    Collected_Diagnostic(const Diagnostic& d, std::pmr::memory_resource* const memory)
        : severity { d.severity }
        , id { d.id, memory }
        , message { d.message, memory }
    {
    }
};

/// @brief A `Logger` which keeps every diagnostic it receives, in order.
struct Collecting_Logger final : Logger {
    std::pmr::vector<Collected_Diagnostic> diagnostics;

    [[nodiscard]]
    explicit Collecting_Logger(std::pmr::memory_resource* const memory)
        : Logger { Severity::min }
        , diagnostics { memory }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        std::pmr::memory_resource* const memory = diagnostics.get_allocator().resource();
        diagnostics.emplace_back(diagnostic, memory);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        return diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(const std::string_view id) const
    {
        return std::ranges::find(diagnostics, id, &Collected_Diagnostic::id) != diagnostics.end();
    }

    [[nodiscard]]
    std::size_t count(const Severity severity) const
    {
        return std::size_t(
            std::ranges::count(diagnostics, severity, &Collected_Diagnostic::severity)
        );
    }

    [[nodiscard]]
    std::size_t count(const std::string_view id) const
    {
        return std::size_t(std::ranges::count(diagnostics, id, &Collected_Diagnostic::id));
    }
};

} // namespace xmldoclet

#endif
