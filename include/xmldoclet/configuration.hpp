#ifndef XMLDOCLET_CONFIGURATION_HPP
#define XMLDOCLET_CONFIGURATION_HPP

#include <filesystem>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "xmldoclet/charset.hpp"
#include "xmldoclet/class_filter.hpp"
#include "xmldoclet/fwd.hpp"
#include "xmldoclet/taglet_registry.hpp"

namespace xmldoclet {

/// @brief The validated options of the doclet.
/// A configuration is only created by `build_configuration`,
/// and does not change afterwards.
struct Configuration {
private:
    bool m_multiple_files = false;
    bool m_sub_folders = false;
    std::filesystem::path m_output_directory;
    Charset m_encoding;
    std::pmr::string m_filename;
    Class_Filter m_filter;
    Taglet_Registry m_taglets;

    [[nodiscard]]
    explicit Configuration(std::pmr::memory_resource* memory);

    friend std::optional<Configuration> build_configuration(
        std::span<const Option_Entry> options,
        Logger& logger,
        const Taglet_Provider_Table& providers,
        std::pmr::memory_resource* memory
    );

public:
    /// @brief Returns `true` if one output file is written per class,
    /// `false` if a single output file is written.
    [[nodiscard]]
    bool use_multiple_files() const noexcept
    {
        return m_multiple_files;
    }

    /// @brief Returns `true` if multiple output files are organized in package subfolders.
    /// This is only meaningful if `use_multiple_files()` is `true`.
    [[nodiscard]]
    bool use_sub_folders() const noexcept
    {
        return m_sub_folders;
    }

    [[nodiscard]]
    const std::filesystem::path& get_output_directory() const noexcept
    {
        return m_output_directory;
    }

    [[nodiscard]]
    const Charset& get_encoding() const noexcept
    {
        return m_encoding;
    }

    /// @brief Returns the name of the output file in single-file mode.
    /// This is `default_filename` unless `-filename` was given.
    [[nodiscard]]
    std::string_view get_filename() const noexcept
    {
        return m_filename;
    }

    [[nodiscard]]
    const Class_Filter& get_filter() const noexcept
    {
        return m_filter;
    }

    [[nodiscard]]
    bool has_filter() const noexcept
    {
        return m_filter.has_filter();
    }

    [[nodiscard]]
    bool should_include(const Class_Descriptor& c) const
    {
        return m_filter.should_include(c);
    }

    [[nodiscard]]
    const Taglet_Registry& get_taglets() const noexcept
    {
        return m_taglets;
    }

    /// @brief Returns the taglet for the given tag name, or `nullptr`.
    /// Names of inline tags are prefixed with `inline_tag_prefix`.
    [[nodiscard]]
    const Taglet* find_taglet(std::string_view name) const
    {
        return m_taglets.find(name);
    }
};

/// @brief Validates the option matrix and builds a configuration from it.
///
/// Every applied option is confirmed with an info diagnostic,
/// and every ignored option or failed taglet provider is reported
/// as a warning or error, without failing the build.
/// Only a missing or malformed `-d` option, or a malformed or unsupported `-docencoding`
/// option fail the build.
/// In that case, exactly one fatal diagnostic is emitted and `std::nullopt` is returned.
/// @param options The option matrix, as grouped by `split_options` or by the host tool.
/// @param logger Receives all diagnostics.
/// @param providers The taglet providers which `-taglet` can select from.
/// @param memory The memory used by the configuration.
[[nodiscard]]
std::optional<Configuration> build_configuration(
    std::span<const Option_Entry> options,
    Logger& logger,
    const Taglet_Provider_Table& providers,
    std::pmr::memory_resource* memory
);

} // namespace xmldoclet

#endif
