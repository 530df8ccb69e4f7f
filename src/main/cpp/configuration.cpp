#include <exception>
#include <filesystem>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "xmldoclet/util/assert.hpp"
#include "xmldoclet/util/strings.hpp"
#include "xmldoclet/util/typo.hpp"

#include "xmldoclet/charset.hpp"
#include "xmldoclet/class_filter.hpp"
#include "xmldoclet/configuration.hpp"
#include "xmldoclet/custom_tag.hpp"
#include "xmldoclet/diagnostic.hpp"
#include "xmldoclet/option_matrix.hpp"
#include "xmldoclet/option_spec.hpp"
#include "xmldoclet/services.hpp"
#include "xmldoclet/settings.hpp"
#include "xmldoclet/taglet.hpp"
#include "xmldoclet/taglet_provider.hpp"
#include "xmldoclet/taglet_registry.hpp"

namespace xmldoclet {
namespace {

/// @brief Describes one of the `-extends`, `-annotated`, and `-implements` options,
/// which all follow the same pattern.
struct Filter_Option {
    std::string_view name;
    std::optional<std::pmr::string> Class_Filter::* target;
    std::string_view applied_id;
    std::string_view applied_message;
    std::string_view ignored_id;
    std::string_view ignored_message;
};

constexpr Filter_Option filter_options[] {
    { "-extends", &Class_Filter::extends_target, diagnostic::extends,
      "Filtering classes extending: ", diagnostic::extends_ignored,
      "'-extends' option ignored - superclass not specified" },
    { "-annotated", &Class_Filter::annotation_target, diagnostic::annotated,
      "Filtering classes annotated: ", diagnostic::annotated_ignored,
      "'-annotated' option ignored - annotation not specified" },
    { "-implements", &Class_Filter::implements_target, diagnostic::implements,
      "Filtering classes implementing: ", diagnostic::implements_ignored,
      "'-implements' option ignored - interface not specified" },
};

void report_missing_value(
    Logger& logger,
    std::string_view id,
    std::string_view option_name,
    std::pmr::memory_resource* memory
)
{
    const Option_Info* const option = find_option(option_name);
    XMLDOCLET_ASSERT(option);
    const std::pmr::string usage = usage_line(*option, memory);
    logger.try_fatal(
        id, concat(memory, { "Missing value for ", option->parameter, ", usage: ", usage })
    );
}

void apply_filter_option(
    Class_Filter& filter,
    const Filter_Option& option,
    std::span<const Option_Entry> options,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    if (!has_option(options, option.name)) {
        return;
    }
    const std::optional<std::string_view> value = get_option_value(options, option.name);
    if (!value) {
        logger.try_warning(option.ignored_id, option.ignored_message);
        return;
    }
    (filter.*option.target).emplace(*value, memory);
    logger.try_info(option.applied_id, concat(memory, { option.applied_message, *value }));
}

void register_custom_tags(
    Taglet_Registry& registry,
    std::span<const Option_Entry> options,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    for (const std::string_view definition : get_option_values(options, "-tag", memory)) {
        const Custom_Tag_Definition parsed = parse_custom_tag(definition);
        // Only the name is carried over into the registry.
        // The scope and title of the definition are not retained.
        registry.insert(parsed.name, std::make_unique<const Custom_Tag>(parsed.name, true));
        logger.try_info(diagnostic::tag, concat(memory, { "Using Tag ", parsed.name }));
    }
}

void report_taglet_error(Logger& logger, std::string_view reason, std::pmr::memory_resource* memory)
{
    logger.try_error(
        diagnostic::taglet_error, concat(memory, { "'-taglet' option reported error - : ", reason })
    );
}

void register_taglet_provider(
    Taglet_Registry& registry,
    std::string_view name,
    const Taglet_Provider_Table& providers,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    const Taglet_Provider* const provider = providers.find(name);
    if (provider == nullptr) {
        std::pmr::string reason = concat(memory, { "unknown taglet provider: ", name });
        const Distant<std::string_view> suggestion = providers.fuzzy_lookup_name(name, memory);
        if (suggestion && suggestion.distance <= max_typo_distance) {
            reason += "; did you mean ";
            reason += suggestion.value;
            reason += '?';
        }
        report_taglet_error(logger, reason, memory);
        return;
    }

    try {
        provider->register_taglets(registry);
    } catch (const std::exception& e) {
        report_taglet_error(logger, e.what(), memory);
        return;
    }
    logger.try_info(diagnostic::taglet, concat(memory, { "Using Taglet ", provider->get_name() }));
}

void register_taglet_providers(
    Taglet_Registry& registry,
    std::span<const Option_Entry> options,
    const Taglet_Provider_Table& providers,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    if (!has_option(options, "-taglet")) {
        return;
    }
    const std::optional<std::string_view> names = get_option_value(options, "-taglet");
    if (!names) {
        logger.try_warning(
            diagnostic::taglet_ignored, "'-taglet' option ignored - classes not specified"
        );
        return;
    }
    // A failing provider does not prevent the remaining providers from registering.
    for_each_split(*names, ':', [&](std::string_view name) {
        register_taglet_provider(registry, name, providers, logger, memory);
    });
}

} // namespace

Configuration::Configuration(std::pmr::memory_resource* memory)
    : m_encoding { utf8_charset() }
    , m_filename { default_filename, memory }
    , m_taglets { builtin_taglets(), memory }
{
}

std::optional<Configuration> build_configuration(
    std::span<const Option_Entry> options,
    Logger& logger,
    const Taglet_Provider_Table& providers,
    std::pmr::memory_resource* memory
)
{
    Configuration result { memory };

    // Flags
    result.m_multiple_files = has_option(options, "-multiple");
    result.m_sub_folders = has_option(options, "-subfolders");

    // Output directory
    if (!has_option(options, "-d")) {
        logger.try_fatal(
            diagnostic::directory_missing, "Output directory not specified; use -d <directory>"
        );
        return {};
    }
    const std::optional<std::string_view> directory = get_option_value(options, "-d");
    if (!directory || directory->empty()) {
        report_missing_value(logger, diagnostic::directory_value_missing, "-d", memory);
        return {};
    }
    result.m_output_directory = std::filesystem::path { *directory };
    logger.try_info(diagnostic::directory, concat(memory, { "Output directory: ", *directory }));

    // Output encoding
    if (has_option(options, "-docencoding")) {
        const std::optional<std::string_view> name = get_option_value(options, "-docencoding");
        if (!name) {
            report_missing_value(
                logger, diagnostic::encoding_value_missing, "-docencoding", memory
            );
            return {};
        }
        std::optional<Charset> charset = resolve_charset(*name);
        if (!charset) {
            logger.try_fatal(
                diagnostic::encoding_unsupported,
                concat(memory, { "Unsupported output encoding: ", *name })
            );
            return {};
        }
        result.m_encoding = std::move(*charset);
        logger.try_info(
            diagnostic::encoding, concat(memory, { "Output encoding: ", result.m_encoding.name })
        );
    }

    // Single output file name
    if (has_option(options, "-filename")) {
        const std::optional<std::string_view> name = get_option_value(options, "-filename");
        if (!name) {
            logger.try_warning(
                diagnostic::filename_ignored, "'-filename' option ignored - name not specified"
            );
        }
        else if (result.m_multiple_files) {
            logger.try_warning(
                diagnostic::filename_ignored,
                "'-filename' option ignored - not applicable with '-multiple'"
            );
        }
        else {
            result.m_filename = *name;
            logger.try_info(diagnostic::filename, concat(memory, { "Using file name: ", *name }));
        }
    }

    // Filters
    for (const Filter_Option& option : filter_options) {
        apply_filter_option(result.m_filter, option, options, logger, memory);
    }

    // Custom tags and taglets
    register_custom_tags(result.m_taglets, options, logger, memory);
    register_taglet_providers(result.m_taglets, options, providers, logger, memory);

    return result;
}

} // namespace xmldoclet
