#include <cstdlib>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "xmldoclet/util/ansi.hpp"
#include "xmldoclet/util/severity.hpp"

#include "xmldoclet/configuration.hpp"
#include "xmldoclet/diagnostic.hpp"
#include "xmldoclet/fwd.hpp"
#include "xmldoclet/option_matrix.hpp"
#include "xmldoclet/option_spec.hpp"
#include "xmldoclet/services.hpp"
#include "xmldoclet/taglet.hpp"
#include "xmldoclet/taglet_provider.hpp"
#include "xmldoclet/taglet_registry.hpp"

namespace xmldoclet {
namespace {

[[nodiscard]]
std::string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace ? ansi::black
        : severity <= Severity::debug  ? ansi::h_black
        : severity <= Severity::info   ? ansi::blue
        : severity <= Severity::warning ? ansi::h_yellow
        : severity <= Severity::error  ? ansi::h_red
        : severity <= Severity::fatal  ? ansi::red
                                       : ansi::magenta;
}

struct Stderr_Logger final : Logger {
    bool any_errors = false;

    using Logger::Logger;

    void operator()(const Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        std::cerr << severity_highlight(diagnostic.severity) << severity_tag(diagnostic.severity)
                  << ansi::reset << ": " << diagnostic.message << ansi::h_black << " ["
                  << diagnostic.id << ']' << ansi::reset << '\n';
    }
};

void print_option_help(std::ostream& out)
{
    std::pmr::monotonic_buffer_resource memory;
    out << "\n  Doclet options (after --):\n";
    for (const Option_Info& option : all_options()) {
        out << "    " << usage_line(option, &memory) << '\n';
    }
}

void print_configuration(std::ostream& out, const Configuration& config)
{
    out << "directory:  " << config.get_output_directory().string() << '\n';
    out << "encoding:   " << config.get_encoding().name << '\n';
    if (config.use_multiple_files()) {
        out << "output:     multiple files" << (config.use_sub_folders() ? ", in subfolders" : "")
            << '\n';
    }
    else {
        out << "output:     single file " << config.get_filename() << '\n';
    }

    const Class_Filter& filter = config.get_filter();
    if (filter.extends_target) {
        out << "extends:    " << *filter.extends_target << '\n';
    }
    if (filter.implements_target) {
        out << "implements: " << *filter.implements_target << '\n';
    }
    if (filter.annotation_target) {
        out << "annotated:  " << *filter.annotation_target << '\n';
    }
}

void print_taglets(std::ostream& out, const Taglet_Registry& taglets)
{
    std::pmr::monotonic_buffer_resource memory;
    for (const std::string_view key : taglets.sorted_keys(&memory)) {
        const Taglet* const taglet = taglets.find(key);
        out << key << (taglet->is_inline() ? " (inline)" : " (block)") << '\n';
    }
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },         { "trace", Severity::trace },
        { "debug", Severity::debug },     { "info", Severity::info },
        { "warning", Severity::warning }, { "error", Severity::error },
        { "fatal", Severity::fatal },     { "none", Severity::none },
    };

    args::ArgumentParser parser {
        "Validates XML doclet options and prints the resulting configuration.",
    };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::Flag list_taglets_arg {
        parser,
        "list-taglets",
        "Print all taglets of the resulting configuration",
        { "list-taglets" },
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };
    args::PositionalList<std::string> options_arg {
        parser,
        "options",
        "Doclet options, like -d <directory>",
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        print_option_help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        print_option_help(std::cout);
        return EXIT_SUCCESS;
    }

    std::pmr::unsynchronized_pool_resource memory;
    Stderr_Logger logger { severity_arg.Get() };

    const std::vector<std::string>& option_tokens = options_arg.Get();
    const std::optional<Option_Matrix> options = split_options(option_tokens, logger, &memory);
    if (!options) {
        return EXIT_FAILURE;
    }

    const Taglet_Provider_Table providers { standard_taglet_providers(), &memory };
    const std::optional<Configuration> config
        = build_configuration(*options, logger, providers, &memory);
    if (!config) {
        return EXIT_FAILURE;
    }

    print_configuration(std::cout, *config);
    if (list_taglets_arg.Matched()) {
        print_taglets(std::cout, config->get_taglets());
    }

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace xmldoclet

int main(int argc, const char* const* argv)
{
    return xmldoclet::main(argc, argv);
}
