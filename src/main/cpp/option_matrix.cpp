#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "xmldoclet/util/typo.hpp"

#include "xmldoclet/diagnostic.hpp"
#include "xmldoclet/option_matrix.hpp"
#include "xmldoclet/option_spec.hpp"
#include "xmldoclet/services.hpp"
#include "xmldoclet/settings.hpp"

namespace xmldoclet {
namespace {

/// @brief Returns the first entry named `name`, or `nullptr`.
/// The first element of an entry is always the name of the option.
[[nodiscard]]
const Option_Entry* find_entry(std::span<const Option_Entry> options, std::string_view name)
{
    const auto it = std::ranges::find_if(options, [&](const Option_Entry& entry) {
        return !entry.empty() && entry.front() == name;
    });
    return it == options.end() ? nullptr : &*it;
}

void report_unknown_option(Logger& logger, std::string_view name, std::pmr::memory_resource* memory)
{
    if (!logger.can_log(Severity::error)) {
        return;
    }
    std::pmr::string message { "invalid flag: ", memory };
    message += name;
    const Distant<std::string_view> suggestion
        = suggest_correction(all_option_names(), name, max_typo_distance, memory);
    if (suggestion) {
        message += "; did you mean ";
        message += suggestion.value;
        message += '?';
    }
    logger.try_error(diagnostic::option_unknown, message);
}

} // namespace

bool has_option(std::span<const Option_Entry> options, std::string_view name)
{
    return find_entry(options, name) != nullptr;
}

std::optional<std::string_view>
get_option_value(std::span<const Option_Entry> options, std::string_view name)
{
    const Option_Entry* const entry = find_entry(options, name);
    if (entry == nullptr || entry->size() < 2) {
        return {};
    }
    return (*entry)[1];
}

std::pmr::vector<std::string_view> get_option_values(
    std::span<const Option_Entry> options,
    std::string_view name,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::string_view> result { memory };
    for (const Option_Entry& entry : options) {
        if (entry.size() > 1 && entry.front() == name) {
            result.push_back(entry[1]);
        }
    }
    return result;
}

std::optional<Option_Matrix> split_options(
    std::span<const std::string> args,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    Option_Matrix result;
    bool success = true;

    std::size_t i = 0;
    while (i < args.size()) {
        const std::string& name = args[i];
        const auto length = std::size_t(option_length(name));
        if (length == 0) {
            report_unknown_option(logger, name, memory);
            success = false;
            ++i;
            continue;
        }
        if (length > args.size() - i) {
            if (logger.can_log(Severity::error)) {
                std::pmr::string message { "option ", memory };
                message += name;
                message += " requires an argument; usage: ";
                message += usage_line(*find_option(name), memory);
                logger.try_error(diagnostic::option_value_missing, message);
            }
            return {};
        }
        const auto first = args.begin() + std::ptrdiff_t(i);
        result.emplace_back(first, first + std::ptrdiff_t(length));
        i += length;
    }

    if (!success) {
        return {};
    }
    return result;
}

} // namespace xmldoclet
