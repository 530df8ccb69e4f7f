#ifndef XMLDOCLET_OPTION_MATRIX_HPP
#define XMLDOCLET_OPTION_MATRIX_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

// The accessors below differ in how they treat repeated options.
// `get_option_value` is for options where the first occurrence wins,
// `get_option_values` is for repeatable options like `-tag`.
// All returned views refer to strings within `options`.

/// @brief Returns `true` iff any entry in `options` is named `name`.
[[nodiscard]]
bool has_option(std::span<const Option_Entry> options, std::string_view name);

/// @brief Returns the first value of the first entry named `name`.
/// Returns `std::nullopt` if there is no such entry,
/// or if that entry has no value.
/// Later entries with the same name are ignored.
[[nodiscard]]
std::optional<std::string_view>
get_option_value(std::span<const Option_Entry> options, std::string_view name);

/// @brief Returns the first value of every entry named `name`, in order.
/// Entries without a value are skipped.
[[nodiscard]]
std::pmr::vector<std::string_view> get_option_values(
    std::span<const Option_Entry> options,
    std::string_view name,
    std::pmr::memory_resource* memory
);

/// @brief Groups a flat list of command-line tokens into an option matrix,
/// where each entry occupies as many tokens as `option_length` declares.
///
/// Unknown options and options cut short by the end of `args` are reported to `logger`
/// as errors, in which case `std::nullopt` is returned.
/// All unknown options are reported, not only the first.
/// The returned matrix owns its strings, like an option matrix supplied by a host tool;
/// `memory` is only used as scratch space for diagnostic messages.
[[nodiscard]]
std::optional<Option_Matrix> split_options(
    std::span<const std::string> args,
    Logger& logger,
    std::pmr::memory_resource* memory
);

} // namespace xmldoclet

#endif
