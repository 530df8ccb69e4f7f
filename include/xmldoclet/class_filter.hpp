#ifndef XMLDOCLET_CLASS_FILTER_HPP
#define XMLDOCLET_CLASS_FILTER_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

/// @brief Returns `true` iff the direct superclass of `c` is named `superclass`.
/// Indirect ancestors are not considered.
[[nodiscard]]
bool extends_class(const Class_Descriptor& c, std::string_view superclass);

/// @brief Returns `true` iff any interface directly implemented by `c` is named `interface_name`.
[[nodiscard]]
bool implements_interface(const Class_Descriptor& c, std::string_view interface_name);

/// @brief Returns `true` iff any annotation of `c` has the type `annotation`.
[[nodiscard]]
bool is_annotated(const Class_Descriptor& c, std::string_view annotation);

/// @brief Decides which classes are documented, based on up to three criteria:
/// the direct superclass, a directly implemented interface, and an annotation.
/// Each criterion is an exact match on fully qualified names.
/// A class is included iff it satisfies every criterion which is set.
struct Class_Filter {
    std::optional<std::pmr::string> extends_target;
    std::optional<std::pmr::string> implements_target;
    std::optional<std::pmr::string> annotation_target;

    /// @brief Returns `true` iff at least one criterion is set.
    /// If not, every class is included.
    [[nodiscard]]
    bool has_filter() const noexcept
    {
        return extends_target || implements_target || annotation_target;
    }

    [[nodiscard]]
    bool should_include(const Class_Descriptor& c) const;

    [[nodiscard]]
    bool operator()(const Class_Descriptor& c) const
    {
        return should_include(c);
    }
};

/// @brief Returns those of `classes` which `filter` includes, in their original order.
[[nodiscard]]
std::pmr::vector<const Class_Descriptor*> select_classes(
    std::span<const Class_Descriptor* const> classes,
    const Class_Filter& filter,
    std::pmr::memory_resource* memory
);

} // namespace xmldoclet

#endif
