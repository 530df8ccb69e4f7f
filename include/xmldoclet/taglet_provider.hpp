#ifndef XMLDOCLET_TAGLET_PROVIDER_HPP
#define XMLDOCLET_TAGLET_PROVIDER_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <unordered_map>

#include "xmldoclet/util/transparent_comparison.hpp"
#include "xmldoclet/util/typo.hpp"

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

/// @brief A named source of taglets, selected on the command line with `-taglet <name>`.
struct Taglet_Provider {
    /// @brief Returns the fully qualified name by which the provider is selected,
    /// like `"xmldoclet.taglets.ApiNotes"`.
    [[nodiscard]]
    virtual std::string_view get_name() const
        = 0;

    /// @brief Adds the taglets of this provider to `registry`,
    /// replacing any taglets already registered under the same keys.
    /// May throw an exception derived from `std::exception` on failure.
    virtual void register_taglets(Taglet_Registry& registry) const = 0;
};

/// @brief The set of taglet providers which `-taglet` can select from, looked up by name.
/// Providers are not owned and must outlive the table.
struct Taglet_Provider_Table {
private:
    std::pmr::unordered_map<
        std::string_view,
        const Taglet_Provider*,
        Transparent_String_View_Hash,
        Transparent_String_View_Equals>
        m_providers;

public:
    /// @brief Constructs an empty table.
    [[nodiscard]]
    explicit Taglet_Provider_Table(std::pmr::memory_resource* memory);

    [[nodiscard]]
    explicit Taglet_Provider_Table(
        std::span<const Taglet_Provider* const> providers,
        std::pmr::memory_resource* memory
    );

    /// @brief Adds `provider` to the table under `provider.get_name()`,
    /// replacing any provider with the same name.
    void add(const Taglet_Provider& provider);

    /// @brief Returns the provider with the given `name`, or `nullptr` if there is none.
    [[nodiscard]]
    const Taglet_Provider* find(std::string_view name) const;

    /// @brief Returns the name of the provider closest to `name` in Levenshtein distance.
    [[nodiscard]]
    Distant<std::string_view>
    fuzzy_lookup_name(std::string_view name, std::pmr::memory_resource* memory) const;
};

/// @brief Returns the taglet providers shipped with this library:
/// - `xmldoclet.taglets.ApiNotes` registers the block tags `apiNote`, `implSpec`, and `implNote`,
/// - `xmldoclet.taglets.Index` registers the inline tags `@index` and `@summary`.
[[nodiscard]]
std::span<const Taglet_Provider* const> standard_taglet_providers() noexcept;

} // namespace xmldoclet

#endif
