#ifndef XMLDOCLET_TAGLET_REGISTRY_HPP
#define XMLDOCLET_TAGLET_REGISTRY_HPP

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "xmldoclet/util/transparent_comparison.hpp"

#include "xmldoclet/fwd.hpp"
#include "xmldoclet/taglet.hpp"

namespace xmldoclet {

/// @brief A mapping from tag names to taglets.
///
/// Keys follow the convention of `registry_key`:
/// block tags are keyed by their bare name, like `"param"`,
/// and inline tags by their name prefixed with `inline_tag_prefix`, like `"@code"`.
/// The registry does not enforce this convention for explicitly given keys.
///
/// Inserting under an existing key replaces the previous taglet.
struct Taglet_Registry {
    using Map = std::pmr::unordered_map<
        std::pmr::string,
        const Taglet*,
        Transparent_String_View_Hash,
        Transparent_String_View_Equals>;

private:
    Map m_taglets;
    // Taglets whose lifetime is bound to the registry.
    // These are never removed, even when replaced in `m_taglets`.
    std::pmr::vector<std::unique_ptr<const Taglet>> m_owned;

public:
    /// @brief Constructs an empty registry.
    [[nodiscard]]
    explicit Taglet_Registry(std::pmr::memory_resource* memory);

    /// @brief Constructs a registry containing each of `taglets` under its `registry_key`.
    /// The taglets are not owned and must outlive the registry.
    [[nodiscard]]
    explicit Taglet_Registry(
        std::span<const Taglet* const> taglets,
        std::pmr::memory_resource* memory
    );

    /// @brief Registers `taglet` under its `registry_key`.
    /// `taglet` is not owned and must outlive the registry.
    void insert(const Taglet& taglet);

    /// @brief Registers `taglet` under `key`.
    /// `taglet` is not owned and must outlive the registry.
    void insert(std::string_view key, const Taglet& taglet);

    /// @brief Registers `taglet` under `key`, transferring ownership to the registry.
    void insert(std::string_view key, std::unique_ptr<const Taglet> taglet);

    /// @brief Returns the taglet registered under `key`, or `nullptr` if there is none.
    [[nodiscard]]
    const Taglet* find(std::string_view key) const;

    [[nodiscard]]
    bool contains(std::string_view key) const
    {
        return find(key) != nullptr;
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_taglets.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_taglets.empty();
    }

    /// @brief Returns all registered keys in ascending order.
    [[nodiscard]]
    std::pmr::vector<std::string_view> sorted_keys(std::pmr::memory_resource* memory) const;
};

} // namespace xmldoclet

#endif
