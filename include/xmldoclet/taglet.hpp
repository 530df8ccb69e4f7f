#ifndef XMLDOCLET_TAGLET_HPP
#define XMLDOCLET_TAGLET_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

/// @brief A set of places in which a documentation tag may appear.
enum struct Tag_Scope : Default_Underlying {
    none = 0,
    overview = 1 << 0,
    package = 1 << 1,
    type = 1 << 2,
    constructor = 1 << 3,
    method = 1 << 4,
    field = 1 << 5,
    all = overview | package | type | constructor | method | field,
};

[[nodiscard]]
constexpr Tag_Scope operator|(Tag_Scope x, Tag_Scope y) noexcept
{
    return Tag_Scope(Default_Underlying(x) | Default_Underlying(y));
}

[[nodiscard]]
constexpr Tag_Scope operator&(Tag_Scope x, Tag_Scope y) noexcept
{
    return Tag_Scope(Default_Underlying(x) & Default_Underlying(y));
}

/// @brief The prefix which distinguishes the registry keys of inline tags from those of block
/// tags.
/// For example, the block tag `@see` is registered as `"see"`,
/// whereas the inline tag `{@link}` is registered as `"@link"`.
inline constexpr char inline_tag_prefix = '@';

/// @brief A handler for one kind of documentation tag.
struct Taglet {
    constexpr Taglet() = default;
    constexpr Taglet(const Taglet&) = default;
    constexpr Taglet& operator=(const Taglet&) = default;
    constexpr virtual ~Taglet() = default;

    /// @brief Returns the tag name, without any leading `@`.
    [[nodiscard]]
    virtual std::string_view get_name() const
        = 0;

    /// @brief Returns `true` if this is an inline tag like `{@code}`,
    /// `false` if this is a block tag like `@param`.
    [[nodiscard]]
    virtual bool is_inline() const
        = 0;

    /// @brief Returns the set of places in which the tag may appear.
    [[nodiscard]]
    virtual Tag_Scope get_scope() const
        = 0;

    /// @brief Returns `true` iff the tag may appear in every place in `scope`.
    [[nodiscard]]
    bool applies_to(Tag_Scope scope) const
    {
        return scope != Tag_Scope::none && (get_scope() & scope) == scope;
    }
};

/// @brief Returns the key under which `taglet` is registered by convention:
/// its name for block tags, or its name prefixed with `inline_tag_prefix` for inline tags.
[[nodiscard]]
std::pmr::string registry_key(const Taglet& taglet, std::pmr::memory_resource* memory);

enum struct Block_Tag : Default_Underlying {
    author,
    deprecated,
    exception,
    param,
    return_,
    see,
    serial,
    serial_data,
    serial_field,
    since,
    throws,
    version,
};

enum struct Inline_Tag : Default_Underlying {
    code,
    doc_root,
    inherit_doc,
    link,
    linkplain,
    literal,
    value,
};

/// @brief Returns the name of the tag as it appears in documentation comments,
/// like `"serialData"` for `Block_Tag::serial_data`.
[[nodiscard]]
std::string_view block_tag_name(Block_Tag tag) noexcept;

[[nodiscard]]
Tag_Scope block_tag_scope(Block_Tag tag) noexcept;

/// @brief Returns the name of the tag as it appears in documentation comments,
/// like `"inheritDoc"` for `Inline_Tag::inherit_doc`.
[[nodiscard]]
std::string_view inline_tag_name(Inline_Tag tag) noexcept;

/// @brief A built-in block tag handler.
struct Block_Taglet final : Taglet {
private:
    Block_Tag m_tag;

public:
    [[nodiscard]]
    constexpr explicit Block_Taglet(Block_Tag tag) noexcept
        : m_tag { tag }
    {
    }

    [[nodiscard]]
    constexpr Block_Tag get_tag() const noexcept
    {
        return m_tag;
    }

    [[nodiscard]]
    std::string_view get_name() const final
    {
        return block_tag_name(m_tag);
    }

    [[nodiscard]]
    bool is_inline() const final
    {
        return false;
    }

    [[nodiscard]]
    Tag_Scope get_scope() const final
    {
        return block_tag_scope(m_tag);
    }
};

/// @brief A built-in inline tag handler.
/// Inline tags may appear anywhere documentation text may appear.
struct Inline_Taglet final : Taglet {
private:
    Inline_Tag m_tag;

public:
    [[nodiscard]]
    constexpr explicit Inline_Taglet(Inline_Tag tag) noexcept
        : m_tag { tag }
    {
    }

    [[nodiscard]]
    constexpr Inline_Tag get_tag() const noexcept
    {
        return m_tag;
    }

    [[nodiscard]]
    std::string_view get_name() const final
    {
        return inline_tag_name(m_tag);
    }

    [[nodiscard]]
    bool is_inline() const final
    {
        return true;
    }

    [[nodiscard]]
    Tag_Scope get_scope() const final
    {
        return Tag_Scope::all;
    }
};

/// @brief A handler for a user-defined block tag, as defined with `-tag`.
/// Custom tags may appear anywhere.
struct Custom_Tag final : Taglet {
private:
    std::string m_name;
    bool m_enabled;

public:
    [[nodiscard]]
    explicit Custom_Tag(std::string_view name, bool enabled)
        : m_name { name }
        , m_enabled { enabled }
    {
    }

    /// @brief Returns `true` if this tag was registered as a handler,
    /// `false` if it merely describes a parsed definition.
    [[nodiscard]]
    bool is_enabled() const noexcept
    {
        return m_enabled;
    }

    [[nodiscard]]
    std::string_view get_name() const final
    {
        return m_name;
    }

    [[nodiscard]]
    bool is_inline() const final
    {
        return false;
    }

    [[nodiscard]]
    Tag_Scope get_scope() const final
    {
        return Tag_Scope::all;
    }
};

/// @brief A taglet whose properties are all fixed on construction.
/// This is convenient for taglets contributed by a `Taglet_Provider`.
struct Simple_Taglet final : Taglet {
private:
    std::string_view m_name;
    bool m_inline;
    Tag_Scope m_scope;

public:
    [[nodiscard]]
    constexpr explicit Simple_Taglet(std::string_view name, bool is_inline, Tag_Scope scope) noexcept
        : m_name { name }
        , m_inline { is_inline }
        , m_scope { scope }
    {
    }

    [[nodiscard]]
    std::string_view get_name() const final
    {
        return m_name;
    }

    [[nodiscard]]
    bool is_inline() const final
    {
        return m_inline;
    }

    [[nodiscard]]
    Tag_Scope get_scope() const final
    {
        return m_scope;
    }
};

/// @brief Returns one taglet for every `Block_Tag` and every `Inline_Tag`,
/// which is the initial content of a `Taglet_Registry` for a configuration.
[[nodiscard]]
std::span<const Taglet* const> builtin_taglets() noexcept;

} // namespace xmldoclet

#endif
