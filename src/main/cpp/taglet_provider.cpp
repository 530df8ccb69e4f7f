#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "xmldoclet/util/assert.hpp"
#include "xmldoclet/util/typo.hpp"

#include "xmldoclet/taglet.hpp"
#include "xmldoclet/taglet_provider.hpp"
#include "xmldoclet/taglet_registry.hpp"

namespace xmldoclet {
namespace {

struct Fixed_Taglet_Provider final : Taglet_Provider {
private:
    std::string_view m_name;
    std::span<const Simple_Taglet> m_taglets;

public:
    [[nodiscard]]
    constexpr explicit Fixed_Taglet_Provider(
        std::string_view name,
        std::span<const Simple_Taglet> taglets
    ) noexcept
        : m_name { name }
        , m_taglets { taglets }
    {
    }

    [[nodiscard]]
    std::string_view get_name() const final
    {
        return m_name;
    }

    void register_taglets(Taglet_Registry& registry) const final
    {
        for (const Simple_Taglet& taglet : m_taglets) {
            registry.insert(taglet);
        }
    }
};

const Simple_Taglet api_note_taglets[] {
    Simple_Taglet { "apiNote", false, Tag_Scope::all },
    Simple_Taglet { "implSpec", false, Tag_Scope::all },
    Simple_Taglet { "implNote", false, Tag_Scope::all },
};

const Simple_Taglet index_taglets[] {
    Simple_Taglet { "index", true, Tag_Scope::all },
    Simple_Taglet { "summary", true, Tag_Scope::all },
};

constexpr Fixed_Taglet_Provider api_notes_provider { "xmldoclet.taglets.ApiNotes",
                                                     api_note_taglets };
constexpr Fixed_Taglet_Provider index_provider { "xmldoclet.taglets.Index", index_taglets };

constexpr const Taglet_Provider* all_standard_providers[] { &api_notes_provider, &index_provider };

} // namespace

Taglet_Provider_Table::Taglet_Provider_Table(std::pmr::memory_resource* memory)
    : m_providers { memory }
{
}

Taglet_Provider_Table::Taglet_Provider_Table(
    std::span<const Taglet_Provider* const> providers,
    std::pmr::memory_resource* memory
)
    : Taglet_Provider_Table { memory }
{
    for (const Taglet_Provider* const provider : providers) {
        XMLDOCLET_ASSERT(provider);
        add(*provider);
    }
}

void Taglet_Provider_Table::add(const Taglet_Provider& provider)
{
    m_providers.insert_or_assign(provider.get_name(), &provider);
}

const Taglet_Provider* Taglet_Provider_Table::find(std::string_view name) const
{
    const auto it = m_providers.find(name);
    return it == m_providers.end() ? nullptr : it->second;
}

Distant<std::string_view> Taglet_Provider_Table::fuzzy_lookup_name(
    std::string_view name,
    std::pmr::memory_resource* memory
) const
{
    std::pmr::vector<std::string_view> names { memory };
    names.reserve(m_providers.size());
    for (const auto& [provider_name, provider] : m_providers) {
        names.push_back(provider_name);
    }
    // Ties are broken alphabetically.
    std::ranges::sort(names);

    const Distant<std::size_t> result = closest_match(names, name, memory);
    if (!result) {
        return {};
    }
    return { .value = names[result.value], .distance = result.distance };
}

std::span<const Taglet_Provider* const> standard_taglet_providers() noexcept
{
    return all_standard_providers;
}

} // namespace xmldoclet
