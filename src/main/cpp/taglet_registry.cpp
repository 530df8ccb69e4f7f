#include <algorithm>
#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "xmldoclet/util/assert.hpp"

#include "xmldoclet/taglet.hpp"
#include "xmldoclet/taglet_registry.hpp"

namespace xmldoclet {

Taglet_Registry::Taglet_Registry(std::pmr::memory_resource* memory)
    : m_taglets { memory }
    , m_owned { memory }
{
}

Taglet_Registry::Taglet_Registry(
    std::span<const Taglet* const> taglets,
    std::pmr::memory_resource* memory
)
    : Taglet_Registry { memory }
{
    for (const Taglet* const taglet : taglets) {
        XMLDOCLET_ASSERT(taglet);
        insert(*taglet);
    }
}

void Taglet_Registry::insert(const Taglet& taglet)
{
    std::pmr::memory_resource* const memory = m_taglets.get_allocator().resource();
    const std::pmr::string key = registry_key(taglet, memory);
    insert(key, taglet);
}

void Taglet_Registry::insert(std::string_view key, const Taglet& taglet)
{
    const auto it = m_taglets.find(key);
    if (it != m_taglets.end()) {
        it->second = &taglet;
        return;
    }
    std::pmr::memory_resource* const memory = m_taglets.get_allocator().resource();
    m_taglets.emplace(std::pmr::string { key, memory }, &taglet);
}

void Taglet_Registry::insert(std::string_view key, std::unique_ptr<const Taglet> taglet)
{
    XMLDOCLET_ASSERT(taglet);
    const Taglet& result = *taglet;
    m_owned.push_back(std::move(taglet));
    insert(key, result);
}

const Taglet* Taglet_Registry::find(std::string_view key) const
{
    const auto it = m_taglets.find(key);
    return it == m_taglets.end() ? nullptr : it->second;
}

std::pmr::vector<std::string_view>
Taglet_Registry::sorted_keys(std::pmr::memory_resource* memory) const
{
    std::pmr::vector<std::string_view> result { memory };
    result.reserve(m_taglets.size());
    for (const auto& [key, taglet] : m_taglets) {
        result.push_back(key);
    }
    std::ranges::sort(result);
    return result;
}

} // namespace xmldoclet
