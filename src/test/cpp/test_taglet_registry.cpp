#include <algorithm>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "xmldoclet/taglet.hpp"
#include "xmldoclet/taglet_provider.hpp"
#include "xmldoclet/taglet_registry.hpp"

namespace xmldoclet {
namespace {

TEST(Taglet, registry_key)
{
    std::pmr::monotonic_buffer_resource memory;

    const Block_Taglet param { Block_Tag::param };
    const Inline_Taglet link { Inline_Tag::link };
    const Custom_Tag todo { "todo", true };

    EXPECT_EQ(registry_key(param, &memory), "param");
    EXPECT_EQ(registry_key(link, &memory), "@link");
    EXPECT_EQ(registry_key(todo, &memory), "todo");
}

TEST(Taglet, applies_to)
{
    const Block_Taglet return_taglet { Block_Tag::return_ };
    EXPECT_EQ(return_taglet.get_name(), "return");
    EXPECT_TRUE(return_taglet.applies_to(Tag_Scope::method));
    EXPECT_FALSE(return_taglet.applies_to(Tag_Scope::field));
    EXPECT_FALSE(return_taglet.applies_to(Tag_Scope::method | Tag_Scope::constructor));
    EXPECT_FALSE(return_taglet.applies_to(Tag_Scope::none));

    const Custom_Tag todo { "todo", true };
    EXPECT_TRUE(todo.applies_to(Tag_Scope::all));
    EXPECT_TRUE(todo.is_enabled());
    EXPECT_FALSE(todo.is_inline());
}

TEST(Taglet_Registry, builtins)
{
    std::pmr::monotonic_buffer_resource memory;
    const Taglet_Registry registry { builtin_taglets(), &memory };

    EXPECT_EQ(registry.size(), 19);
    for (const std::string_view block : { "author", "deprecated", "exception", "param", "return",
                                          "see", "serial", "serialData", "serialField", "since",
                                          "throws", "version" }) {
        const Taglet* const taglet = registry.find(block);
        ASSERT_TRUE(taglet) << block;
        EXPECT_FALSE(taglet->is_inline());
        EXPECT_EQ(taglet->get_name(), block);
    }
    for (const std::string_view inline_name : { "code", "docRoot", "inheritDoc", "link",
                                                "linkplain", "literal", "value" }) {
        std::pmr::string key { "@", &memory };
        key += inline_name;
        const Taglet* const taglet = registry.find(key);
        ASSERT_TRUE(taglet) << key;
        EXPECT_TRUE(taglet->is_inline());
        EXPECT_EQ(taglet->get_name(), inline_name);
        EXPECT_FALSE(registry.contains(inline_name));
    }
    EXPECT_FALSE(registry.contains("todo"));
    EXPECT_FALSE(registry.contains("Param"));
}

TEST(Taglet_Registry, insert_overwrites)
{
    std::pmr::monotonic_buffer_resource memory;
    Taglet_Registry registry { &memory };
    EXPECT_TRUE(registry.empty());

    const Simple_Taglet first { "todo", false, Tag_Scope::all };
    const Simple_Taglet second { "todo", false, Tag_Scope::method };

    registry.insert(first);
    EXPECT_EQ(registry.find("todo"), &first);
    registry.insert(second);
    EXPECT_EQ(registry.find("todo"), &second);
    EXPECT_EQ(registry.size(), 1);

    registry.insert("todo", std::make_unique<const Custom_Tag>("todo", true));
    const Taglet* const owned = registry.find("todo");
    ASSERT_TRUE(owned);
    EXPECT_NE(owned, &second);
    EXPECT_EQ(owned->get_name(), "todo");
    EXPECT_EQ(registry.size(), 1);
}

TEST(Taglet_Registry, sorted_keys)
{
    std::pmr::monotonic_buffer_resource memory;
    Taglet_Registry registry { &memory };

    const Simple_Taglet b { "b", false, Tag_Scope::all };
    const Simple_Taglet a { "a", true, Tag_Scope::all };
    const Simple_Taglet c { "c", false, Tag_Scope::all };
    registry.insert(b);
    registry.insert(a);
    registry.insert(c);

    const std::pmr::vector<std::string_view> keys = registry.sorted_keys(&memory);
    const std::vector<std::string_view> expected { "@a", "b", "c" };
    EXPECT_TRUE(std::ranges::equal(keys, expected));
}

TEST(Taglet_Provider, standard_providers)
{
    std::pmr::monotonic_buffer_resource memory;
    const Taglet_Provider_Table providers { standard_taglet_providers(), &memory };

    const Taglet_Provider* const api_notes = providers.find("xmldoclet.taglets.ApiNotes");
    ASSERT_TRUE(api_notes);
    const Taglet_Provider* const index = providers.find("xmldoclet.taglets.Index");
    ASSERT_TRUE(index);
    EXPECT_FALSE(providers.find("xmldoclet.taglets.apinotes"));

    Taglet_Registry registry { &memory };
    api_notes->register_taglets(registry);
    index->register_taglets(registry);

    EXPECT_EQ(registry.size(), 5);
    EXPECT_TRUE(registry.contains("apiNote"));
    EXPECT_TRUE(registry.contains("implSpec"));
    EXPECT_TRUE(registry.contains("implNote"));
    EXPECT_TRUE(registry.contains("@index"));
    EXPECT_TRUE(registry.contains("@summary"));
}

TEST(Taglet_Provider, fuzzy_lookup_name)
{
    std::pmr::monotonic_buffer_resource memory;
    const Taglet_Provider_Table providers { standard_taglet_providers(), &memory };

    const Distant<std::string_view> match
        = providers.fuzzy_lookup_name("xmldoclet.taglets.Indx", &memory);
    ASSERT_TRUE(match);
    EXPECT_EQ(match.value, "xmldoclet.taglets.Index");
    EXPECT_EQ(match.distance, 1);

    const Taglet_Provider_Table empty { &memory };
    EXPECT_FALSE(empty.fuzzy_lookup_name("xmldoclet.taglets.Index", &memory));
}

} // namespace
} // namespace xmldoclet
