#include <algorithm>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "xmldoclet/class_filter.hpp"
#include "xmldoclet/class_model.hpp"
#include "xmldoclet/simple_class_model.hpp"

namespace xmldoclet {
namespace {

struct Class_Filter_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;

    const Simple_Annotation deprecated { "java.lang.Deprecated" };
    const Simple_Annotation functional { "java.lang.FunctionalInterface" };

    const Simple_Class serializable { "java.io.Serializable" };
    const Simple_Class runnable { "java.lang.Runnable", nullptr, {}, { &functional } };
    const Simple_Class grand_base { "com.example.GrandBase" };
    const Simple_Class base { "com.example.Base", &grand_base, { &serializable } };
    const Simple_Class widget {
        "com.example.Widget",
        &base,
        { &runnable },
        { &deprecated },
    };
    const Simple_Class loner { "com.example.Loner" };

    [[nodiscard]]
    Class_Filter make_filter(
        std::optional<std::string_view> extends,
        std::optional<std::string_view> implements,
        std::optional<std::string_view> annotation
    )
    {
        Class_Filter result;
        if (extends) {
            result.extends_target.emplace(*extends, &memory);
        }
        if (implements) {
            result.implements_target.emplace(*implements, &memory);
        }
        if (annotation) {
            result.annotation_target.emplace(*annotation, &memory);
        }
        return result;
    }
};

TEST_F(Class_Filter_Test, has_filter)
{
    EXPECT_FALSE(make_filter({}, {}, {}).has_filter());
    EXPECT_TRUE(make_filter("a", {}, {}).has_filter());
    EXPECT_TRUE(make_filter({}, "a", {}).has_filter());
    EXPECT_TRUE(make_filter({}, {}, "a").has_filter());
    EXPECT_TRUE(make_filter("a", "b", "c").has_filter());
}

TEST_F(Class_Filter_Test, no_filter_includes_everything)
{
    const Class_Filter filter = make_filter({}, {}, {});
    EXPECT_TRUE(filter(widget));
    EXPECT_TRUE(filter(loner));
    EXPECT_TRUE(filter(serializable));
}

TEST_F(Class_Filter_Test, extends_is_not_transitive)
{
    EXPECT_TRUE(make_filter("com.example.Base", {}, {})(widget));
    EXPECT_FALSE(make_filter("com.example.GrandBase", {}, {})(widget));
    EXPECT_TRUE(make_filter("com.example.GrandBase", {}, {})(base));
    EXPECT_FALSE(make_filter("com.example.Base", {}, {})(loner));
}

TEST_F(Class_Filter_Test, extends_is_exact)
{
    EXPECT_FALSE(make_filter("Base", {}, {})(widget));
    EXPECT_FALSE(make_filter("com.example.base", {}, {})(widget));
}

TEST_F(Class_Filter_Test, implements_is_direct)
{
    EXPECT_TRUE(make_filter({}, "java.lang.Runnable", {})(widget));
    EXPECT_FALSE(make_filter({}, "java.io.Serializable", {})(widget));
    EXPECT_TRUE(make_filter({}, "java.io.Serializable", {})(base));
}

TEST_F(Class_Filter_Test, no_interfaces)
{
    EXPECT_FALSE(make_filter({}, "java.lang.Runnable", {})(loner));
    EXPECT_TRUE(make_filter({}, {}, {})(loner));
}

TEST_F(Class_Filter_Test, annotated)
{
    EXPECT_TRUE(make_filter({}, {}, "java.lang.Deprecated")(widget));
    EXPECT_FALSE(make_filter({}, {}, "java.lang.Deprecated")(base));
    EXPECT_TRUE(make_filter({}, {}, "java.lang.FunctionalInterface")(runnable));
    EXPECT_FALSE(make_filter({}, {}, "java.lang.Deprecated")(loner));
}

TEST_F(Class_Filter_Test, conjunction)
{
    EXPECT_TRUE(
        make_filter("com.example.Base", "java.lang.Runnable", "java.lang.Deprecated")(widget)
    );
    EXPECT_FALSE(
        make_filter("com.example.Base", "java.lang.Runnable", "java.lang.Override")(widget)
    );
    EXPECT_FALSE(make_filter("com.example.Base", "java.io.Serializable", {})(widget));
}

TEST_F(Class_Filter_Test, select_classes)
{
    const Class_Descriptor* const classes[] { &widget, &base, &loner, &runnable };

    const std::pmr::vector<const Class_Descriptor*> all
        = select_classes(classes, make_filter({}, {}, {}), &memory);
    EXPECT_TRUE(std::ranges::equal(all, classes));

    const std::pmr::vector<const Class_Descriptor*> extending
        = select_classes(classes, make_filter("com.example.Base", {}, {}), &memory);
    ASSERT_EQ(extending.size(), 1);
    EXPECT_EQ(extending[0], &widget);

    const std::pmr::vector<const Class_Descriptor*> annotated
        = select_classes(classes, make_filter({}, {}, "java.lang.Override"), &memory);
    EXPECT_TRUE(annotated.empty());
}

} // namespace
} // namespace xmldoclet
