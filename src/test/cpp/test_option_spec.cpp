#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "xmldoclet/option_spec.hpp"

namespace xmldoclet {
namespace {

TEST(Option_Spec, lengths)
{
    EXPECT_EQ(option_length("-d"), 2);
    EXPECT_EQ(option_length("-docencoding"), 2);
    EXPECT_EQ(option_length("-multiple"), 1);
    EXPECT_EQ(option_length("-filename"), 2);
    EXPECT_EQ(option_length("-implements"), 2);
    EXPECT_EQ(option_length("-extends"), 2);
    EXPECT_EQ(option_length("-annotated"), 2);
    EXPECT_EQ(option_length("-tag"), 2);
    EXPECT_EQ(option_length("-taglet"), 2);
    EXPECT_EQ(option_length("-subfolders"), 1);
}

TEST(Option_Spec, unknown_options_have_no_length)
{
    EXPECT_EQ(option_length(""), 0);
    EXPECT_EQ(option_length("-"), 0);
    EXPECT_EQ(option_length("d"), 0);
    EXPECT_EQ(option_length("-D"), 0);
    EXPECT_EQ(option_length("-Multiple"), 0);
    EXPECT_EQ(option_length("--d"), 0);
    EXPECT_EQ(option_length("-d "), 0);
    EXPECT_EQ(option_length("-doctitle"), 0);
}

TEST(Option_Spec, names_match_table)
{
    const auto options = all_options();
    const auto names = all_option_names();
    ASSERT_EQ(options.size(), 10);
    ASSERT_EQ(options.size(), names.size());
    for (std::size_t i = 0; i < options.size(); ++i) {
        EXPECT_EQ(options[i].name, names[i]);
        EXPECT_EQ(find_option(names[i]), &options[i]);
        EXPECT_EQ(options[i].is_flag(), options[i].parameter.empty());
    }
}

TEST(Option_Spec, usage_line)
{
    std::pmr::monotonic_buffer_resource memory;

    const Option_Info* const d = find_option("-d");
    ASSERT_TRUE(d);
    EXPECT_EQ(usage_line(*d, &memory), "-d <directory> Destination directory for output files");

    const Option_Info* const multiple = find_option("-multiple");
    ASSERT_TRUE(multiple);
    EXPECT_EQ(
        usage_line(*multiple, &memory), "-multiple Use multiple files for output (one per class)"
    );
}

} // namespace
} // namespace xmldoclet
