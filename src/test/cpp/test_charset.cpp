#include <optional>

#include <gtest/gtest.h>

#include "xmldoclet/charset.hpp"

namespace xmldoclet {
namespace {

TEST(Charset, default_is_utf8)
{
    EXPECT_EQ(utf8_charset().name, "UTF-8");
}

TEST(Charset, canonical_names)
{
    EXPECT_EQ(resolve_charset("UTF-8"), utf8_charset());
    EXPECT_EQ(resolve_charset("US-ASCII")->name, "US-ASCII");
    EXPECT_EQ(resolve_charset("ISO-8859-1")->name, "ISO-8859-1");
    EXPECT_EQ(resolve_charset("UTF-16LE")->name, "UTF-16LE");
    EXPECT_EQ(resolve_charset("windows-1252")->name, "windows-1252");
}

TEST(Charset, aliases_ignore_case)
{
    EXPECT_EQ(resolve_charset("utf-8"), utf8_charset());
    EXPECT_EQ(resolve_charset("utf8"), utf8_charset());
    EXPECT_EQ(resolve_charset("Latin1")->name, "ISO-8859-1");
    EXPECT_EQ(resolve_charset("ascii")->name, "US-ASCII");
    EXPECT_EQ(resolve_charset("CP1252")->name, "windows-1252");
}

TEST(Charset, platform_charsets_are_upper_cased)
{
    const std::optional<Charset> shift_jis = resolve_charset("shift_jis");
    ASSERT_TRUE(shift_jis);
    EXPECT_EQ(shift_jis->name, "SHIFT_JIS");
}

TEST(Charset, unsupported)
{
    EXPECT_EQ(resolve_charset(""), std::nullopt);
    EXPECT_EQ(resolve_charset("no-such-charset-anywhere"), std::nullopt);
}

TEST(Charset, malformed_names)
{
    EXPECT_EQ(resolve_charset("utf-8//IGNORE"), std::nullopt);
    EXPECT_EQ(resolve_charset("UTF-8//TRANSLIT"), std::nullopt);
    EXPECT_EQ(resolve_charset("-utf-8"), std::nullopt);
    EXPECT_EQ(resolve_charset("utf 8"), std::nullopt);
    EXPECT_EQ(resolve_charset("latin1,"), std::nullopt);
}

} // namespace
} // namespace xmldoclet
