#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <boost/locale/encoding.hpp>
#include <boost/locale/encoding_errors.hpp>

#include "xmldoclet/util/strings.hpp"

#include "xmldoclet/charset.hpp"

namespace xmldoclet {
namespace {

struct Charset_Aliases {
    std::string_view canonical_name;
    std::span<const std::string_view> aliases;
};

constexpr std::string_view utf_8_aliases[] { "UTF8", "unicode-1-1-utf-8" };
constexpr std::string_view us_ascii_aliases[] {
    "ASCII", "US", "ISO646-US", "ascii7", "646", "cp367", "csASCII", "iso-ir-6", "IBM367",
};
constexpr std::string_view iso_8859_1_aliases[] {
    "ISO8859_1", "ISO_8859_1", "ISO8859-1", "8859_1", "latin1", "l1",
    "IBM819",    "cp819",      "csISOLatin1", "iso-ir-100",
};
constexpr std::string_view utf_16_aliases[] { "UTF16", "UTF_16", "unicode" };
constexpr std::string_view utf_16be_aliases[] { "UTF_16BE", "X-UTF-16BE", "UnicodeBigUnmarked" };
constexpr std::string_view utf_16le_aliases[] { "UTF_16LE", "X-UTF-16LE", "UnicodeLittleUnmarked" };
constexpr std::string_view utf_32_aliases[] { "UTF32", "UTF_32" };
constexpr std::string_view utf_32be_aliases[] { "UTF_32BE", "X-UTF-32BE" };
constexpr std::string_view utf_32le_aliases[] { "UTF_32LE", "X-UTF-32LE" };
constexpr std::string_view windows_1252_aliases[] { "cp1252", "cp5348" };

constexpr Charset_Aliases standard_charsets[] {
    { "UTF-8", utf_8_aliases },
    { "US-ASCII", us_ascii_aliases },
    { "ISO-8859-1", iso_8859_1_aliases },
    { "UTF-16", utf_16_aliases },
    { "UTF-16BE", utf_16be_aliases },
    { "UTF-16LE", utf_16le_aliases },
    { "UTF-32", utf_32_aliases },
    { "UTF-32BE", utf_32be_aliases },
    { "UTF-32LE", utf_32le_aliases },
    { "windows-1252", windows_1252_aliases },
};

/// @brief Returns `true` iff `name` is a syntactically valid charset name:
/// a non-empty sequence of ASCII letters, digits, `-`, `+`, `:`, `_`, and `.`,
/// starting with a letter or digit.
[[nodiscard]]
constexpr bool is_charset_name(std::string_view name) noexcept
{
    if (name.empty() || !is_ascii_alphanumeric(name.front())) {
        return false;
    }
    return std::ranges::all_of(name, [](char c) {
        return is_ascii_alphanumeric(c) || c == '-' || c == '+' || c == ':' || c == '_'
            || c == '.';
    });
}

static_assert(is_charset_name("UTF-8"));
static_assert(is_charset_name("x-MacRoman"));
static_assert(!is_charset_name(""));
static_assert(!is_charset_name("-utf8"));
static_assert(!is_charset_name("UTF-8//IGNORE"));

[[nodiscard]]
const Charset_Aliases* find_standard_charset(std::string_view name)
{
    const auto matches = [name](std::string_view n) { return equals_ascii_ignore_case(n, name); };
    const auto* const it
        = std::ranges::find_if(standard_charsets, [&](const Charset_Aliases& charset) {
              return matches(charset.canonical_name) || std::ranges::any_of(charset.aliases, matches);
          });
    return it == std::end(standard_charsets) ? nullptr : it;
}

/// @brief Returns `true` if the platform converters can encode text in the charset `name`.
[[nodiscard]]
bool is_supported_by_platform(const std::string& name)
{
    try {
        const std::string encoded = boost::locale::conv::from_utf<char>("a", name);
        return !encoded.empty();
    } catch (const boost::locale::conv::invalid_charset_error&) {
        return false;
    } catch (const boost::locale::conv::conversion_error&) {
        return false;
    }
}

} // namespace

Charset utf8_charset()
{
    return Charset { .name = "UTF-8" };
}

std::optional<Charset> resolve_charset(std::string_view name)
{
    if (!is_charset_name(name)) {
        return {};
    }
    if (const Charset_Aliases* const standard = find_standard_charset(name)) {
        return Charset { .name = std::string(standard->canonical_name) };
    }
    std::string upper_name { name };
    std::ranges::transform(upper_name, upper_name.begin(), [](char c) { return to_ascii_upper(c); });
    if (!is_supported_by_platform(upper_name)) {
        return {};
    }
    return Charset { .name = std::move(upper_name) };
}

} // namespace xmldoclet
