#include <memory_resource>
#include <span>
#include <string>
#include <string_view>

#include "xmldoclet/util/assert.hpp"

#include "xmldoclet/taglet.hpp"

namespace xmldoclet {
namespace {

using enum Tag_Scope;

const Block_Taglet author_taglet { Block_Tag::author };
const Block_Taglet deprecated_taglet { Block_Tag::deprecated };
const Block_Taglet exception_taglet { Block_Tag::exception };
const Block_Taglet param_taglet { Block_Tag::param };
const Block_Taglet return_taglet { Block_Tag::return_ };
const Block_Taglet see_taglet { Block_Tag::see };
const Block_Taglet serial_taglet { Block_Tag::serial };
const Block_Taglet serial_data_taglet { Block_Tag::serial_data };
const Block_Taglet serial_field_taglet { Block_Tag::serial_field };
const Block_Taglet since_taglet { Block_Tag::since };
const Block_Taglet throws_taglet { Block_Tag::throws };
const Block_Taglet version_taglet { Block_Tag::version };

const Inline_Taglet code_taglet { Inline_Tag::code };
const Inline_Taglet doc_root_taglet { Inline_Tag::doc_root };
const Inline_Taglet inherit_doc_taglet { Inline_Tag::inherit_doc };
const Inline_Taglet link_taglet { Inline_Tag::link };
const Inline_Taglet linkplain_taglet { Inline_Tag::linkplain };
const Inline_Taglet literal_taglet { Inline_Tag::literal };
const Inline_Taglet value_taglet { Inline_Tag::value };

constexpr const Taglet* all_builtin_taglets[] {
    &author_taglet,   &deprecated_taglet,  &exception_taglet,   &param_taglet,
    &return_taglet,   &see_taglet,         &serial_taglet,      &serial_data_taglet,
    &serial_field_taglet, &since_taglet,   &throws_taglet,      &version_taglet,
    &code_taglet,     &doc_root_taglet,    &inherit_doc_taglet, &link_taglet,
    &linkplain_taglet, &literal_taglet,    &value_taglet,
};

} // namespace

std::pmr::string registry_key(const Taglet& taglet, std::pmr::memory_resource* memory)
{
    std::pmr::string result { memory };
    if (taglet.is_inline()) {
        result += inline_tag_prefix;
    }
    result += taglet.get_name();
    return result;
}

std::string_view block_tag_name(Block_Tag tag) noexcept
{
    switch (tag) {
    case Block_Tag::author: return "author";
    case Block_Tag::deprecated: return "deprecated";
    case Block_Tag::exception: return "exception";
    case Block_Tag::param: return "param";
    case Block_Tag::return_: return "return";
    case Block_Tag::see: return "see";
    case Block_Tag::serial: return "serial";
    case Block_Tag::serial_data: return "serialData";
    case Block_Tag::serial_field: return "serialField";
    case Block_Tag::since: return "since";
    case Block_Tag::throws: return "throws";
    case Block_Tag::version: return "version";
    }
    XMLDOCLET_ASSERT_UNREACHABLE(u8"Invalid block tag.");
}

// The scopes follow those of the standard doclet.
Tag_Scope block_tag_scope(Block_Tag tag) noexcept
{
    switch (tag) {
    case Block_Tag::author:
    case Block_Tag::version: return overview | package | type;
    case Block_Tag::deprecated: return type | constructor | method | field;
    case Block_Tag::exception:
    case Block_Tag::throws: return constructor | method;
    case Block_Tag::param: return type | constructor | method;
    case Block_Tag::return_:
    case Block_Tag::serial_data: return method;
    case Block_Tag::serial: return package | type | field;
    case Block_Tag::serial_field: return field;
    case Block_Tag::see:
    case Block_Tag::since: return all;
    }
    XMLDOCLET_ASSERT_UNREACHABLE(u8"Invalid block tag.");
}

std::string_view inline_tag_name(Inline_Tag tag) noexcept
{
    switch (tag) {
    case Inline_Tag::code: return "code";
    case Inline_Tag::doc_root: return "docRoot";
    case Inline_Tag::inherit_doc: return "inheritDoc";
    case Inline_Tag::link: return "link";
    case Inline_Tag::linkplain: return "linkplain";
    case Inline_Tag::literal: return "literal";
    case Inline_Tag::value: return "value";
    }
    XMLDOCLET_ASSERT_UNREACHABLE(u8"Invalid inline tag.");
}

std::span<const Taglet* const> builtin_taglets() noexcept
{
    return all_builtin_taglets;
}

} // namespace xmldoclet
