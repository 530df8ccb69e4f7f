#ifndef XMLDOCLET_FWD_HPP
#define XMLDOCLET_FWD_HPP

#include <string>
#include <vector>

namespace xmldoclet {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

struct Annotation_Descriptor;
enum struct Block_Tag : Default_Underlying;
struct Charset;
struct Class_Descriptor;
struct Class_Filter;
struct Collecting_Logger;
struct Configuration;
struct Custom_Tag;
struct Custom_Tag_Definition;
struct Diagnostic;
enum struct Inline_Tag : Default_Underlying;
struct Logger;
struct Option_Info;
enum struct Severity : Default_Underlying;
struct Simple_Annotation;
struct Simple_Class;
enum struct Tag_Scope : Default_Underlying;
struct Taglet;
struct Taglet_Provider;
struct Taglet_Provider_Table;
struct Taglet_Registry;

template <typename>
struct Basic_Transparent_String_View_Equals;
template <typename>
struct Basic_Transparent_String_View_Hash;
template <typename T>
struct Distant;

using Transparent_String_View_Equals = Basic_Transparent_String_View_Equals<char>;
using Transparent_String_View_Hash = Basic_Transparent_String_View_Hash<char>;

/// @brief One group of the command line:
/// the option name (including its leading dash), followed by its values.
using Option_Entry = std::vector<std::string>;
/// @brief The command line, grouped into options as described by `option_length`.
using Option_Matrix = std::vector<Option_Entry>;

} // namespace xmldoclet

#endif
