#ifndef XMLDOCLET_ASSERT_HPP
#define XMLDOCLET_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace xmldoclet {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define XMLDOCLET_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define XMLDOCLET_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define XMLDOCLET_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace xmldoclet

#endif
