#ifndef XMLDOCLET_CLASS_MODEL_HPP
#define XMLDOCLET_CLASS_MODEL_HPP

#include <span>
#include <string_view>

#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

// These interfaces give read-only access to the documentation model of the host tool.
// The doclet never owns or modifies the objects behind them.

/// @brief An annotation attached to a documented class.
struct Annotation_Descriptor {
    /// @brief Returns the fully qualified name of the annotation type,
    /// like `"java.lang.Deprecated"`.
    [[nodiscard]]
    virtual std::string_view annotation_type_name() const
        = 0;
};

/// @brief A documented class or interface.
struct Class_Descriptor {
    /// @brief Returns the fully qualified name, like `"com.example.Widget"`.
    [[nodiscard]]
    virtual std::string_view qualified_name() const
        = 0;

    /// @brief Returns the direct superclass, or `nullptr` if there is none.
    [[nodiscard]]
    virtual const Class_Descriptor* superclass() const
        = 0;

    /// @brief Returns the interfaces which this class directly implements,
    /// not including those inherited from superclasses or superinterfaces.
    [[nodiscard]]
    virtual std::span<const Class_Descriptor* const> interfaces() const
        = 0;

    [[nodiscard]]
    virtual std::span<const Annotation_Descriptor* const> annotations() const
        = 0;
};

} // namespace xmldoclet

#endif
