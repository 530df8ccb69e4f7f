#ifndef XMLDOCLET_SIMPLE_CLASS_MODEL_HPP
#define XMLDOCLET_SIMPLE_CLASS_MODEL_HPP

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "xmldoclet/class_model.hpp"
#include "xmldoclet/fwd.hpp"

namespace xmldoclet {

struct Simple_Annotation final : Annotation_Descriptor {
private:
    std::string m_type_name;

public:
    [[nodiscard]]
    explicit Simple_Annotation(std::string type_name)
        : m_type_name { std::move(type_name) }
    {
    }

    [[nodiscard]]
    std::string_view annotation_type_name() const final
    {
        return m_type_name;
    }
};

/// @brief An in-memory `Class_Descriptor`.
/// The superclass, interfaces, and annotations are referred to, not owned.
struct Simple_Class final : Class_Descriptor {
private:
    std::string m_name;
    const Class_Descriptor* m_superclass;
    std::vector<const Class_Descriptor*> m_interfaces;
    std::vector<const Annotation_Descriptor*> m_annotations;

public:
    [[nodiscard]]
    explicit Simple_Class(
        std::string name,
        const Class_Descriptor* superclass = nullptr,
        std::vector<const Class_Descriptor*> interfaces = {},
        std::vector<const Annotation_Descriptor*> annotations = {}
    )
        : m_name { std::move(name) }
        , m_superclass { superclass }
        , m_interfaces { std::move(interfaces) }
        , m_annotations { std::move(annotations) }
    {
    }

    [[nodiscard]]
    std::string_view qualified_name() const final
    {
        return m_name;
    }

    [[nodiscard]]
    const Class_Descriptor* superclass() const final
    {
        return m_superclass;
    }

    [[nodiscard]]
    std::span<const Class_Descriptor* const> interfaces() const final
    {
        return m_interfaces;
    }

    [[nodiscard]]
    std::span<const Annotation_Descriptor* const> annotations() const final
    {
        return m_annotations;
    }
};

} // namespace xmldoclet

#endif
