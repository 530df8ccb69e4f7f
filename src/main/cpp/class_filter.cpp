#include <algorithm>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "xmldoclet/class_filter.hpp"
#include "xmldoclet/class_model.hpp"

namespace xmldoclet {

bool extends_class(const Class_Descriptor& c, std::string_view superclass)
{
    const Class_Descriptor* const actual = c.superclass();
    return actual != nullptr && actual->qualified_name() == superclass;
}

bool implements_interface(const Class_Descriptor& c, std::string_view interface_name)
{
    return std::ranges::any_of(c.interfaces(), [&](const Class_Descriptor* i) {
        return i->qualified_name() == interface_name;
    });
}

bool is_annotated(const Class_Descriptor& c, std::string_view annotation)
{
    return std::ranges::any_of(c.annotations(), [&](const Annotation_Descriptor* a) {
        return a->annotation_type_name() == annotation;
    });
}

bool Class_Filter::should_include(const Class_Descriptor& c) const
{
    if (extends_target && !extends_class(c, *extends_target)) {
        return false;
    }
    if (implements_target && !implements_interface(c, *implements_target)) {
        return false;
    }
    if (annotation_target && !is_annotated(c, *annotation_target)) {
        return false;
    }
    return true;
}

std::pmr::vector<const Class_Descriptor*> select_classes(
    std::span<const Class_Descriptor* const> classes,
    const Class_Filter& filter,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<const Class_Descriptor*> result { memory };
    if (!filter.has_filter()) {
        result.assign(classes.begin(), classes.end());
        return result;
    }
    for (const Class_Descriptor* const c : classes) {
        if (filter(*c)) {
            result.push_back(c);
        }
    }
    return result;
}

} // namespace xmldoclet
