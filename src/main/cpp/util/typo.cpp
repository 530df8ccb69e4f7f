#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "xmldoclet/util/levenshtein.hpp"
#include "xmldoclet/util/typo.hpp"

namespace xmldoclet {

Distant<std::size_t> closest_match(
    std::span<const std::string_view> haystack,
    std::string_view needle,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::size_t> matrix_data { memory };

    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::string_view hay = haystack[i];
        matrix_data.resize((hay.size() + 1) * (needle.size() + 1));
        const std::size_t distance = levenshtein_distance(hay, needle, std::span { matrix_data });

        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

Distant<std::string_view> suggest_correction(
    std::span<const std::string_view> haystack,
    std::string_view needle,
    std::size_t max_distance,
    std::pmr::memory_resource* memory
)
{
    const Distant<std::size_t> match = closest_match(haystack, needle, memory);
    if (!match || match.distance == 0 || match.distance > max_distance) {
        return {};
    }
    return { .value = haystack[match.value], .distance = match.distance };
}

} // namespace xmldoclet
