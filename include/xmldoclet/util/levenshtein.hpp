#ifndef XMLDOCLET_LEVENSHTEIN_HPP
#define XMLDOCLET_LEVENSHTEIN_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <memory_resource>
#include <ranges>
#include <span>
#include <string_view>
#include <vector>

#include "xmldoclet/util/assert.hpp"

namespace xmldoclet {

// https://en.wikipedia.org/wiki/Levenshtein_distance

// clang-format off
template <
    std::ranges::random_access_range R1,
    std::ranges::random_access_range R2,
    std::ranges::random_access_range Matrix
>
  requires std::equality_comparable_with<std::ranges::range_value_t<R1>, std::ranges::range_value_t<R2>>
        && std::integral<std::ranges::range_value_t<Matrix>>
[[nodiscard]]
constexpr std::ranges::range_value_t<Matrix> levenshtein_distance(
    const R1& x,
    const R2& y,
    Matrix&& m // NOLINT(cppcoreguidelines-missing-std-forward)
) {
    const auto x_size = std::size_t(std::ranges::size(x));
    const auto y_size = std::size_t(std::ranges::size(y));

    using result_type = std::ranges::range_value_t<Matrix>;

    const std::size_t required_matrix_size = (x_size + 1) * (y_size + 1);
    XMLDOCLET_ASSERT(std::size_t(std::ranges::size(m)) >= required_matrix_size);

    if (x_size == 0) {
        return result_type(y_size);
    }
    if (y_size == 0) {
        return result_type(x_size);
    }

    const auto matrix = [=, m_begin = std::ranges::begin(m)]
      (std::size_t i, std::size_t j) -> result_type& {
        const std::size_t index = (i * (y_size + 1)) + j;
        XMLDOCLET_DEBUG_ASSERT(index < required_matrix_size);
        return m_begin[std::ranges::range_difference_t<Matrix>(index)];
    };

    for (std::size_t i = 0; i <= x_size; ++i) {
        matrix(i, 0) = result_type(i);
    }
    for (std::size_t j = 0; j <= y_size; ++j) {
        matrix(0, j) = result_type(j);
    }

    const auto x_begin = std::ranges::begin(x);
    const auto y_begin = std::ranges::begin(y);

    for (std::size_t i = 1; i <= x_size; ++i) {
        for (std::size_t j = 1; j <= y_size; ++j) {
            const auto i_minus = std::ranges::range_difference_t<R1>(i - 1);
            const auto j_minus = std::ranges::range_difference_t<R2>(j - 1);
            const auto sub_cost = result_type(x_begin[i_minus] != y_begin[j_minus]);
            matrix(i, j) = std::min({
                matrix(i - 1, j    ) + 1,        // deletion
                matrix(i,     j - 1) + 1,        // insertion
                matrix(i - 1, j - 1) + sub_cost  // substitution
            });
        }
    }

    return matrix(x_size, y_size);
}
// clang-format on

/// @brief Computes the Levenshtein distance between `x` and `y`,
/// where each `char` is one unit of edit.
/// Option names, tag names and class names are ASCII in practice,
/// so no decoding takes place.
[[nodiscard]]
inline std::size_t
levenshtein_distance(std::string_view x, std::string_view y, std::pmr::memory_resource* memory)
{
    std::pmr::vector<std::size_t> matrix((x.size() + 1) * (y.size() + 1), memory);
    return levenshtein_distance(x, y, std::span { matrix });
}

} // namespace xmldoclet

#endif
