#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <random>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "xmldoclet/util/levenshtein.hpp"

namespace xmldoclet {
namespace {

TEST(Levenshtein, empty)
{
    constexpr std::string_view x;
    constexpr std::string_view y;
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 0);
}

TEST(Levenshtein, create)
{
    constexpr std::string_view x;
    constexpr std::string_view y = "abcdefg";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 7);
}

TEST(Levenshtein, zero_distance)
{
    constexpr std::string_view x = "abcdefg";
    constexpr std::string_view y = "abcdefg";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 0);
}

TEST(Levenshtein, pure_prepend)
{
    constexpr std::string_view x = "abc";
    constexpr std::string_view y = "12345abc";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 5);
}

TEST(Levenshtein, pure_append)
{
    constexpr std::string_view x = "abc";
    constexpr std::string_view y = "abc12345";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 5);
}

TEST(Levenshtein, insert)
{
    constexpr std::string_view x = "abcd";
    constexpr std::string_view y = "a1b2c3d";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 3);
}

TEST(Levenshtein, substitute)
{
    constexpr std::string_view x = "-taglet";
    constexpr std::string_view y = "-tagled";
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(x, y, &memory), 1);
}

// Verifies that distance computation is commutative.
TEST(Levenshtein, commutative_fuzzing)
{
    constexpr int iterations = 100;

    std::pmr::monotonic_buffer_resource memory;

    std::default_random_engine rng { 12345 };
    std::uniform_int_distribution<unsigned> distr { 0, 127 };

    for (int i = 0; i < iterations; ++i) {
        memory.release();

        std::pmr::string x { &memory };
        std::pmr::string y { &memory };

        x.resize(distr(rng) % 32);
        y.resize(distr(rng) % 32);

        for (char& c : x) {
            c = char(distr(rng));
        }
        for (char& c : y) {
            c = char(distr(rng));
        }

        const std::size_t xy = levenshtein_distance(x, y, &memory);
        const std::size_t yx = levenshtein_distance(y, x, &memory);

        EXPECT_EQ(xy, yx);
        EXPECT_LE(xy, std::max(x.size(), y.size()));
    }
}

} // namespace
} // namespace xmldoclet
