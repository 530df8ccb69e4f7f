#ifndef XMLDOCLET_ANSI_HPP
#define XMLDOCLET_ANSI_HPP

#include <string_view>

namespace xmldoclet::ansi {

// Regular colors

inline constexpr std::string_view black = "\x1B[30m";
inline constexpr std::string_view red = "\x1B[31m";
inline constexpr std::string_view blue = "\x1B[34m";
inline constexpr std::string_view magenta = "\x1B[35m";

// High-intensity colors

inline constexpr std::string_view h_black = "\x1B[0;90m";
inline constexpr std::string_view h_red = "\x1B[0;91m";
inline constexpr std::string_view h_yellow = "\x1B[0;93m";

// Other sequences

inline constexpr std::string_view reset = "\033[0m";

} // namespace xmldoclet::ansi

#endif
