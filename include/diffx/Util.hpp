#ifndef DIFFX_UTIL_HPP
#define DIFFX_UTIL_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace diffx {

// ASCII lower-casing; bytes >= 0x80 are left alone.
std::string to_lower(std::string s);

// Strip leading/trailing spaces, tabs, CR and LF.
std::string trim(std::string_view s);

// Trim, then collapse every run of whitespace into a single space.
std::string collapse_whitespace(std::string_view s);

// True when s is non-empty and every byte is an ASCII digit.
bool is_digits(std::string_view s);

// 1-based line and column of a byte offset inside text.
std::pair<std::size_t, std::size_t> line_column_at(std::string_view text, std::size_t offset);

} // namespace diffx

#endif // DIFFX_UTIL_HPP
