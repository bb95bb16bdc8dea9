/**
 * @file Util.hpp
 * @brief String helpers shared by the path parser, spec loader and CLI
 */

#ifndef JTL_UTIL_HPP
#define JTL_UTIL_HPP

#include <cstdint>
#include <string>

namespace jtl {

// Interpret backslash escapes (\n \t \r \b \f \v \a \\ \" \' \ooo \xHH \uXXXX
// \UXXXXXXXX, backslash-newline). Octal takes one to three digits.
// Unknown or truncated escapes, \/ included, keep their backslash.
std::string decode_escapes(const std::string& s);

// Append the UTF-8 encoding of a code point.
void append_utf8(std::string& out, std::uint32_t cp);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);

} // namespace jtl

#endif // JTL_UTIL_HPP
