/**
 * @file Path.hpp
 * @brief Destination path parsing
 *
 * Destination paths are the concrete-lvalue subset of jq paths:
 *
 *   .            the whole document
 *   .name        object key (letter/underscore, then alnum/underscore)
 *   [3]          array index
 *   ["a b"]      quoted object key, backslash escapes allowed
 *   ['a b']      same, single-quoted
 *
 * No wildcards, slices or filters.
 */

#ifndef JTL_PATH_HPP
#define JTL_PATH_HPP

#include "jtl/Errors.hpp"
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace jtl {

/**
 * @brief One path step: array index or object key
 */
using Segment = std::variant<std::size_t, std::string>;

/**
 * @brief Ordered segment sequence; empty means the document root
 */
using Path = std::vector<Segment>;

inline bool is_index(const Segment& seg) noexcept {
    return std::holds_alternative<std::size_t>(seg);
}

inline bool is_key(const Segment& seg) noexcept {
    return std::holds_alternative<std::string>(seg);
}

/**
 * @brief Parse a destination path into segments
 *
 * @param text Path text, must start with '.'
 * @return Segment sequence (empty for ".")
 * @throws SyntaxError naming the unmatched remainder and its offset
 *
 * Examples:
 * - ".a.b[2].c" → ["a", "b", 2, "c"]
 * - ".foo[\"bar baz\"][0]" → ["foo", "bar baz", 0]
 * - "." → []
 * - "a.b" → SyntaxError
 */
Path parse_path(const std::string& text);

/**
 * @brief Render segments back to canonical path text
 *
 * Keys that are valid identifiers render as ".name", others as ["..."]
 * with JSON escaping. The root renders as ".".
 */
std::string format_path(const Path& path);

} // namespace jtl

#endif // JTL_PATH_HPP
