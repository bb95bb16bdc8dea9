/**
 * @file Value.hpp
 * @brief Value type for documents, contexts and spec files
 *
 * Uses nlohmann::ordered_json as the underlying value model so that object
 * keys keep their insertion order through every transformation:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 */

#ifndef JTL_VALUE_HPP
#define JTL_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace jtl {

/**
 * @brief JSON value type used throughout the engine
 *
 * Copy construction and copy assignment are deep, which is what gives the
 * engine its no-aliasing guarantee between source, context and destination.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "number", "string",
 *         "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number()) return "number";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace jtl

#endif // JTL_VALUE_HPP
