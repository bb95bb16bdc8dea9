/**
 * @file Merge.hpp
 * @brief Write disciplines and deep merge
 *
 * upsert is intentionally non-commutative: strings concatenate and arrays
 * extend in application order.
 */

#ifndef JTL_MERGE_HPP
#define JTL_MERGE_HPP

#include "jtl/Value.hpp"
#include <string>
#include <vector>

namespace jtl {

/**
 * @brief Deep merge overlay into target, in place
 *
 * Merging rules:
 * - Both objects: for every key of overlay, merge recursively when both
 *   sides hold objects, otherwise overwrite with a copy of overlay's value
 * - Keys absent from overlay are untouched
 * - Either side not an object: target becomes a copy of overlay
 *
 * Runs on an explicit work stack, so nesting depth is not limited by the
 * call stack.
 *
 * Example:
 * ```cpp
 * Value base = {{"db", {{"host", "a"}, {"port", 1}}}};
 * deep_merge(base, {{"db", {{"port", 2}}}});
 * // base == {"db": {"host": "a", "port": 2}}
 * ```
 */
void deep_merge(Value& target, const Value& overlay);

/**
 * @brief Deep merge several sources in precedence order
 *
 * @param sources Values from lowest to highest precedence
 * @return Merged result ({} when sources is empty)
 */
Value deep_merge_all(const std::vector<Value>& sources);

/**
 * @brief replace discipline: the existing value is discarded
 * @return Deep copy of incoming
 */
Value replace_value(const Value& existing, const Value& incoming);

/**
 * @brief upsert discipline: type-aware incremental merge
 *
 * Cases, first match wins:
 * 1. existing null → copy of incoming
 * 2. both strings → "" on either side yields the other,
 *    otherwise existing + delimiter + incoming
 * 3. existing array → incoming array is concatenated, anything else
 *    is appended as one element
 * 4. both objects → deep_merge(existing, incoming)
 * 5. otherwise → copy of incoming (last write wins)
 *
 * @param existing Current value, taken by value so callers can move it in
 * @param incoming New value; never aliased by the result
 * @param delimiter Separator for string concatenation
 * @return Value to store back
 */
Value upsert_value(Value existing, const Value& incoming, const std::string& delimiter);

} // namespace jtl

#endif // JTL_MERGE_HPP
