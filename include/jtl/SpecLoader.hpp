/**
 * @file SpecLoader.hpp
 * @brief Normalizing raw ETL spec values into EtlSpec
 *
 * Two spec shapes are accepted:
 *
 * List form, each element classified by its keys:
 * ```json
 * [
 *   {"ctx": {"region": "eu"}},
 *   {"with": "def up: ascii_upcase;"},
 *   {"src": ".name | up", "dst": ".customer.name"},
 *   {"src": ".tags[]", "dst": ".labels", "mode": "replace"}
 * ]
 * ```
 *
 * Object form:
 * ```json
 * {"mappings": [...], "ctx": {...}, "with": "..."}
 * ```
 *
 * Every `ctx` entry of the list form is deep-merged in document order; the
 * last `with` entry wins.
 */

#ifndef JTL_SPEC_LOADER_HPP
#define JTL_SPEC_LOADER_HPP

#include "jtl/Mapping.hpp"
#include "jtl/Value.hpp"

namespace jtl {

/**
 * @brief Build an EtlSpec from a parsed spec document
 *
 * @throws FormatError when the top level or an entry has the wrong shape
 * @throws MissingRequiredFieldError when a mapping lacks src or dst
 * @throws UnsupportedModeError when a mapping names an unknown mode
 *
 * Errors raised for a mapping carry its 1-based index among the mappings.
 */
EtlSpec load_etl_spec(const Value& raw);

/**
 * @brief Build one Mapping from its object form
 *
 * `delimiter` escapes are decoded, so "\\t" yields a tab. A null `mode` or
 * `delimiter` counts as absent.
 */
Mapping load_mapping(const Value& raw);

} // namespace jtl

#endif // JTL_SPEC_LOADER_HPP
