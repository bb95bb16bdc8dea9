/**
 * @file Navigator.hpp
 * @brief Destination tree navigation with container auto-creation
 *
 * Walks a destination document along a parsed Path, creating the
 * containers that are missing on the way:
 * - an integer segment grows its array with null placeholders;
 * - a null or missing slot becomes an array when the following segment is
 *   an index, an object otherwise.
 *
 * Existing non-null containers of the right kind are never replaced. A
 * segment that meets the wrong kind of container raises TypeMismatchError.
 */

#ifndef JTL_NAVIGATOR_HPP
#define JTL_NAVIGATOR_HPP

#include "jtl/Errors.hpp"
#include "jtl/Path.hpp"
#include "jtl/Value.hpp"

namespace jtl {

/**
 * @brief Parent container of a path's final segment
 *
 * Both pointers refer into the root and the Path passed to
 * ensure_writable_target(); they stay valid until either is modified.
 * For the root path both are null.
 */
struct WriteTarget {
    Value* parent = nullptr;
    const Segment* last = nullptr;
};

/**
 * @brief Create every container above the final segment
 *
 * @param root Destination document (modified in place)
 * @param path Parsed destination path
 * @return Parent container and final segment; nothing is written there yet
 * @throws TypeMismatchError carrying the path text and segment index
 *
 * Example:
 * ```cpp
 * Value doc = Value::object();
 * auto target = ensure_writable_target(doc, parse_path(".a.b[2].c"));
 * // doc == {"a": {"b": [null, null, {}]}}, *target.last == "c"
 * ```
 */
WriteTarget ensure_writable_target(Value& root, const Path& path);

/**
 * @brief Resolve the slot a write at path lands in
 *
 * Runs ensure_writable_target(), then checks the final parent's kind, grows
 * a final array index with nulls and creates a missing object key holding
 * null. The root path returns the root itself.
 *
 * @throws TypeMismatchError when the final parent has the wrong kind
 */
Value& target_slot(Value& root, const Path& path);

} // namespace jtl

#endif // JTL_NAVIGATOR_HPP
