/**
 * @file Navigator.cpp
 * @brief Implementation of destination navigation
 */

#include "jtl/Navigator.hpp"

namespace jtl {

namespace {

/**
 * @brief Fresh container for a slot whose next segment is `next`
 */
Value container_for(const Segment& next) {
    return is_index(next) ? Value::array() : Value::object();
}

/**
 * @brief Step from `current` into the child named by path[i]
 *
 * A null `current` is turned into the container kind the segment needs.
 * When `create_child` is set, a null or missing child is instantiated as
 * the container kind path[i + 1] requires.
 */
Value* descend(Value* current, const Path& path, size_t i, bool create_child) {
    const Segment& seg = path[i];

    if (current->is_null()) {
        *current = container_for(seg);
    }

    if (is_index(seg)) {
        if (!current->is_array()) {
            throw TypeMismatchError(format_path(path), i, "array", type_name(*current));
        }
        const auto index = std::get<std::size_t>(seg);
        while (current->size() <= index) {
            current->push_back(nullptr);
        }
        Value& child = (*current)[index];
        if (create_child && child.is_null()) {
            child = container_for(path[i + 1]);
        }
        return &child;
    }

    if (!current->is_object()) {
        throw TypeMismatchError(format_path(path), i, "object", type_name(*current));
    }
    const auto& key = std::get<std::string>(seg);
    Value& child = (*current)[key];
    if (create_child && child.is_null()) {
        child = container_for(path[i + 1]);
    }
    return &child;
}

} // namespace

WriteTarget ensure_writable_target(Value& root, const Path& path) {
    if (path.empty()) {
        return {};
    }

    Value* current = &root;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        current = descend(current, path, i, true);
    }

    // The final parent gets the same null-slot treatment as intermediates.
    const Segment& last = path.back();
    if (current->is_null()) {
        *current = container_for(last);
    }
    return WriteTarget{current, &last};
}

Value& target_slot(Value& root, const Path& path) {
    if (path.empty()) {
        return root;
    }

    WriteTarget target = ensure_writable_target(root, path);
    return *descend(target.parent, path, path.size() - 1, false);
}

} // namespace jtl
