/**
 * @file Merge.cpp
 * @brief Implementation of write disciplines and deep merge
 */

#include "jtl/Merge.hpp"

#include <utility>

namespace jtl {

void deep_merge(Value& target, const Value& overlay) {
    std::vector<std::pair<Value*, const Value*>> stack;
    stack.emplace_back(&target, &overlay);

    while (!stack.empty()) {
        auto [dst, src] = stack.back();
        stack.pop_back();

        if (!dst->is_object() || !src->is_object()) {
            *dst = *src;
            continue;
        }

        // Insert every new key before taking child pointers: inserting into
        // an ordered object may move its existing members.
        std::vector<std::pair<std::string, const Value*>> nested;
        for (auto it = src->begin(); it != src->end(); ++it) {
            auto found = dst->find(it.key());
            if (found != dst->end() && found->is_object() && it->is_object()) {
                nested.emplace_back(it.key(), &it.value());
            } else {
                (*dst)[it.key()] = it.value();
            }
        }
        for (const auto& [key, child] : nested) {
            stack.emplace_back(&(*dst)[key], child);
        }
    }
}

Value deep_merge_all(const std::vector<Value>& sources) {
    Value result = Value::object();
    for (const auto& source : sources) {
        deep_merge(result, source);
    }
    return result;
}

Value replace_value(const Value& /*existing*/, const Value& incoming) {
    return incoming;
}

Value upsert_value(Value existing, const Value& incoming, const std::string& delimiter) {
    if (existing.is_null()) {
        return incoming;
    }

    if (existing.is_string() && incoming.is_string()) {
        const auto& head = existing.get_ref<const std::string&>();
        const auto& tail = incoming.get_ref<const std::string&>();
        if (head.empty()) return incoming;
        if (tail.empty()) return existing;
        return Value(head + delimiter + tail);
    }

    if (existing.is_array()) {
        if (incoming.is_array()) {
            for (const auto& item : incoming) {
                existing.push_back(item);
            }
        } else {
            existing.push_back(incoming);
        }
        return existing;
    }

    if (existing.is_object() && incoming.is_object()) {
        deep_merge(existing, incoming);
        return existing;
    }

    // Type mismatch or scalar pair: last write wins
    return incoming;
}

} // namespace jtl
