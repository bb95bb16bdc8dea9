/**
 * @file SpecLoader.cpp
 * @brief Implementation of ETL spec loading
 */

#include "jtl/SpecLoader.hpp"
#include "jtl/Errors.hpp"
#include "jtl/Merge.hpp"
#include "jtl/Util.hpp"

namespace jtl {

namespace {

enum class EntryKind {
    Context,
    Prelude,
    Mapping,
};

/**
 * @brief Classify a list-form element by its keys
 *
 * Only single-key objects are directives; everything else is a mapping.
 */
EntryKind classify(const Value& entry) {
    if (entry.is_object() && entry.size() == 1) {
        if (entry.contains("ctx")) return EntryKind::Context;
        if (entry.contains("with")) return EntryKind::Prelude;
    }
    return EntryKind::Mapping;
}

void merge_context(Value& context, const Value& raw) {
    if (raw.is_null()) {
        return;
    }
    if (!raw.is_object()) {
        throw FormatError("'ctx' must be an object, got " + type_name(raw));
    }
    deep_merge(context, raw);
}

std::string read_prelude(const Value& raw) {
    if (raw.is_null()) {
        return "";
    }
    if (!raw.is_string()) {
        throw FormatError("'with' must be a string, got " + type_name(raw));
    }
    return trim(raw.get<std::string>());
}

std::string required_string(const Value& entry, const char* field) {
    auto it = entry.find(field);
    if (it == entry.end()) {
        throw MissingRequiredFieldError(field, "mapping");
    }
    if (!it->is_string()) {
        throw FormatError(std::string("mapping field '") + field +
                          "' must be a string, got " + type_name(*it));
    }
    return it->get<std::string>();
}

void append_mapping(EtlSpec& spec, const Value& raw) {
    try {
        spec.mappings.push_back(load_mapping(raw));
    } catch (TransformError& e) {
        e.set_mapping(spec.mappings.size() + 1);
        throw;
    }
}

} // namespace

Mapping load_mapping(const Value& raw) {
    if (!raw.is_object()) {
        throw FormatError("mapping must be an object, got " + type_name(raw));
    }

    Mapping mapping;
    mapping.source = required_string(raw, "src");
    mapping.destination = required_string(raw, "dst");

    auto mode = raw.find("mode");
    if (mode != raw.end() && !mode->is_null()) {
        if (!mode->is_string()) {
            throw UnsupportedModeError(mode->dump());
        }
        mapping.mode = parse_mode(mode->get<std::string>());
    }

    auto delimiter = raw.find("delimiter");
    if (delimiter != raw.end() && !delimiter->is_null()) {
        if (!delimiter->is_string()) {
            throw FormatError("mapping field 'delimiter' must be a string, got " +
                              type_name(*delimiter));
        }
        mapping.delimiter = decode_escapes(delimiter->get<std::string>());
    }

    return mapping;
}

EtlSpec load_etl_spec(const Value& raw) {
    EtlSpec spec;

    if (raw.is_array()) {
        for (const auto& entry : raw) {
            switch (classify(entry)) {
                case EntryKind::Context:
                    merge_context(spec.context, entry.at("ctx"));
                    break;
                case EntryKind::Prelude:
                    spec.prelude = read_prelude(entry.at("with"));
                    break;
                case EntryKind::Mapping:
                    append_mapping(spec, entry);
                    break;
            }
        }
        return spec;
    }

    if (raw.is_object()) {
        auto ctx = raw.find("ctx");
        if (ctx != raw.end()) {
            merge_context(spec.context, *ctx);
        }

        auto with = raw.find("with");
        if (with != raw.end()) {
            spec.prelude = read_prelude(*with);
        }

        auto mappings = raw.find("mappings");
        if (mappings != raw.end() && !mappings->is_null()) {
            if (!mappings->is_array()) {
                throw FormatError("'mappings' must be an array, got " + type_name(*mappings));
            }
            for (const auto& entry : *mappings) {
                append_mapping(spec, entry);
            }
        }
        return spec;
    }

    throw FormatError("ETL spec must be an array or object, got " + type_name(raw));
}

} // namespace jtl
