/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * Implements file loading for:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "jtl/Loader.hpp"
#include "jtl/Errors.hpp"
#include "jtl/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace jtl {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string extension_of(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

/**
 * @brief Convert toml++ value to a JSON value.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

// ---- JSON -> TOML ----------------------------------------------------------

/**
 * @brief TOML integer for a JSON unsigned, or a double when it does not fit
 */
template <typename Sink>
void put_unsigned(Sink&& sink, std::uint64_t u) {
    if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        sink(static_cast<std::int64_t>(u));
    } else {
        sink(static_cast<double>(u));
    }
}

toml::array make_array_from_json(const Value& a);
toml::table make_table_from_json(const Value& o);

/**
 * @brief Hand a JSON scalar to sink as the matching TOML value
 */
template <typename Sink>
void put_scalar(Sink&& sink, const Value& v) {
    if (v.is_string()) {
        sink(v.get<std::string>());
    } else if (v.is_boolean()) {
        sink(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        put_unsigned(sink, v.get<std::uint64_t>());
    } else if (v.is_number_integer()) {
        sink(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        sink(v.get<double>());
    } else {
        // no TOML null
        sink(std::string{});
    }
}

toml::array make_array_from_json(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_table_from_json(elem));
        } else if (elem.is_array()) {
            out.push_back(make_array_from_json(elem));
        } else {
            put_scalar([&out](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); }, elem);
        }
    }
    return out;
}

toml::table make_table_from_json(const Value& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const std::string& k = it.key();
        const Value& v = it.value();
        if (v.is_object()) {
            tbl.insert(k, make_table_from_json(v));
        } else if (v.is_array()) {
            tbl.insert(k, make_array_from_json(v));
        } else {
            put_scalar([&tbl, &k](auto&& x) { tbl.insert(k, std::forward<decltype(x)>(x)); }, v);
        }
    }
    return tbl;
}

toml::table json_to_toml(const Value& j) {
    if (j.is_object()) return make_table_from_json(j);
    Value wrapped = Value::object();
    wrapped["value"] = j;
    return make_table_from_json(wrapped);
}

} // anonymous namespace

// ============================================================================
// Loading
// ============================================================================

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw ParseError(path, details.str());
    }
    return toml_value_to_json(table);
}

Value load_document_file(const std::string& path) {
    if (extension_of(path) == ".toml") {
        return load_toml_file(path);
    }
    return load_json_file(path);
}

// ============================================================================
// Writing
// ============================================================================

OutputFormat parse_output_format(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "json") return OutputFormat::Json;
    if (lower == "toml") return OutputFormat::Toml;
    throw ConfigError("Unsupported output format: '" + name + "' (expected json or toml)");
}

std::string dump_document(const Value& value, OutputFormat format) {
    if (format == OutputFormat::Toml) {
        std::ostringstream oss;
        oss << json_to_toml(value);
        return oss.str();
    }
    return value.dump(2);
}

void write_document_file(const std::string& path, const Value& value, OutputFormat format) {
    const std::string text = dump_document(value, format);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw TransformError("Failed to open for write: " + path);
    }
    ofs << text << "\n";
    if (!ofs) {
        throw TransformError("Failed to write: " + path);
    }
}

// ============================================================================
// FileDocumentSource
// ============================================================================

FileDocumentSource::FileDocumentSource(std::string base_dir)
    : base_dir_(std::move(base_dir))
{}

std::string FileDocumentSource::resolve(const std::string& ref) const {
    const fs::path p(ref);
    if (p.is_absolute() || base_dir_.empty()) {
        return p.string();
    }
    return (fs::path(base_dir_) / p).string();
}

Value FileDocumentSource::read(const std::string& ref) const {
    return load_document_file(resolve(ref));
}

bool FileDocumentSource::exists(const std::string& ref) const {
    return file_exists(resolve(ref));
}

} // namespace jtl
