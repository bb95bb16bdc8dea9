/**
 * @file Loader.hpp
 * @brief Document file loading and writing
 *
 * Supported formats:
 * - JSON files (using nlohmann::json), object key order preserved
 * - TOML files (using toml++), selected by the .toml extension
 *
 * Output is pretty-printed JSON (two-space indent, UTF-8 kept verbatim) or
 * TOML on request.
 */

#ifndef JTL_LOADER_HPP
#define JTL_LOADER_HPP

#include "jtl/Chain.hpp"
#include "jtl/Value.hpp"
#include <string>

namespace jtl {

// ============================================================================
// Loading
// ============================================================================

/**
 * @brief Check that path names an existing regular file
 */
bool file_exists(const std::string& path);

/**
 * @brief Load a JSON file
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file as a JSON object
 *
 * Dates and times become their TOML text form.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid (line and column included)
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, choosing the format by extension
 *
 * ".toml" (any case) loads as TOML, everything else as JSON.
 */
Value load_document_file(const std::string& path);

// ============================================================================
// Writing
// ============================================================================

enum class OutputFormat {
    Json,
    Toml,
};

/**
 * @brief Parse "json" / "toml", case-insensitive
 * @throws ConfigError for any other name
 */
OutputFormat parse_output_format(const std::string& name);

/**
 * @brief Render a document as text
 *
 * TOML needs a table at the root: a non-object document is wrapped under
 * the key "value". TOML has no null, so null is written as "".
 */
std::string dump_document(const Value& value, OutputFormat format);

/**
 * @brief Write dump_document() output to a file, newline-terminated
 * @throws TransformError if the file cannot be opened for writing
 */
void write_document_file(const std::string& path, const Value& value, OutputFormat format);

// ============================================================================
// File-backed document source
// ============================================================================

/**
 * @brief DocumentSource reading files relative to a base directory
 *
 * Absolute references are used as-is. An empty base directory resolves
 * against the working directory.
 */
class FileDocumentSource : public DocumentSource {
public:
    explicit FileDocumentSource(std::string base_dir = "");

    Value read(const std::string& ref) const override;
    bool exists(const std::string& ref) const override;

    /// Path a reference resolves to
    std::string resolve(const std::string& ref) const;

private:
    std::string base_dir_;
};

} // namespace jtl

#endif // JTL_LOADER_HPP
