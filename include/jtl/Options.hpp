/**
 * @file Options.hpp
 * @brief Engine configuration threaded through executor and chain runner
 */

#ifndef JTL_OPTIONS_HPP
#define JTL_OPTIONS_HPP

#include "jtl/Errors.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace jtl {

/**
 * @brief Write discipline of a mapping
 */
enum class Mode {
    Upsert,
    Replace,
};

/**
 * @brief Parse a mode name, case-insensitive
 * @throws UnsupportedModeError for anything but "upsert" / "replace"
 */
Mode parse_mode(const std::string& text);

/**
 * @brief Canonical lowercase name of a mode
 */
const char* mode_name(Mode mode) noexcept;

/**
 * @brief Options for running mappings and chains
 */
struct EngineOptions {
    /// Separator for string upserts when neither mapping nor step overrides it
    std::string delimiter = "\n";

    /// Mode of mappings that do not name one
    Mode default_mode = Mode::Upsert;

    /// Deadline for each expression evaluation; none means unbounded
    std::optional<std::chrono::milliseconds> evaluation_timeout;

    /**
     * @brief Check option values
     * @throws ConfigError on a non-positive timeout
     */
    void validate() const;
};

} // namespace jtl

#endif // JTL_OPTIONS_HPP
