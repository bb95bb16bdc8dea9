/**
 * @file Options.cpp
 * @brief Mode parsing and option validation
 */

#include "jtl/Options.hpp"
#include "jtl/Util.hpp"

namespace jtl {

Mode parse_mode(const std::string& text) {
    const std::string lower = to_lower(text);
    if (lower == "upsert") return Mode::Upsert;
    if (lower == "replace") return Mode::Replace;
    throw UnsupportedModeError(text);
}

const char* mode_name(Mode mode) noexcept {
    switch (mode) {
        case Mode::Upsert: return "upsert";
        case Mode::Replace: return "replace";
    }
    return "unknown";
}

void EngineOptions::validate() const {
    if (evaluation_timeout && evaluation_timeout->count() <= 0) {
        throw ConfigError("evaluation timeout must be positive, got " +
                          std::to_string(evaluation_timeout->count()) + " ms");
    }
}

} // namespace jtl
