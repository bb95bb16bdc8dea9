/**
 * @file Path.cpp
 * @brief Implementation of destination path parsing
 */

#include "jtl/Path.hpp"
#include "jtl/Util.hpp"
#include "jtl/Value.hpp"

#include <cctype>

namespace jtl {

namespace {

bool is_ident_start(char c) {
    return c == '_' || std::isalpha(static_cast<unsigned char>(c));
}

bool is_ident_part(char c) {
    return c == '_' || std::isalnum(static_cast<unsigned char>(c));
}

bool is_identifier(const std::string& s) {
    if (s.empty() || !is_ident_start(s[0])) return false;
    for (char c : s) {
        if (!is_ident_part(c)) return false;
    }
    return true;
}

void skip_spaces(const std::string& text, size_t& pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
}

/**
 * @brief Try to match one token at pos
 * @return true and advance pos on a match; false leaves pos untouched
 */
bool match_token(const std::string& text, size_t& pos, Path& out) {
    size_t i = pos;

    // .identifier
    if (text[i] == '.') {
        ++i;
        if (i >= text.size() || !is_ident_start(text[i])) return false;
        size_t start = i;
        while (i < text.size() && is_ident_part(text[i])) ++i;
        out.emplace_back(text.substr(start, i - start));
        pos = i;
        return true;
    }

    if (text[i] != '[') return false;
    ++i;
    skip_spaces(text, i);
    if (i >= text.size()) return false;

    // [digits]
    if (std::isdigit(static_cast<unsigned char>(text[i]))) {
        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        std::string digits = text.substr(start, i - start);
        skip_spaces(text, i);
        if (i >= text.size() || text[i] != ']') return false;
        std::size_t index = 0;
        try {
            index = static_cast<std::size_t>(std::stoull(digits));
        } catch (const std::out_of_range&) {
            return false;
        }
        out.emplace_back(index);
        pos = i + 1;
        return true;
    }

    // ["..."] or ['...']
    char quote = text[i];
    if (quote != '"' && quote != '\'') return false;
    ++i;
    size_t start = i;
    while (i < text.size() && text[i] != quote) {
        if (text[i] == '\\') {
            if (i + 1 >= text.size()) return false;
            ++i;
        }
        ++i;
    }
    if (i >= text.size()) return false;
    std::string raw = text.substr(start, i - start);
    ++i;
    skip_spaces(text, i);
    if (i >= text.size() || text[i] != ']') return false;
    out.emplace_back(decode_escapes(raw));
    pos = i + 1;
    return true;
}

} // namespace

Path parse_path(const std::string& text) {
    if (text.empty() || text[0] != '.') {
        throw SyntaxError(text, 0, "Destination path must start with '.'");
    }
    if (text == ".") {
        return {};
    }

    Path segments;
    size_t pos = 0;
    while (pos < text.size()) {
        if (!match_token(text, pos, segments)) {
            throw SyntaxError(text, pos, "Unsupported or non-concrete destination path");
        }
    }
    return segments;
}

std::string format_path(const Path& path) {
    if (path.empty()) {
        return ".";
    }

    std::string out;
    for (const auto& seg : path) {
        if (is_index(seg)) {
            out += '[' + std::to_string(std::get<std::size_t>(seg)) + ']';
            continue;
        }
        const auto& key = std::get<std::string>(seg);
        if (is_identifier(key)) {
            out += '.' + key;
        } else {
            out += '[' + Value(key).dump() + ']';
        }
    }
    return out;
}

} // namespace jtl
