/**
 * @file Util.cpp
 * @brief Escape decoding and string helpers
 */

#include "jtl/Util.hpp"
#include <algorithm>
#include <cctype>

namespace jtl {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Reads `count` hex digits at s[pos]; returns false if any is not hex.
bool read_hex(const std::string& s, size_t pos, size_t count, std::uint32_t& out) {
    if (pos + count > s.size()) return false;
    out = 0;
    for (size_t i = 0; i < count; ++i) {
        int h = hex_value(s[pos + i]);
        if (h < 0) return false;
        out = (out << 4) | static_cast<std::uint32_t>(h);
    }
    return true;
}

} // namespace

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string decode_escapes(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            result += s[i];
            continue;
        }
        char next = s[i + 1];
        std::uint32_t cp = 0;
        switch (next) {
            case 'n': result += '\n'; ++i; break;
            case 't': result += '\t'; ++i; break;
            case 'r': result += '\r'; ++i; break;
            case 'b': result += '\b'; ++i; break;
            case 'f': result += '\f'; ++i; break;
            case 'v': result += '\v'; ++i; break;
            case 'a': result += '\a'; ++i; break;
            case '\\': result += '\\'; ++i; break;
            case '"': result += '"'; ++i; break;
            case '\'': result += '\''; ++i; break;
            case '\n': ++i; break;  // line continuation
            case '0': case '1': case '2': case '3':
            case '4': case '5': case '6': case '7': {
                // up to three octal digits
                size_t j = i + 1;
                while (j < s.size() && j < i + 4 && s[j] >= '0' && s[j] <= '7') {
                    cp = (cp << 3) | static_cast<std::uint32_t>(s[j] - '0');
                    ++j;
                }
                append_utf8(result, cp);
                i = j - 1;
                break;
            }
            case 'x':
                if (read_hex(s, i + 2, 2, cp)) {
                    append_utf8(result, cp);
                    i += 3;
                } else {
                    result += s[i];
                }
                break;
            case 'u':
                if (read_hex(s, i + 2, 4, cp)) {
                    append_utf8(result, cp);
                    i += 5;
                } else {
                    result += s[i];
                }
                break;
            case 'U':
                if (read_hex(s, i + 2, 8, cp) && cp <= 0x10FFFF) {
                    append_utf8(result, cp);
                    i += 9;
                } else {
                    result += s[i];
                }
                break;
            default: result += s[i]; break;
        }
    }
    return result;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace jtl
