/**
 * oino/str.hpp - String helpers shared by the parsers and codecs
 *
 * Part of oinosql - REST resources over SQL tables.
 */

#pragma once

#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace oino {

// ============================================================================
// Case and Whitespace
// ============================================================================

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// ============================================================================
// Splitting and Joining
// ============================================================================

/// Split on every delimiter, keeping empty parts.
inline std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i == s.size() || s[i] == delim) {
            parts.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    return parts;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

inline std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

/**
 * Split by the top level of the given bracket pair.
 *
 * split_by_brackets("a(bc(d))ef(gh)kl", true, true, '(', ')')
 * returns {"a", "bc(d)", "ef", "gh", "kl"}.
 *
 * @param include_between       keep the text between top level blocks
 * @param include_unterminated  keep a trailing block missing its close bracket
 */
inline std::vector<std::string> split_by_brackets(const std::string& s,
                                                  bool include_between,
                                                  bool include_unterminated,
                                                  char open, char close) {
    std::vector<std::string> result;
    int depth = 0;
    size_t start = 0;
    size_t end = 0;
    for (; end < s.size(); ++end) {
        if (s[end] == open) {
            if (depth == 0) {
                if (end > start && include_between) {
                    result.push_back(s.substr(start, end - start));
                }
                start = end + 1;
            }
            ++depth;
        } else if (s[end] == close) {
            --depth;
            if (depth == 0) {
                result.push_back(s.substr(start, end - start));
                start = end + 1;
            }
        }
    }
    if (end > start && ((include_between && depth == 0) ||
                        (include_unterminated && depth > 0))) {
        result.push_back(s.substr(start, end - start));
    }
    return result;
}

/// Split on delimiters that are not nested inside the bracket pair.
inline std::vector<std::string> split_excluding_brackets(const std::string& s, char delim,
                                                         char open, char close) {
    std::vector<std::string> result;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == open) {
            ++depth;
        } else if (s[i] == close) {
            --depth;
        } else if (s[i] == delim && depth == 0) {
            result.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    if (s.size() > start) {
        result.push_back(s.substr(start));
    }
    return result;
}

// ============================================================================
// Numbers
// ============================================================================

/// Whole-string base-10 integer parse. Rejects trailing garbage and overflow.
inline bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = static_cast<int64_t>(v);
    return true;
}

/// Whole-string finite floating point parse.
inline bool parse_double(const std::string& s, double& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

/// Shortest %g text that reads back as the same double.
inline std::string format_double(double v) {
    char buf[40];
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    return buf;
}

// ============================================================================
// Percent Encoding
// ============================================================================

inline std::string percent_escape(unsigned char c) {
    char buf[4];
    std::snprintf(buf, sizeof(buf), "%%%02X", c);
    return buf;
}

/// Same character set as JavaScript encodeURIComponent.
inline std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
            c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
            out += static_cast<char>(c);
        } else {
            out += percent_escape(c);
        }
    }
    return out;
}

inline int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * Decode %XX escapes. With plus_as_space a '+' decodes to a space
 * (application/x-www-form-urlencoded). Throws SerializationError on a
 * truncated or non-hex escape.
 */
inline std::string url_decode(const std::string& s, bool plus_as_space = false) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            int hi = i + 2 < s.size() ? hex_digit(s[i + 1]) : -1;
            int lo = i + 2 < s.size() ? hex_digit(s[i + 2]) : -1;
            if (hi < 0 || lo < 0) {
                throw SerializationError("Malformed percent escape", s.substr(i, 3));
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (c == '+' && plus_as_space) {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

// ============================================================================
// Composite Ids
// ============================================================================

/**
 * Print primary key values as one id. Each value is percent-encoded and
 * the separator is escaped as well, so it only ever appears between parts.
 */
inline std::string print_composite_id(const std::vector<std::string>& values, char separator) {
    const std::string sep(1, separator);
    const std::string escaped = percent_escape(static_cast<unsigned char>(separator));
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += separator;
        out += replace_all(url_encode(values[i]), sep, escaped);
    }
    return out;
}

inline std::vector<std::string> parse_composite_id(const std::string& id, char separator) {
    std::vector<std::string> parts = split(id, separator);
    for (auto& part : parts) {
        part = url_decode(part);
    }
    return parts;
}

} // namespace oino
