/**
 * @file Splice.cpp
 * @brief Implementation of optimistic text splicing
 */

#include "sjson/Splice.hpp"
#include "sjson/DotPath.hpp"
#include "sjson/Parse.hpp"

namespace sjson {

namespace {
    bool is_ws(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    std::string key_pattern(const std::string& segment) {
        return "\"" + segment + "\":";
    }

    /**
     * @brief Values that can be spliced without surrounding quotes
     *
     * Anything parse_literal() would not store as a string is written
     * bare, so both routes agree on the literal's type.
     */
    bool is_self_delimited(const std::string& value) {
        if (!value.empty() && value.front() == '"') {
            return true;
        }
        return !parse_literal(value).is_string();
    }
}

bool is_optimistic_path(const std::string& path) {
    for (char ch : path) {
        if (ch < '.' || ch > 'z') return false;
        if (ch > '9' && ch < 'A') return false;
    }
    return true;
}

std::size_t find_value_end(const std::string& text, std::size_t start) {
    int depth = 0;
    bool in_string = false;
    bool escape_next = false;

    for (std::size_t i = start; i < text.size(); ++i) {
        const char ch = text[i];

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (in_string) {
            if (ch == '\\') {
                escape_next = true;
            } else if (ch == '"') {
                in_string = false;
            }
            continue;
        }

        switch (ch) {
            case '"':
                in_string = true;
                break;
            case '{':
            case '[':
                ++depth;
                break;
            case '}':
            case ']':
                if (depth == 0) {
                    // Closer of the enclosing container
                    return i;
                }
                if (--depth == 0) {
                    return i + 1;
                }
                break;
            case ',':
                if (depth == 0) {
                    return i;
                }
                break;
            default:
                break;
        }
    }

    return text.size();
}

std::optional<ValueSpan> find_value_span(const std::string& json, const std::string& path) {
    const auto segments = split_dot_path(path);
    std::size_t cursor = 0;

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const std::string pattern = key_pattern(segments[i]);
        const std::size_t key_pos = json.find(pattern, cursor);
        if (key_pos == std::string::npos) {
            return std::nullopt;
        }

        std::size_t value_start = key_pos + pattern.size();
        while (value_start < json.size() && is_ws(json[value_start])) {
            ++value_start;
        }

        if (i + 1 == segments.size()) {
            std::size_t value_end = find_value_end(json, value_start);
            while (value_end > value_start && is_ws(json[value_end - 1])) {
                --value_end;
            }
            return ValueSpan{value_start, value_end};
        }
        cursor = value_start;
    }

    return std::nullopt;
}

std::string splice_set(const std::string& json, const ValueSpan& span,
                       const std::string& value, bool quote_bare) {
    const bool quote = quote_bare && !is_self_delimited(value);

    std::string result;
    result.reserve(json.size() - (span.end - span.start) + value.size() + 2);
    result.append(json, 0, span.start);
    if (quote) {
        result.push_back('"');
        result.append(value);
        result.push_back('"');
    } else {
        result.append(value);
    }
    result.append(json, span.end, std::string::npos);
    return result;
}

std::string splice_delete(const std::string& json, const ValueSpan& span,
                          const std::string& key) {
    const std::string pattern = key_pattern(key);

    std::size_t key_start = span.start;
    if (span.start >= pattern.size()) {
        const std::size_t found = json.rfind(pattern, span.start - pattern.size());
        if (found != std::string::npos) {
            key_start = found;
        }
    }

    std::size_t cut_start = key_start;
    std::size_t cut_end = span.end;

    // Prior sibling: drop ", key: value"
    std::size_t back = key_start;
    while (back > 0 && is_ws(json[back - 1])) {
        --back;
    }
    if (back > 0 && json[back - 1] == ',') {
        cut_start = back - 1;
        while (cut_start > 0 && is_ws(json[cut_start - 1])) {
            --cut_start;
        }
    } else {
        // First member: drop "key: value, "
        std::size_t fwd = span.end;
        while (fwd < json.size() && is_ws(json[fwd])) {
            ++fwd;
        }
        if (fwd < json.size() && json[fwd] == ',') {
            cut_end = fwd + 1;
            while (cut_end < json.size() && is_ws(json[cut_end])) {
                ++cut_end;
            }
        }
    }

    std::string result;
    result.reserve(json.size() - (cut_end - cut_start));
    result.append(json, 0, cut_start);
    result.append(json, cut_end, std::string::npos);
    return result;
}

std::optional<std::string> optimistic_set(const std::string& json, const std::string& path,
                                          const std::string& value, bool quote_bare) {
    if (!is_optimistic_path(path)) {
        return std::nullopt;
    }
    const auto span = find_value_span(json, path);
    if (!span) {
        return std::nullopt;
    }
    return splice_set(json, *span, value, quote_bare);
}

std::optional<std::string> optimistic_delete(const std::string& json, const std::string& path) {
    if (!is_optimistic_path(path)) {
        return std::nullopt;
    }
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        return std::nullopt;
    }
    const auto span = find_value_span(json, path);
    if (!span) {
        return std::nullopt;
    }
    return splice_delete(json, *span, segments.back());
}

} // namespace sjson
