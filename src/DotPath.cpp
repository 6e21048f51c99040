/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "sjson/DotPath.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace sjson {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    // Add final segment
    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::vector<std::string> require_dot_path(const std::string& path) {
    auto segments = split_dot_path(path);
    if (segments.empty()) {
        throw EmptyPathError();
    }
    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {
    /**
     * @brief Check if segment is an optionally signed run of digits
     */
    bool is_integer_segment(const std::string& segment) {
        size_t start = 0;
        if (!segment.empty() && (segment[0] == '-' || segment[0] == '+')) {
            start = 1;
        }
        if (start >= segment.size()) return false;
        return std::all_of(segment.begin() + static_cast<std::ptrdiff_t>(start),
                           segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }
}

std::size_t resolve_array_index(const std::string& segment, std::size_t length) {
    if (!is_integer_segment(segment)) {
        throw NonNumericArrayKeyError(segment);
    }

    int64_t index = 0;
    try {
        size_t pos = 0;
        index = static_cast<int64_t>(std::stoll(segment, &pos));
        if (pos != segment.size()) {
            throw NonNumericArrayKeyError(segment);
        }
    } catch (const std::out_of_range&) {
        throw NonNumericArrayKeyError(segment);
    }

    if (index >= 0) {
        return static_cast<std::size_t>(index);
    }

    // -1 is the last element; INT64_MIN cannot be negated, and is out of
    // range for any array anyway
    if (index == INT64_MIN ||
        static_cast<uint64_t>(-index) > static_cast<uint64_t>(length)) {
        throw InvalidPathError(segment,
            "invalid path: index '" + segment + "' out of range for array of length " +
            std::to_string(length));
    }
    return length - static_cast<std::size_t>(-index);
}

} // namespace sjson
