/**
 * @file Parse.cpp
 * @brief Implementation of literal type inference
 */

#include "sjson/Parse.hpp"
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace sjson {

namespace {
    const std::regex& integer_pattern() {
        static const std::regex re("-?(0|[1-9][0-9]*)");
        return re;
    }

    const std::regex& number_pattern() {
        static const std::regex re("-?(0|[1-9][0-9]*)(\\.[0-9]+)?([eE][+-]?[0-9]+)?");
        return re;
    }
}

bool is_json_number(const std::string& str) {
    return !str.empty() && std::regex_match(str, number_pattern());
}

Value parse_literal(const std::string& str) {
    if (str.empty()) {
        return ""; // L6: empty string stays as string
    }

    // L1: Boolean
    if (str == "true") {
        return true;
    }
    if (str == "false") {
        return false;
    }

    // L2: Null
    if (str == "null") {
        return nullptr;
    }

    // L3: Integer
    if (std::regex_match(str, integer_pattern())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too wide for int64, retry as float
        }
    }

    // L4: Float. Underflow rounds toward zero and is still a number;
    // overflow has no finite value and stays a string.
    if (is_json_number(str)) {
        char* end = nullptr;
        const double val = std::strtod(str.c_str(), &end);
        if (end == str.c_str() + str.size() && std::isfinite(val)) {
            return val;
        }
    }

    // L5: JSON Compound (objects and arrays)
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        try {
            return Value::parse(str);
        } catch (const Value::exception&) {
            // Syntax error or number overflow, fall through to raw string
        }
    }

    // L6: Raw String
    return str;
}

} // namespace sjson
