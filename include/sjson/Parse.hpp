/**
 * @file Parse.hpp
 * @brief Literal-to-Value type inference for the bare-string set
 *
 * Parsing order (first match wins):
 * - L1: Boolean ("true", "false" - exact, case sensitive)
 * - L2: Null ("null" - exact)
 * - L3: Integer (JSON integer grammar, fits in int64)
 * - L4: Float (JSON number grammar, finite; underflow rounds toward zero)
 * - L5: JSON Compound ({...} or [...], must parse)
 * - L6: Raw String (fallback, verbatim)
 *
 * This is a heuristic, not declared typing. Leading-zero text such as
 * "037", signed text such as "+5", and "NaN"/"Infinity" all stay strings.
 * Callers who need a guaranteed type should use set_raw(), set_bool(),
 * set_int(), set_float() or set_value() instead of set().
 */

#ifndef SJSON_PARSE_HPP
#define SJSON_PARSE_HPP

#include "sjson/Value.hpp"
#include <string>

namespace sjson {

/**
 * @brief Infer a typed Value from a bare literal
 *
 * @param str Literal text as passed to set()
 * @return Parsed Value with appropriate type
 *
 * Examples:
 * ```cpp
 * parse_literal("true")       // → true (boolean)
 * parse_literal("True")       // → "True" (string)
 * parse_literal("null")       // → null
 * parse_literal("42")         // → 42 (integer)
 * parse_literal("-17")        // → -17 (integer)
 * parse_literal("037")        // → "037" (string)
 * parse_literal("3.14")       // → 3.14 (float)
 * parse_literal("-2.5e10")    // → -2.5e10 (float)
 * parse_literal("NaN")        // → "NaN" (string)
 * parse_literal("1e400")      // → "1e400" (string, overflows a double)
 * parse_literal("1e-400")     // → 0.0 (float)
 * parse_literal("{\"a\":1}")  // → {"a": 1} (object)
 * parse_literal("[1,2")       // → "[1,2" (string)
 * parse_literal("Jerry")      // → "Jerry" (string)
 * parse_literal("")           // → "" (empty string)
 * ```
 */
Value parse_literal(const std::string& str);

/**
 * @brief Check whether text is a number under the JSON grammar
 *
 * Matches -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)? exactly.
 *
 * @param str Text to check
 * @return true if str is a JSON number literal
 */
bool is_json_number(const std::string& str);

} // namespace sjson

#endif // SJSON_PARSE_HPP
