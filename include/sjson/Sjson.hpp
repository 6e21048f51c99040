/**
 * @file Sjson.hpp
 * @brief Set and delete JSON values by dot-path
 *
 * A path is a series of keys separated by dots, such as "name.last" or
 * "children.1". When a segment meets an array it is read as an index;
 * negative indices count from the end ("children.-1" is the last child).
 *
 * ```json
 * {
 *   "name": {"first": "Tom", "last": "Anderson"},
 *   "age": 37,
 *   "children": ["Sara", "Alex", "Jack"]
 * }
 * ```
 * - "name.last"   >> "Anderson"
 * - "age"         >> 37
 * - "children.1"  >> "Alex"
 * - "children.-1" >> "Jack"
 *
 * Two routes produce the result:
 * - Authoritative (default): parse, mutate the tree, serialize. Always
 *   correct, but object keys come out in lexicographic order because
 *   the tree's objects are sorted maps.
 * - Optimistic (Options::optimistic): find the existing value's bytes
 *   in the text and splice the new value in place, preserving key
 *   order and formatting. If the path's characters are unusual or the
 *   value cannot be found as text, the authoritative route runs instead.
 *
 * The two routes agree on the resulting tree for every path the
 * optimistic route resolves, with these documented exceptions:
 * - A key text that first occurs somewhere other than the intended
 *   object is matched anyway.
 * - Bare string literals spliced by set() are quoted without escaping.
 *   Pre-escape '"' and '\' when using the optimistic route.
 * - A literal that already starts with '"' is spliced as-is, while the
 *   authoritative route stores it as a string containing the quotes.
 *
 * A positive index past the end of an array extends it with nulls, with
 * no cap beyond the array's max_size(). An index of max_size() or more
 * raises InvalidPathError; a smaller but still huge index can exhaust
 * memory.
 */

#ifndef SJSON_SJSON_HPP
#define SJSON_SJSON_HPP

#include "sjson/Value.hpp"
#include "sjson/Errors.hpp"
#include <string>
#include <type_traits>

namespace sjson {

/**
 * @brief Additional options for the set and delete functions
 *
 * ```cpp
 * auto opts = Options{}.with_optimistic(true);
 * ```
 */
struct Options {
    /// Hint that the value likely exists, which allows a fast-track
    /// search and replace on the text. Off by default.
    bool optimistic = false;

    Options& with_optimistic(bool enabled) {
        optimistic = enabled;
        return *this;
    }
};

/**
 * @brief Set a literal value at a path
 *
 * The literal's type is inferred: "true"/"false" are booleans, "null" is
 * null, JSON-style numbers are numbers, text wrapped in [] or {} that
 * parses as JSON is that value, and anything else is a string. "037",
 * "NaN" and "Infinity" stay strings. Use set_raw() or the typed setters
 * when the type must be exact.
 *
 * @param json Source document
 * @param path Dot-separated path
 * @param value Literal value
 * @return Modified document
 * @throws EmptyPathError if path has no segments
 * @throws MalformedJsonError if json does not parse
 * @throws InvalidPathError if an array index cannot be resolved
 * @throws JsonMustBeObjectOrArrayError if the root is a scalar
 *
 * Examples:
 * ```cpp
 * set(R"({"name":"Tom","age":37})", "name", "Jerry");
 * // {"age":37,"name":"Jerry"}
 * set(R"({"items":["a","b"]})", "items.5", "f");
 * // {"items":["a","b",null,null,null,"f"]}
 * ```
 */
std::string set(const std::string& json, const std::string& path, const std::string& value);

/**
 * @brief Set a literal value at a path with options
 * @see set()
 */
std::string set_with_options(const std::string& json, const std::string& path,
                             const std::string& value, const Options& opts);

/**
 * @brief Set a pre-encoded JSON value at a path
 *
 * The value is inserted as a block of JSON, with no type inference.
 *
 * @throws MalformedJsonError if value is not valid JSON (is_value() is
 *         true), checked before either route runs
 * @see set()
 */
std::string set_raw(const std::string& json, const std::string& path,
                    const std::string& value, const Options& opts = Options{});

/**
 * @brief Set a boolean value at a path
 */
std::string set_bool(const std::string& json, const std::string& path, bool value,
                     const Options& opts = Options{});

/**
 * @brief Set a value encoded by nlohmann::json at a path
 *
 * Any type with a to_json() overload (or one nlohmann::json supports
 * natively) can be stored.
 *
 * @throws SerializationError if the value cannot be encoded
 */
template <typename T>
std::string set_value(const std::string& json, const std::string& path, const T& value,
                      const Options& opts = Options{}) {
    std::string encoded;
    try {
        encoded = Value(value).dump();
    } catch (const Value::exception& e) {
        throw SerializationError(e.what());
    }
    return set_raw(json, path, encoded, opts);
}

/**
 * @brief Set an integer value at a path
 */
template <typename Int,
          typename std::enable_if<std::is_integral<Int>::value &&
                                  !std::is_same<Int, bool>::value, int>::type = 0>
std::string set_int(const std::string& json, const std::string& path, Int value,
                    const Options& opts = Options{}) {
    return set_value(json, path, value, opts);
}

/**
 * @brief Set a floating-point value at a path
 *
 * Encoded in shortest round-trip form (95.5 → "95.5"). NaN and infinities
 * have no JSON form and are stored as null.
 */
template <typename Float,
          typename std::enable_if<std::is_floating_point<Float>::value, int>::type = 0>
std::string set_float(const std::string& json, const std::string& path, Float value,
                      const Options& opts = Options{}) {
    return set_value(json, path, value, opts);
}

/**
 * @brief Delete the value at a path
 *
 * Removing an array element shifts later elements left.
 *
 * @return Modified document
 * @throws EmptyPathError if path has no segments
 * @throws NoChangeError if nothing exists at path
 * @throws MalformedJsonError if json does not parse
 * @throws InvalidPathError if an array index cannot be resolved
 */
std::string delete_path(const std::string& json, const std::string& path);

/**
 * @brief Delete the value at a path with options
 * @see delete_path()
 */
std::string delete_with_options(const std::string& json, const std::string& path,
                                const Options& opts = Options{});

} // namespace sjson

#endif // SJSON_SJSON_HPP
