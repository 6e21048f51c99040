/**
 * @file Value.hpp
 * @brief Value type for JSON documents
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * Objects are backed by std::map, so serialization emits keys in
 * lexicographic order regardless of the order they were parsed in.
 */

#ifndef SJSON_VALUE_HPP
#define SJSON_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace sjson {

/**
 * @brief JSON value tree
 *
 * This is an alias for nlohmann::json. A tree is built fresh for each
 * authoritative mutation, edited in place and serialized back to text.
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace sjson

#endif // SJSON_VALUE_HPP
