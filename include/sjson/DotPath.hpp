/**
 * @file DotPath.hpp
 * @brief Dot-notation path utilities for JSON mutation
 *
 * A path like "name.last" or "children.-1" is split on '.' into
 * segments. A segment is not typed as key or index up front: whether it
 * names an object member or an array element is decided at each step by
 * the runtime type of the node being visited.
 */

#ifndef SJSON_DOTPATH_HPP
#define SJSON_DOTPATH_HPP

#include "Errors.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace sjson {

/**
 * @brief Split a dot-path into segments
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Vector of segments ["a", "b", "c"]
 *
 * Empty segments are dropped.
 *
 * Examples:
 * - "name.last" → ["name", "last"]
 * - "children.-1" → ["children", "-1"]
 * - "a..b" → ["a", "b"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Split a dot-path, rejecting paths with no segments
 *
 * @param path Dot-separated path
 * @return Non-empty vector of segments
 * @throws EmptyPathError if the path yields no segments ("" or ".")
 */
std::vector<std::string> require_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * @param segments Vector of path segments
 * @return Dot-joined path string
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Resolve a segment as an index into an array of given length
 *
 * @param segment Segment text, a signed decimal integer
 * @param length Current length of the array
 * @return Index into the array
 * @throws NonNumericArrayKeyError if segment is not a valid int64
 * @throws InvalidPathError if a negative index exceeds the length
 *
 * Negative values count from the end: -1 is the last element, -k is
 * length - k. Non-negative values are returned unchanged even when they
 * are past the end; the caller decides whether that means "extend" (set)
 * or "no change" (delete).
 *
 * Examples:
 * ```cpp
 * resolve_array_index("1", 3);   // 1
 * resolve_array_index("-1", 3);  // 2
 * resolve_array_index("7", 3);   // 7
 * resolve_array_index("-4", 3);  // throws InvalidPathError
 * resolve_array_index("x", 3);   // throws NonNumericArrayKeyError
 * ```
 */
std::size_t resolve_array_index(const std::string& segment, std::size_t length);

} // namespace sjson

#endif // SJSON_DOTPATH_HPP
