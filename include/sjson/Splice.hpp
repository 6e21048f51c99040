/**
 * @file Splice.hpp
 * @brief Optimistic route: in-place text splicing by dot-path
 *
 * Locates the byte span of a value directly in the document text and
 * substitutes or removes it without building a parse tree. The document's
 * key order and formatting outside the span are preserved exactly.
 *
 * Every function here reports "could not locate" as std::nullopt rather
 * than throwing; the caller is expected to fall back to the
 * authoritative route in Mutate.hpp.
 *
 * Known limitations:
 * - Key search is textual and not scoped to the enclosing object. The
 *   first occurrence of "<segment>": after the cursor wins, even if it
 *   belongs to a sibling or a nested object further on.
 * - Array indices are never matched (there is no "<index>": text), so
 *   paths through arrays always miss and fall back.
 * - splice_set() wraps bare literals in quotes without escaping them.
 *   Text containing '"' or '\' must be pre-escaped by the caller.
 */

#ifndef SJSON_SPLICE_HPP
#define SJSON_SPLICE_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace sjson {

/**
 * @brief Half-open byte range [start, end) of a value in a document
 */
struct ValueSpan {
    std::size_t start = 0;
    std::size_t end = 0;
};

/**
 * @brief Check whether a path may be tried on the optimistic route
 *
 * Every character must fall in '.'..'z' outside ':'..'@'. This
 * excludes quote, colon, braces, whitespace and control characters.
 *
 * @param path Dot-separated path
 * @return true if the path is eligible
 */
bool is_optimistic_path(const std::string& path);

/**
 * @brief Find where the value starting at @p start ends
 *
 * Tracks string state (with backslash escapes) and brace/bracket depth.
 * The value ends before a depth-0 comma, before a closer that belongs to
 * the enclosing container, or after the closer of its own container.
 * Otherwise it runs to the end of the text.
 *
 * @param text Document text
 * @param start Offset of the value's first character
 * @return Offset one past the value (may include trailing whitespace)
 *
 * Examples (value start at offset 0):
 * - "37}"          → 2
 * - "\"a,b\",1"    → 5
 * - "{\"x\":[1]},"  → 9
 * - "true"         → 4
 */
std::size_t find_value_end(const std::string& text, std::size_t start);

/**
 * @brief Locate the value at a path by textual key search
 *
 * @param json Document text
 * @param path Dot-separated path
 * @return Span of the value (trailing whitespace excluded), or
 *         std::nullopt if any segment's key text is not found
 */
std::optional<ValueSpan> find_value_span(const std::string& json, const std::string& path);

/**
 * @brief Replace a located value
 *
 * @param json Document text
 * @param span Span of the value to replace
 * @param value Replacement text
 * @param quote_bare If true, values that parse_literal() would store as
 *                   a string are wrapped in quotes (no escaping). Text
 *                   already starting with '"' is written as-is.
 * @return Spliced document
 */
std::string splice_set(const std::string& json, const ValueSpan& span,
                       const std::string& value, bool quote_bare);

/**
 * @brief Remove a located member together with its key and one comma
 *
 * Prefers removing the preceding comma (and the whitespace before it);
 * for a first member removes the following comma (and the whitespace
 * after it) instead.
 *
 * @param json Document text
 * @param span Span of the member's value
 * @param key Member key (last path segment)
 * @return Spliced document
 */
std::string splice_delete(const std::string& json, const ValueSpan& span,
                          const std::string& key);

/**
 * @brief Try an optimistic set
 * @return Spliced document, or std::nullopt to fall back
 */
std::optional<std::string> optimistic_set(const std::string& json, const std::string& path,
                                          const std::string& value, bool quote_bare);

/**
 * @brief Try an optimistic delete
 * @return Spliced document, or std::nullopt to fall back
 */
std::optional<std::string> optimistic_delete(const std::string& json, const std::string& path);

} // namespace sjson

#endif // SJSON_SPLICE_HPP
