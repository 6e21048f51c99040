/**
 * @file Mutate.hpp
 * @brief Authoritative route: tree mutation by dot-path
 *
 * Walks a parsed Value tree along the path segments, creating or
 * coercing intermediate nodes as needed for set, and applies the
 * terminal set or delete. The text-level functions parse the document,
 * mutate the tree and serialize it back.
 *
 * Behavioral rules:
 * - RULE M1: set creates missing object members as empty objects
 * - RULE M2: set extends arrays with nulls up to and including the index
 * - RULE M3: set replaces scalar/null nodes on the path with empty objects
 * - RULE M4: delete on any missing member/element raises NoChangeError
 * - RULE M5: delete removes array elements with list semantics (shift left)
 * - RULE M6: the document root must be an object, array or null
 *
 * Key order: serialization goes through nlohmann::json, whose objects
 * are sorted maps. Output keys are therefore in lexicographic order, not
 * in the order of the source document. Compare results as trees.
 */

#ifndef SJSON_MUTATE_HPP
#define SJSON_MUTATE_HPP

#include "sjson/Value.hpp"
#include "sjson/Errors.hpp"
#include <string>
#include <vector>

namespace sjson {

/**
 * @brief Set a value in a tree
 *
 * @param root Tree to modify in place
 * @param segments Non-empty path segments
 * @param value Value to store at the final segment
 * @throws JsonMustBeObjectOrArrayError if root is a string, number or boolean
 * @throws InvalidPathError if a negative index exceeds an array's length
 * @throws NonNumericArrayKeyError if an array meets a non-integer segment
 *
 * Examples:
 * ```cpp
 * Value doc = Value::parse(R"({"items": ["a", "b"]})");
 * set_in_tree(doc, {"items", "5"}, "f");
 * // Result: {"items": ["a", "b", null, null, null, "f"]}
 *
 * set_in_tree(doc, {"name", "first"}, "Tom");
 * // Result adds {"name": {"first": "Tom"}}
 * ```
 */
void set_in_tree(Value& root, const std::vector<std::string>& segments, Value value);

/**
 * @brief Delete a value from a tree
 *
 * @param root Tree to modify in place
 * @param segments Non-empty path segments
 * @throws NoChangeError if the target or any intermediate is missing, or
 *         traversal reaches a scalar/null node
 * @throws JsonMustBeObjectOrArrayError if root is a string, number or boolean
 * @throws InvalidPathError if a negative index exceeds an array's length
 */
void delete_in_tree(Value& root, const std::vector<std::string>& segments);

/**
 * @brief Parse, set and serialize
 *
 * @param json Source document text
 * @param path Dot-separated path
 * @param value Value to store
 * @return Serialized document
 * @throws EmptyPathError if path has no segments
 * @throws MalformedJsonError if json does not parse
 * @throws SerializationError if the result cannot be encoded
 * @throws (anything set_in_tree throws)
 */
std::string authoritative_set(const std::string& json, const std::string& path,
                              Value value);

/**
 * @brief Parse, delete and serialize
 *
 * @param json Source document text
 * @param path Dot-separated path
 * @return Serialized document
 * @throws EmptyPathError if path has no segments
 * @throws MalformedJsonError if json does not parse
 * @throws SerializationError if the result cannot be encoded
 * @throws (anything delete_in_tree throws)
 */
std::string authoritative_delete(const std::string& json, const std::string& path);

/**
 * @brief Parse document text
 * @throws MalformedJsonError with the parser's message
 */
Value parse_document(const std::string& json);

/**
 * @brief Serialize a tree compactly
 * @throws SerializationError if the tree holds invalid UTF-8
 */
std::string serialize_document(const Value& doc);

} // namespace sjson

#endif // SJSON_MUTATE_HPP
