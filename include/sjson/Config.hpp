/**
 * @file Config.hpp
 * @brief Options file loading and document file IO for the CLI
 *
 * Options can be stored in:
 * - TOML files (using toml++): `optimistic = true`, either at the root or
 *   under an `[sjson]` table
 * - JSON files (using nlohmann::json): `{"optimistic": true}` or
 *   `{"sjson": {"optimistic": true}}`
 *
 * RULE C1: Empty path -> default Options (no file loaded).
 * RULE C2: Missing file -> FileNotFoundError.
 * RULE C3: Format detected by extension (.toml / .json).
 * RULE C4: A `[sjson]` table takes precedence over root-level keys.
 * RULE C5: A non-boolean `optimistic` is a ConfigParseError.
 */

#ifndef SJSON_CONFIG_HPP
#define SJSON_CONFIG_HPP

#include "sjson/Sjson.hpp"
#include <string>

namespace sjson {

/**
 * @brief Load Options from a TOML or JSON file
 *
 * @param path Path to options file (empty string = defaults)
 * @return Options with fields found in the file applied
 * @throws FileNotFoundError if path is non-empty and file doesn't exist
 * @throws ConfigParseError if the file has syntax errors or bad field types
 * @throws std::runtime_error if extension is not .json or .toml
 */
Options load_options_file(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".toml"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Read a whole file into a string
 * @throws FileNotFoundError if the file cannot be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Replace a file's contents
 * @throws std::runtime_error if the file cannot be written
 */
void write_text_file(const std::string& path, const std::string& content);

} // namespace sjson

#endif // SJSON_CONFIG_HPP
