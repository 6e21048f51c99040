/**
 * @file Cli.hpp
 * @brief Command handling behind the sjson-cpp executable
 *
 * The executable only parses argv with cxxopts; everything it does with
 * the parsed arguments lives here so it can be tested directly.
 *
 * Commands:
 * - set PATH VALUE  (VALUE is a literal, or pre-encoded JSON with raw)
 * - delete PATH
 *
 * RULE X1: Options come from the options file first; --optimistic turns
 *          the fast route on regardless of the file.
 * RULE X2: Commands are validated before any document is read.
 * RULE X3: In-place edits write the file only after the command succeeds.
 */

#ifndef SJSON_CLI_HPP
#define SJSON_CLI_HPP

#include "sjson/Sjson.hpp"
#include <string>
#include <vector>

namespace sjson {

/**
 * @brief A parsed command line
 */
struct Command {
    std::string name;
    std::vector<std::string> args;
    bool raw = false;
};

/**
 * @brief Check the command name and its argument count
 * @throws UsageError for an unknown command or wrong argument count
 */
void validate_command(const Command& cmd);

/**
 * @brief Build Options from an options file and the --optimistic flag
 *
 * @param config_path Options file (empty string = defaults)
 * @param optimistic_flag true if --optimistic was given
 * @throws (anything load_options_file throws)
 */
Options resolve_options(const std::string& config_path, bool optimistic_flag);

/**
 * @brief Run a validated command against document text
 * @return Modified document
 * @throws UsageError if the command is invalid
 * @throws SjsonError subclasses from set/delete
 */
std::string run_command(const Command& cmd, const std::string& doc, const Options& opts);

/**
 * @brief Run a command against a document file
 *
 * @param cmd Command to run
 * @param path Document file
 * @param opts Options for set/delete
 * @param in_place Write the result back to path
 * @return Modified document
 * @throws FileNotFoundError if path cannot be read
 */
std::string run_on_file(const Command& cmd, const std::string& path, const Options& opts,
                        bool in_place);

} // namespace sjson

#endif // SJSON_CLI_HPP
