/**
 * @file Cli.cpp
 * @brief Command handling implementation
 */

#include "sjson/Cli.hpp"
#include "sjson/Config.hpp"
#include "sjson/Errors.hpp"

namespace sjson {

void validate_command(const Command& cmd) {
    std::size_t want = 0;
    if (cmd.name == "set") {
        want = 2;
    } else if (cmd.name == "delete") {
        want = 1;
    } else {
        throw UsageError("unknown command '" + cmd.name + "'");
    }

    if (cmd.args.size() != want) {
        throw UsageError("wrong number of arguments for command '" + cmd.name + "'");
    }
}

Options resolve_options(const std::string& config_path, bool optimistic_flag) {
    // RULE X1: file first, flag overrides
    Options opts = load_options_file(config_path);
    if (optimistic_flag) {
        opts.with_optimistic(true);
    }
    return opts;
}

std::string run_command(const Command& cmd, const std::string& doc, const Options& opts) {
    validate_command(cmd);

    if (cmd.name == "delete") {
        return delete_with_options(doc, cmd.args[0], opts);
    }
    if (cmd.raw) {
        return set_raw(doc, cmd.args[0], cmd.args[1], opts);
    }
    return set_with_options(doc, cmd.args[0], cmd.args[1], opts);
}

std::string run_on_file(const Command& cmd, const std::string& path, const Options& opts,
                        bool in_place) {
    // RULE X2
    validate_command(cmd);

    const std::string out = run_command(cmd, read_text_file(path), opts);

    // RULE X3
    if (in_place) {
        write_text_file(path, out);
    }
    return out;
}

} // namespace sjson
