#include <cxxopts.hpp>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include "sjson/Cli.hpp"
#include "sjson/Errors.hpp"

using namespace sjson;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("sjson-cpp", "Set or delete JSON values via dot-notation paths");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("f,file", "JSON document to edit (default: stdin)", cxxopts::value<std::string>())
            ("i,in-place", "Write the result back to --file")
            ("c,config", "Path to TOML/JSON options file", cxxopts::value<std::string>())
            ("optimistic", "Try in-place text splicing before full parsing")
            ("raw", "Treat VALUE as pre-encoded JSON (no type inference)")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: set PATH VALUE | delete PATH\n";
            return 0;
        }

        const Options opts = resolve_options(
            result.count("config") ? result["config"].as<std::string>() : std::string(),
            result.count("optimistic") > 0);

        const bool in_place = result.count("in-place") > 0;
        std::string file;
        if (result.count("file")) file = result["file"].as<std::string>();
        if (in_place && file.empty()) {
            std::cerr << "Error: --in-place requires --file\n";
            return 1;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        Command cmd;
        cmd.name = cmdv[0];
        cmd.args.assign(cmdv.begin() + 1, cmdv.end());
        cmd.raw = result.count("raw") > 0;
        validate_command(cmd);

        std::string out;
        if (!file.empty()) {
            out = run_on_file(cmd, file, opts, in_place);
        } else {
            std::string doc((std::istreambuf_iterator<char>(std::cin)),
                            std::istreambuf_iterator<char>());
            out = run_command(cmd, doc, opts);
        }

        if (!in_place) {
            std::cout << out << "\n";
        }
        return 0;

    } catch (const SjsonError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
