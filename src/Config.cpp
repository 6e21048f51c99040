/**
 * @file Config.cpp
 * @brief Options file loading implementation
 *
 * RULE C1-C5: see Config.hpp.
 */

#include "sjson/Config.hpp"
#include "sjson/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sjson {

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Apply a TOML table's recognized keys to opts.
 */
void apply_toml_table(const std::string& path, const toml::table& tbl, Options& opts) {
    if (const toml::node* node = tbl.get("optimistic")) {
        const auto flag = node->value<bool>();
        if (!node->is_boolean() || !flag) {
            throw ConfigParseError(path, "'optimistic' must be a boolean");
        }
        opts.optimistic = *flag;
    }
}

/**
 * @brief Apply a JSON object's recognized keys to opts.
 */
void apply_json_object(const std::string& path, const Value& obj, Options& opts) {
    auto it = obj.find("optimistic");
    if (it == obj.end()) {
        return;
    }
    if (!it->is_boolean()) {
        throw ConfigParseError(path, "'optimistic' must be a boolean, got " + type_name(*it));
    }
    opts.optimistic = it->get<bool>();
}

Options load_toml_options(const std::string& path) {
    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << e.description() << " (line " << e.source().begin.line
            << ", column " << e.source().begin.column << ")";
        throw ConfigParseError(path, oss.str());
    }

    Options opts;
    apply_toml_table(path, table, opts);
    if (const toml::table* section = table["sjson"].as_table()) {
        apply_toml_table(path, *section, opts);
    }
    return opts;
}

Options load_json_options(const std::string& path) {
    Value doc;
    try {
        doc = Value::parse(read_text_file(path));
    } catch (const Value::exception& e) {
        throw ConfigParseError(path, e.what());
    }
    if (!doc.is_object()) {
        throw ConfigParseError(path, "expected an object, got " + type_name(doc));
    }

    Options opts;
    apply_json_object(path, doc, opts);
    auto section = doc.find("sjson");
    if (section != doc.end() && section->is_object()) {
        apply_json_object(path, *section, opts);
    }
    return opts;
}

} // anonymous namespace

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write to " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed writing " + path);
    }
}

Options load_options_file(const std::string& path) {
    // RULE C1: Empty path = defaults
    if (path.empty()) {
        return Options{};
    }

    // RULE C2: File must exist
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    // RULE C3: Detect format by extension
    const std::string ext = get_file_extension(path);
    if (ext == ".toml") {
        return load_toml_options(path);
    }
    if (ext == ".json") {
        return load_json_options(path);
    }
    throw std::runtime_error(
        "Unsupported options file type: " + ext + " (expected .json or .toml)"
    );
}

} // namespace sjson
