/**
 * @file Sjson.cpp
 * @brief Public entry points: pick a route, fall back on a miss
 */

#include "sjson/Sjson.hpp"
#include "sjson/DotPath.hpp"
#include "sjson/Mutate.hpp"
#include "sjson/Parse.hpp"
#include "sjson/Splice.hpp"

namespace sjson {

std::string set(const std::string& json, const std::string& path, const std::string& value) {
    return set_with_options(json, path, value, Options{});
}

std::string set_with_options(const std::string& json, const std::string& path,
                             const std::string& value, const Options& opts) {
    require_dot_path(path);

    if (opts.optimistic) {
        if (auto spliced = optimistic_set(json, path, value, true)) {
            return *spliced;
        }
    }

    return authoritative_set(json, path, parse_literal(value));
}

std::string set_raw(const std::string& json, const std::string& path,
                    const std::string& value, const Options& opts) {
    require_dot_path(path);

    Value parsed;
    try {
        parsed = Value::parse(value);
    } catch (const Value::exception& e) {
        throw MalformedJsonError(e.what(), true);
    }

    if (opts.optimistic) {
        if (auto spliced = optimistic_set(json, path, value, false)) {
            return *spliced;
        }
    }

    return authoritative_set(json, path, std::move(parsed));
}

std::string set_bool(const std::string& json, const std::string& path, bool value,
                     const Options& opts) {
    return set_with_options(json, path, value ? "true" : "false", opts);
}

std::string delete_path(const std::string& json, const std::string& path) {
    return delete_with_options(json, path, Options{});
}

std::string delete_with_options(const std::string& json, const std::string& path,
                                const Options& opts) {
    require_dot_path(path);

    if (opts.optimistic) {
        if (auto spliced = optimistic_delete(json, path)) {
            return *spliced;
        }
    }

    return authoritative_delete(json, path);
}

} // namespace sjson
