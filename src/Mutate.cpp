/**
 * @file Mutate.cpp
 * @brief Implementation of tree mutation
 */

#include "sjson/Mutate.hpp"
#include "sjson/DotPath.hpp"

namespace sjson {

namespace {
    /**
     * @brief RULE M6: reject string, number and boolean roots
     */
    void require_container_root(const Value& root) {
        if (!root.is_null() && !is_container(root)) {
            throw JsonMustBeObjectOrArrayError();
        }
    }

    /**
     * @brief RULE M2: pad array with nulls so that index is valid
     */
    void extend_to(Value& arr, std::size_t index, const std::string& segment) {
        if (index >= arr.max_size()) {
            throw InvalidPathError(segment,
                "invalid path: index '" + segment + "' exceeds the maximum array size");
        }
        while (arr.size() <= index) {
            arr.push_back(nullptr);
        }
    }
}

void set_in_tree(Value& root, const std::vector<std::string>& segments, Value value) {
    if (segments.empty()) {
        throw EmptyPathError();
    }
    require_container_root(root);

    Value* current = &root;

    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (current->is_array()) {
            std::size_t idx = resolve_array_index(seg, current->size());
            extend_to(*current, idx, seg);
            current = &(*current)[idx];
            continue;
        }

        if (!current->is_object()) {
            // RULE M3: Overwrite scalar/null with object
            *current = Value::object();
        }

        if (!current->contains(seg)) {
            // RULE M1: Create missing intermediate
            (*current)[seg] = Value::object();
        }
        current = &(*current)[seg];
    }

    // Set final value
    const auto& final_seg = segments.back();
    if (current->is_array()) {
        std::size_t idx = resolve_array_index(final_seg, current->size());
        extend_to(*current, idx, final_seg);
        (*current)[idx] = std::move(value);
        return;
    }

    if (!current->is_object()) {
        *current = Value::object();
    }
    (*current)[final_seg] = std::move(value);
}

void delete_in_tree(Value& root, const std::vector<std::string>& segments) {
    if (segments.empty()) {
        throw EmptyPathError();
    }
    require_container_root(root);

    Value* current = &root;

    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                throw NoChangeError(join_dot_path(segments));
            }
            current = &(*it);
        } else if (current->is_array()) {
            std::size_t idx = resolve_array_index(seg, current->size());
            if (idx >= current->size()) {
                throw NoChangeError(join_dot_path(segments));
            }
            current = &(*current)[idx];
        } else {
            // RULE M4: cannot descend into scalar/null
            throw NoChangeError(join_dot_path(segments));
        }
    }

    // Delete final value
    const auto& final_seg = segments.back();
    if (current->is_object()) {
        if (current->erase(final_seg) == 0) {
            throw NoChangeError(join_dot_path(segments));
        }
    } else if (current->is_array()) {
        std::size_t idx = resolve_array_index(final_seg, current->size());
        if (idx >= current->size()) {
            throw NoChangeError(join_dot_path(segments));
        }
        // RULE M5: list semantics, later elements shift left
        current->erase(static_cast<Value::size_type>(idx));
    } else {
        throw NoChangeError(join_dot_path(segments));
    }
}

Value parse_document(const std::string& json) {
    try {
        return Value::parse(json);
    } catch (const Value::exception& e) {
        // parse_error, or out_of_range for numbers beyond a double
        throw MalformedJsonError(e.what());
    }
}

std::string serialize_document(const Value& doc) {
    try {
        return doc.dump();
    } catch (const Value::type_error& e) {
        throw SerializationError(e.what());
    }
}

std::string authoritative_set(const std::string& json, const std::string& path,
                              Value value) {
    const auto segments = require_dot_path(path);
    Value doc = parse_document(json);
    set_in_tree(doc, segments, std::move(value));
    return serialize_document(doc);
}

std::string authoritative_delete(const std::string& json, const std::string& path) {
    const auto segments = require_dot_path(path);
    Value doc = parse_document(json);
    delete_in_tree(doc, segments);
    return serialize_document(doc);
}

} // namespace sjson
