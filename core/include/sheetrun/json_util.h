#pragma once

// json_util.h
//
// Thin helpers over json-c. Doc owns a parsed tree; the obj_* accessors read
// fields of an already parsed object without re-parsing.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace sheetrun::json_util {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }

    // Gives up ownership, e.g. before attaching the tree to a parent object.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }
};

inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

inline std::string to_string(json_object* obj, bool pretty = false) {
    if (!obj) return "null";
    int flags = pretty ? (JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED) : JSON_C_TO_STRING_PLAIN;
    return std::string(json_object_to_json_string_ext(obj, flags | JSON_C_TO_STRING_NOSLASHESCAPE));
}

inline json_object* obj_get(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> obj_string(json_object* obj, const char* key) {
    json_object* v = obj_get(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<int64_t> obj_int(json_object* obj, const char* key) {
    json_object* v = obj_get(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<double> obj_double(json_object* obj, const char* key) {
    json_object* v = obj_get(obj, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

inline std::optional<bool> obj_bool(json_object* obj, const char* key) {
    json_object* v = obj_get(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> obj_strings(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = obj_get(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

} // namespace sheetrun::json_util
