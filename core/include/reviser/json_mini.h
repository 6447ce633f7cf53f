#pragma once

// json_mini.h
//
// Thin RAII + accessor layer over json-c. Used for collaborator requests,
// collaborator config and the static-analysis violation list.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace reviser::json_mini {

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
};

// Strict parse: the whole input must be one JSON value.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    // only whitespace may follow the value
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

// Lenient parse: one JSON value starting at `offset`, anything after it is
// ignored. `end` receives the offset just past the value.
inline Doc parse_prefix(const std::string& text, size_t offset, size_t* end = nullptr) {
    if (offset >= text.size()) return Doc{};
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    const size_t avail = text.size() - offset;
    const int len = static_cast<int>(std::min(avail, static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, text.c_str() + offset, len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    if (end) *end = offset + consumed;
    return Doc{obj};
}

inline std::optional<std::string> member_string(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<int64_t> member_int(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<std::string> get_string(const std::string& json, const std::string& key) {
    Doc d = parse(json);
    if (!d) return std::nullopt;
    return member_string(d.root, key.c_str());
}

// Add a string member, keeping embedded NULs and non-ASCII bytes intact.
inline void add_string(json_object* obj, const char* key, const std::string& value) {
    json_object_object_add(obj, key,
        json_object_new_string_len(value.c_str(), static_cast<int>(value.size())));
}

inline std::string to_string_plain(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

} // namespace reviser::json_mini
