#pragma once

#include <initializer_list>
#include <string>
#include <nlohmann/json.hpp>

using Json = nlohmann::json;

// Null-safe navigation over parsed documents. A missing key, or a lookup on
// anything but an object, yields a null value instead of throwing.

inline const Json& json_null() {
    static const Json null_value;
    return null_value;
}

inline const Json& json_child(const Json& node, const char* key) {
    if (!node.is_object()) return json_null();
    auto it = node.find(key);
    return it == node.end() ? json_null() : *it;
}

inline const Json& json_path(const Json& node, std::initializer_list<const char*> keys) {
    const Json* cur = &node;
    for (const char* k : keys) {
        cur = &json_child(*cur, k);
        if (cur->is_null()) break;
    }
    return *cur;
}

inline std::string json_string(const Json& node, const std::string& fallback = "") {
    return node.is_string() ? node.get<std::string>() : fallback;
}

inline int json_int(const Json& node, int fallback = 0) {
    return node.is_number_integer() ? node.get<int>() : fallback;
}

inline bool json_bool(const Json& node, bool fallback = false) {
    return node.is_boolean() ? node.get<bool>() : fallback;
}
