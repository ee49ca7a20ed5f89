#pragma once

// Typed field readers for nlohmann::json objects. Each returns false when the
// key is missing or holds the wrong type, leaving `out` untouched.

#include <string>

#include <nlohmann/json.hpp>

#include "../types.h"

namespace mc {
namespace json {

inline bool readNumber(const nlohmann::json& j, const char* key, f64& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return false;
    out = it->get<f64>();
    return true;
}

inline bool readInt(const nlohmann::json& j, const char* key, i64& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return false;
    out = it->get<i64>();
    return true;
}

inline bool readString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // namespace json
} // namespace mc
