/*
 * JSON Utilities Implementation
 */

#include "json_utils.h"
#include "../status.h"
#include <fstream>

namespace json_utils {

namespace {

std::string field_path(const std::string& where, const std::string& key) {
    return where.empty() ? key : where + "." + key;
}

[[noreturn]] void type_error(const std::string& where, const std::string& key, const char* expected) {
    throw ConfigError(field_path(where, key) + ": expected " + expected);
}

const json* find_field(const json& j, const std::string& key, const std::string& where) {
    if (!j.is_object()) {
        throw ConfigError((where.empty() ? std::string("<root>") : where) + ": expected object");
    }
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

const json& empty_array() {
    static const json value = json::array();
    return value;
}

const json& empty_object() {
    static const json value = json::object();
    return value;
}

} // namespace

json parse(const std::string& str) {
    return json::parse(str);
}

std::string to_string(const json& j, int indent) {
    return j.dump(indent);
}

std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return default_val;
    }

    return it->get<std::string>();
}

bool has_key(const json& j, const std::string& key) {
    if (!j.is_object()) {
        return false;
    }

    return j.find(key) != j.end();
}

json parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Failed to open file: " + path);
    }

    try {
        json j;
        file >> j;
        return j;
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

bool read_string(const json& j, const std::string& key, const std::string& where, std::string& out) {
    const json* v = find_field(j, key, where);
    if (!v) return false;
    if (!v->is_string()) type_error(where, key, "string");
    out = v->get<std::string>();
    return true;
}

bool read_int(const json& j, const std::string& key, const std::string& where, int& out) {
    const json* v = find_field(j, key, where);
    if (!v) return false;
    if (!v->is_number_integer()) type_error(where, key, "integer");
    int64_t value = v->get<int64_t>();
    if (value < INT32_MIN || value > INT32_MAX) type_error(where, key, "32-bit integer");
    out = static_cast<int>(value);
    return true;
}

bool read_uint(const json& j, const std::string& key, const std::string& where, uint32_t& out) {
    const json* v = find_field(j, key, where);
    if (!v) return false;
    if (!v->is_number_integer()) type_error(where, key, "non-negative integer");
    int64_t value = v->get<int64_t>();
    if (value < 0 || value > UINT32_MAX) type_error(where, key, "non-negative integer");
    out = static_cast<uint32_t>(value);
    return true;
}

bool read_double(const json& j, const std::string& key, const std::string& where, double& out) {
    const json* v = find_field(j, key, where);
    if (!v) return false;
    if (!v->is_number()) type_error(where, key, "number");
    out = v->get<double>();
    return true;
}

bool read_bool(const json& j, const std::string& key, const std::string& where, bool& out) {
    const json* v = find_field(j, key, where);
    if (!v) return false;
    if (!v->is_boolean()) type_error(where, key, "boolean");
    out = v->get<bool>();
    return true;
}

std::string require_string(const json& j, const std::string& key, const std::string& where) {
    std::string value;
    if (!read_string(j, key, where, value)) {
        throw ConfigError(field_path(where, key) + ": missing required field");
    }
    return value;
}

const json& array_field(const json& j, const std::string& key, const std::string& where) {
    const json* v = find_field(j, key, where);
    if (!v) return empty_array();
    if (!v->is_array()) type_error(where, key, "array");
    return *v;
}

const json& object_field(const json& j, const std::string& key, const std::string& where) {
    const json* v = find_field(j, key, where);
    if (!v) return empty_object();
    if (!v->is_object()) type_error(where, key, "object");
    return *v;
}

} // namespace json_utils
