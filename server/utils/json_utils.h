/*
 * JSON Utilities
 *
 * Wrapper around nlohmann/json for common operations.
 *
 * Two families of accessors:
 * - get_*: lenient, return a default when the key is missing or mistyped
 *   (signaling messages from clients)
 * - read_*: strict, leave the output untouched when the key is missing and
 *   throw ConfigError naming the JSON location when the type is wrong
 *   (configuration files)
 */

#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace json_utils {

// Type alias for convenience
using json = nlohmann::json;

/**
 * Parse JSON string
 * @param str JSON string
 * @return Parsed JSON object
 * @throws nlohmann::json::parse_error on invalid JSON
 */
json parse(const std::string& str);

/**
 * Convert JSON to string
 * @param j JSON object
 * @param indent Indentation level (-1 for compact)
 */
std::string to_string(const json& j, int indent = -1);

/**
 * Get string value from JSON object with default
 */
std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val = "");

/**
 * Check if key exists in JSON object
 */
bool has_key(const json& j, const std::string& key);

/**
 * Parse JSON file
 * @param path Path to JSON file
 * @throws ConfigError on file read or parse error
 */
json parse_file(const std::string& path);

/**
 * Strict field readers
 * @param j JSON object
 * @param key Key to read
 * @param where Location of `j` for error messages ("streams[0].media[1]")
 * @param out Receives the value if the key is present
 * @return true if the key was present
 * @throws ConfigError if the key is present with the wrong type or range
 */
bool read_string(const json& j, const std::string& key, const std::string& where, std::string& out);
bool read_int(const json& j, const std::string& key, const std::string& where, int& out);
bool read_uint(const json& j, const std::string& key, const std::string& where, uint32_t& out);
bool read_double(const json& j, const std::string& key, const std::string& where, double& out);
bool read_bool(const json& j, const std::string& key, const std::string& where, bool& out);

/**
 * Like read_string but the key must be present
 * @throws ConfigError if missing
 */
std::string require_string(const json& j, const std::string& key, const std::string& where);

/**
 * Get an array member, or an empty array if missing
 * @throws ConfigError if present but not an array
 */
const json& array_field(const json& j, const std::string& key, const std::string& where);

/**
 * Get an object member, or an empty object if missing
 * @throws ConfigError if present but not an object
 */
const json& object_field(const json& j, const std::string& key, const std::string& where);

} // namespace json_utils

#endif // JSON_UTILS_H
