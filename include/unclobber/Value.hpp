/**
 * @file Value.hpp
 * @brief Value type for frontmatter data
 *
 * Uses nlohmann::ordered_json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}) in insertion order
 */

#ifndef UNCLOBBER_VALUE_HPP
#define UNCLOBBER_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace unclobber {

/**
 * @brief JSON-like value type for frontmatter mappings
 *
 * Alias for nlohmann::ordered_json. Objects remember the order in which
 * keys were first inserted, which is the order keys are re-emitted in.
 *
 * Supports:
 * - Type queries: is_null(), is_boolean(), is_number_integer(),
 *   is_number_float(), is_string(), is_array(), is_object()
 * - Comparison: ==, !=, < (a total order across types)
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Render a value for log and prompt messages
 *
 * Strings are shown bare, everything else as compact JSON.
 */
inline std::string display(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    return val.dump();
}

} // namespace unclobber

#endif // UNCLOBBER_VALUE_HPP
