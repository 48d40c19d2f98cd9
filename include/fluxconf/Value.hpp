/**
 * @file Value.hpp
 * @brief Value and document types for configuration data
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef FLUXCONF_VALUE_HPP
#define FLUXCONF_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace fluxconf {

/**
 * @brief JSON-like value type for configuration
 *
 * Alias for nlohmann::json. See nlohmann::json documentation for the
 * complete API (type queries, get<T>(), iteration, comparison).
 */
using Value = nlohmann::json;

/**
 * @brief A configuration document
 *
 * A Value whose root is an object. Documents are handled as values:
 * migration and patch operations take a const reference and return
 * a new document.
 */
using Document = Value;

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

} // namespace fluxconf

#endif // FLUXCONF_VALUE_HPP
