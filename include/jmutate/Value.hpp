/**
 * @file Value.hpp
 * @brief Value type for documents and rule operands
 *
 * Uses nlohmann::ordered_json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion order preserved)
 */

#ifndef JMUTATE_VALUE_HPP
#define JMUTATE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace jmutate {

/**
 * @brief JSON value type for documents
 *
 * An alias for nlohmann::ordered_json so that object members keep the
 * order they were parsed in and re-serialize identically.
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief JSON value category used for strict typing
 *
 * Integers and floats share the Number category: they compare with each
 * other but never with strings.
 */
enum class Kind {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Get the category of a value
 */
inline Kind kind_of(const Value& val) {
    if (val.is_null()) return Kind::Null;
    if (val.is_boolean()) return Kind::Boolean;
    if (val.is_number()) return Kind::Number;
    if (val.is_string()) return Kind::String;
    if (val.is_array()) return Kind::Array;
    return Kind::Object;
}

/**
 * @brief Name of a category as written in rule files
 */
inline std::string kind_name(Kind kind) {
    switch (kind) {
        case Kind::Null: return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Number: return "number";
        case Kind::String: return "string";
        case Kind::Array: return "array";
        case Kind::Object: return "object";
    }
    return "unknown";
}

/**
 * @brief Parse a category name ("number", "string", ...)
 * @return The category, or nullopt for unknown names
 */
inline std::optional<Kind> parse_kind(const std::string& name) {
    if (name == "null") return Kind::Null;
    if (name == "boolean" || name == "bool") return Kind::Boolean;
    if (name == "number") return Kind::Number;
    if (name == "string") return Kind::String;
    if (name == "array") return Kind::Array;
    if (name == "object") return Kind::Object;
    return std::nullopt;
}

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
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Strict equality between two values
 *
 * Values of different categories are never equal. Numbers compare by
 * numeric value regardless of integer/float representation.
 */
inline bool strict_equal(const Value& a, const Value& b) {
    if (kind_of(a) != kind_of(b)) return false;
    // nlohmann compares integer and float representations numerically
    return a == b;
}

} // namespace jmutate

#endif // JMUTATE_VALUE_HPP
