/**
 * @file Value.hpp
 * @brief Canonical value model shared by every parser and the diff engine
 *
 * Uses nlohmann::ordered_json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Number (integer, unsigned and float storage, compared as double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion order preserved)
 */

#ifndef DIFFX_VALUE_HPP
#define DIFFX_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace diffx {

/**
 * @brief Tagged value type all formats normalize into
 *
 * This is an alias for nlohmann::ordered_json. Object iteration follows
 * insertion order, which the diff engine relies on for entry ordering.
 *
 * See nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief The six canonical kinds a Value can take
 *
 * nlohmann's integer, unsigned and float representations all map to
 * Number: a TOML integer and a JSON float with the same magnitude are the
 * same kind and compare equal.
 */
enum class ValueKind {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Classify a value into its canonical kind
 * @param val The value to inspect
 * @return Canonical kind (binary and discarded values report Null)
 */
inline ValueKind kind_of(const Value& val) {
    if (val.is_boolean()) return ValueKind::Bool;
    if (val.is_number()) return ValueKind::Number;
    if (val.is_string()) return ValueKind::String;
    if (val.is_array()) return ValueKind::Array;
    if (val.is_object()) return ValueKind::Object;
    return ValueKind::Null;
}

/**
 * @brief Get human-readable name for a kind
 * @return "null", "bool", "number", "string", "array" or "object"
 */
inline std::string kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "bool";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Array: return "array";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

/**
 * @brief Get human-readable kind name for a Value
 */
inline std::string type_name(const Value& val) {
    return kind_name(kind_of(val));
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Render a value as single-line JSON text
 *
 * Never throws: invalid UTF-8 in strings is replaced with U+FFFD.
 */
inline std::string to_compact_string(const Value& val) {
    return val.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace diffx

#endif // DIFFX_VALUE_HPP
