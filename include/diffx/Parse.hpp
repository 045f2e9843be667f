/**
 * @file Parse.hpp
 * @brief String-to-Value scalar inference
 *
 * Formats without a native type system (INI, CSV) produce strings. When a
 * caller opts into type inference, each cell goes through parse_scalar.
 *
 * Parsing order (first match wins):
 * - T1: Boolean ("true", "false" - case insensitive)
 * - T2: Null ("null" - case insensitive)
 * - T3: Integer (matches ^-?[0-9]+$)
 * - T4: Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - T5: Raw String (fallback)
 */

#ifndef DIFFX_PARSE_HPP
#define DIFFX_PARSE_HPP

#include "diffx/Value.hpp"
#include <string>

namespace diffx {

/**
 * @brief Infer a scalar Value from raw text
 *
 * @param str Input string to parse
 * @return Bool, Null, Number or String Value
 *
 * Examples:
 * ```cpp
 * parse_scalar("true")       // → true (bool)
 * parse_scalar("NULL")       // → null
 * parse_scalar("-17")        // → -17 (number)
 * parse_scalar("2.5e10")     // → 2.5e10 (number)
 * parse_scalar("007")        // → 7 (number)
 * parse_scalar("1e10")       // → "1e10" (string: no fraction part)
 * parse_scalar("localhost")  // → "localhost"
 * parse_scalar("")           // → "" (empty string)
 * ```
 */
Value parse_scalar(const std::string& str);

} // namespace diffx

#endif // DIFFX_PARSE_HPP
