/**
 * @file Scalar.hpp
 * @brief Typing of plain (unquoted) YAML scalars
 *
 * Implements the JSON-compatible part of the YAML 1.2 core schema, with an
 * optional leading '+' on numbers. Hexadecimal ("0x1F"), octal ("0o17"),
 * dot-leading (".5") and dot-trailing ("1.") forms, and integers with
 * leading zeros, stay strings. Quoted scalars never reach these rules: they
 * are always strings.
 *
 * Resolution order (first match wins):
 * - S1: Null ("", "~", "null", "Null", "NULL")
 * - S2: Boolean ("true", "True", "TRUE", "false", "False", "FALSE")
 * - S3: Integer (matches ^[-+]?(0|[1-9][0-9]*)$ and fits in int64)
 * - S4: Float (JSON number grammar with a fraction or exponent, optional '+')
 * - S5: Special floats (.inf, -.inf, +.inf, .nan in the three YAML casings)
 * - S6: String (fallback, including timestamps)
 */

#ifndef UNCLOBBER_SCALAR_HPP
#define UNCLOBBER_SCALAR_HPP

#include "unclobber/Value.hpp"
#include <string>

namespace unclobber {

/**
 * @brief Resolve a plain scalar to a typed Value
 *
 * @param str Scalar text exactly as it appeared in the YAML source
 * @return Typed Value
 *
 * Examples:
 * ```cpp
 * parse_scalar("~")           // → null
 * parse_scalar("True")        // → true (boolean)
 * parse_scalar("yes")         // → "yes" (string, YAML 1.1 booleans are not used)
 * parse_scalar("42")          // → 42 (integer)
 * parse_scalar("007")         // → "007" (string, leading zero)
 * parse_scalar("2.5e3")       // → 2500.0 (float)
 * parse_scalar("2024-06-01")  // → "2024-06-01" (string)
 * ```
 */
Value parse_scalar(const std::string& str);

/**
 * @brief Check whether a string survives a write/read cycle as a plain scalar
 *
 * Returns false when the text would come back as null, boolean or number,
 * which means the emitter has to quote it.
 */
bool reads_back_as_string(const std::string& str);

} // namespace unclobber

#endif // UNCLOBBER_SCALAR_HPP
