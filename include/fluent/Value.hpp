/**
 * @file Value.hpp
 * @brief Value type for collection items
 *
 * Uses nlohmann::ordered_json as the underlying value model so nested
 * mappings keep their insertion order:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 *
 * The scalar helpers below give values the loose, scripting-style
 * conversions the query and aggregate layers rely on.
 */

#ifndef FLUENT_VALUE_HPP
#define FLUENT_VALUE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace fluent {

/**
 * @brief JSON-like value type for collection items
 *
 * This is an alias for nlohmann::ordered_json. Objects preserve the order
 * in which their keys were inserted, which every ordered operation of a
 * collection depends on.
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
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Parse a string as a number the way numeric strings are recognised.
 *
 * Accepts optional surrounding whitespace, a sign, digits with an optional
 * fraction and an optional exponent. "12", " 1.5", "-3e2" are numeric;
 * "", "abc", "1x", "." are not.
 *
 * @return The numeric value, or nullopt when the string is not numeric
 */
std::optional<double> parse_numeric(const std::string& text);

/**
 * @brief Check whether a value is a number or a numeric string.
 */
bool is_numeric(const Value& val);

/**
 * @brief Numeric cast: numbers as-is, numeric strings parsed, bools 0/1,
 *        everything else 0.
 */
double to_number(const Value& val);

/**
 * @brief String cast.
 *
 * - null → ""
 * - true → "1", false → ""
 * - integers in decimal
 * - floats in the shortest form that round-trips ("2.5", "3", "0.1")
 * - strings unchanged
 * - arrays and objects as compact JSON
 */
std::string to_string(const Value& val);

/**
 * @brief Truthiness: null, false, 0, 0.0, "", "0" and empty containers are
 *        falsy; everything else is truthy.
 */
bool truthy(const Value& val);

/**
 * @brief The value as a signed 64-bit integer, when it is an integer that
 *        fits; unsigned values above INT64_MAX and non-integers give nullopt.
 */
std::optional<std::int64_t> exact_int64(const Value& val);

/**
 * @brief Add two numeric values, yielding an integer when both operands
 *        are integers and the sum fits in 64 bits, a float otherwise.
 */
Value add(const Value& lhs, const Value& rhs);

/**
 * @brief Divide two numeric values, yielding an integer when both operands
 *        are integers and the division is exact, a float otherwise.
 * @throws InvalidArgumentError on division by zero
 */
Value divide(const Value& lhs, const Value& rhs);

} // namespace fluent

#endif // FLUENT_VALUE_HPP
