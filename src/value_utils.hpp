/**
 * @file value_utils.hpp
 * @brief Scalar conversions shared by the calculator and the table pipeline
 *
 * Report values arrive as loosely typed JSON (numbers stored as strings,
 * nulls, booleans). These helpers give them one consistent numeric reading
 * and one consistent printed form.
 */

#ifndef REPORTCALC_VALUE_UTILS_HPP
#define REPORTCALC_VALUE_UTILS_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace reportcalc {

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(const std::string& str);

/**
 * @brief Parse a whole string as an integer
 *
 * Accepts surrounding whitespace, an optional sign and '_' between digits.
 *
 * @return Parsed integer, or std::nullopt if the string is not an integer
 *         or does not fit in 64 bits
 */
std::optional<long long> parse_integer(const std::string& str);

/**
 * @brief Parse a whole string as a floating-point number
 *
 * Accepts surrounding whitespace, decimal and exponent forms, "inf" and
 * "nan". Hexadecimal floats are rejected.
 *
 * @return Parsed value, or std::nullopt if any character is left over
 */
std::optional<double> parse_double(const std::string& str);

/**
 * @brief Coerce a numeric string into a JSON number
 *
 * Integers are tried first, then floats. Non-string values and
 * non-numeric strings are returned unchanged.
 */
nlohmann::json coerce_numeric_string(const nlohmann::json& value);

/**
 * @brief Numeric reading of a value
 *
 * Numbers and booleans convert directly; strings are parsed with
 * parse_double. Everything else has no numeric reading.
 */
std::optional<double> to_double(const nlohmann::json& value);

/**
 * @brief Truth value of a report value
 *
 * null, false, zero, the empty string and empty containers are false.
 */
bool is_truthy(const nlohmann::json& value);

/**
 * @brief Shortest round-trip text for a double
 *
 * Always carries a fractional part or an exponent ("4000.0", "0.1",
 * "1e+20"); exponent notation is used below 1e-4 and from 1e16.
 */
std::string format_float_repr(double value);

/// Largest decimal count accepted for fixed-point output
constexpr int kMaxDecimalPlaces = 100;

/**
 * @brief Fixed-point text with the given number of decimals
 *
 * Decimals are clamped to kMaxDecimalPlaces.
 */
std::string format_fixed(double value, int decimals);

/**
 * @brief Printed form of a report value
 *
 * null -> "None", booleans -> "True"/"False", strings verbatim, numbers
 * in their shortest form, containers as compact JSON.
 */
std::string to_display_string(const nlohmann::json& value);

} // namespace reportcalc

#endif // REPORTCALC_VALUE_UTILS_HPP
