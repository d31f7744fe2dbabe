#ifndef REPORTCALC_BUILTIN_FUNCTIONS_HPP
#define REPORTCALC_BUILTIN_FUNCTIONS_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reportcalc {

class FunctionRegistry;

// Energy class from luminous efficacy (flux / wattage, lm/W).
// Inclusive lower bounds: 210 A++, 185 A+, 160 A, 135 B, 110 C, 85 D, else E.
// "N/A" when wattage is falsy or zero, or flux is falsy or non-numeric.
std::string energy_class_rating(const nlohmann::json& wattage, const nlohmann::json& flux);

// Efficacy (flux / wattage) to 2 decimals, "N/A" under the same guards
std::string energy_efficacy(const nlohmann::json& wattage, const nlohmann::json& flux);

// (value / total) * 100 to 2 decimals with '%'; "0.00%" for a zero or missing total
std::string percentage(const nlohmann::json& value, const nlohmann::json& total);

// Value to `decimals` places; non-numeric input returns its display form
std::string format_number(const nlohmann::json& value, const nlohmann::json& decimals = 2);

// Display forms of all non-null values joined by separator
std::string concat(const std::vector<nlohmann::json>& values, const std::string& separator = " ");

// a * b as floats; 0.0 for non-numeric input
double multiply(const nlohmann::json& a, const nlohmann::json& b);

// a / b as floats; fallback on a zero denominator or non-numeric input
double divide(const nlohmann::json& a, const nlohmann::json& b, const nlohmann::json& fallback = 0.0);

// Register all of the above (plus the calculate_* aliases) into registry
void register_builtin_functions(FunctionRegistry& registry);

} // namespace reportcalc

#endif // REPORTCALC_BUILTIN_FUNCTIONS_HPP
