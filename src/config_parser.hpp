#ifndef REPORTCALC_CONFIG_PARSER_HPP
#define REPORTCALC_CONFIG_PARSER_HPP

#include "field_calculator.hpp"
#include "logger.hpp"
#include "table/transform_step.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace reportcalc {

/**
 * @brief Exception thrown when configuration parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses {"field_mappings": [...]}
 *
 * @throws ConfigParseError if a required field is missing or has the wrong type
 */
FieldMappingConfig parse_field_mapping_config(const nlohmann::json& j);

/**
 * @brief Parses a field mapping configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid
 */
FieldMappingConfig parse_field_mapping_config_from_string(const std::string& json_string);

/**
 * @brief Parses a field mapping configuration from a JSON file
 *
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 */
FieldMappingConfig parse_field_mapping_config_from_file(const std::string& file_path);

/**
 * @brief Parses one transform step object
 *
 * @return The typed step, or nullopt for an unknown step type or
 *         calculate operation
 * @throws ConfigParseError if the step is malformed
 */
std::optional<TransformStep> parse_transform_step(const nlohmann::json& j);

/**
 * @brief Parses an ordered array of transform steps
 *
 * Unknown step types are logged and skipped.
 *
 * @throws ConfigParseError if the array or any step is malformed
 */
std::vector<TransformStep> parse_transform_steps(const nlohmann::json& j);

std::vector<TransformStep> parse_transform_steps_from_string(const std::string& json_string);

/**
 * @brief Parses {"strict_mode": bool, "raise_on_error": bool}, both optional
 */
CalculatorOptions parse_calculator_options(const nlohmann::json& j);

/**
 * @brief Parses {"level": "DEBUG", "console": true, "file": "path", "json": true}
 *
 * Every key is optional; "file" enables file output.
 */
LoggerConfig parse_logger_config(const nlohmann::json& j);

} // namespace reportcalc

#endif // REPORTCALC_CONFIG_PARSER_HPP
