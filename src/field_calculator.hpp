/**
 * @file field_calculator.hpp
 * @brief Computes derived report fields from declarative field mappings
 *
 * A report has three sections (metadata, extracted_data, calculated_data).
 * Each mapping names a function and the paths of its arguments; the result
 * is written back into calculated_data.
 */

#ifndef REPORTCALC_FIELD_CALCULATOR_HPP
#define REPORTCALC_FIELD_CALCULATOR_HPP

#include "function_registry.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace reportcalc {

/**
 * @brief Base exception for field calculation errors
 */
class CalculatorError : public std::runtime_error {
public:
    explicit CalculatorError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when an argument path does not resolve (strict mode)
 */
class FieldNotFoundError : public CalculatorError {
public:
    FieldNotFoundError(
        const std::string& field_path,
        const std::map<std::string, std::vector<std::string>>& available_fields = {}
    );

    const std::string& field_path() const { return field_path_; }

private:
    std::string field_path_;

    static std::string build_message(
        const std::string& field_path,
        const std::map<std::string, std::vector<std::string>>& available_fields
    );
};

/**
 * @brief Raised when a mapping names a function that is not registered
 */
class FunctionNotFoundError : public CalculatorError {
public:
    explicit FunctionNotFoundError(const std::string& function_name)
        : CalculatorError("Function not found: " + function_name),
          function_name_(function_name) {}

    const std::string& function_name() const { return function_name_; }

private:
    std::string function_name_;
};

/**
 * @brief Raised when a registered function fails
 */
class CalculationError : public CalculatorError {
public:
    explicit CalculationError(const std::string& message)
        : CalculatorError(message) {}
};

/**
 * @brief A value read from (or written to) the report
 *
 * Numeric strings are coerced to numbers once, on construction.
 */
struct FieldValue {
    nlohmann::json value;        ///< Coerced value
    std::string source;          ///< "report" or "calculated_data"
    std::string field_name;      ///< Path the value belongs to

    FieldValue() = default;
    FieldValue(const nlohmann::json& value_, const std::string& source_, const std::string& field_name_);
};

/**
 * @brief One entry of the field_mappings configuration
 */
struct FieldMapping {
    std::string template_field;      ///< Placeholder name in the document template
    std::string source_field;        ///< Target path of the computed value
    std::string type;                ///< "text", "image", "table", ...
    std::string function;            ///< Registered function name (empty = not calculated)
    std::vector<std::string> args;   ///< Argument paths into the report

    FieldMapping() = default;
    FieldMapping(const std::string& template_field_, const std::string& source_field_,
                 const std::string& type_ = "text")
        : template_field(template_field_), source_field(source_field_), type(type_) {}
};

/**
 * @brief Complete field mapping configuration
 */
struct FieldMappingConfig {
    std::vector<FieldMapping> field_mappings;
};

/**
 * @brief Failure policy for a calculation batch
 */
struct CalculatorOptions {
    bool strict_mode;        ///< Missing argument fails the mapping (else null is passed)
    bool raise_on_error;     ///< First failed mapping aborts the batch

    CalculatorOptions() : strict_mode(false), raise_on_error(false) {}
    CalculatorOptions(bool strict, bool raise)
        : strict_mode(strict), raise_on_error(raise) {}
};

/**
 * @brief Resolves field mappings against a report
 *
 * The calculator holds references to the caller's report (mutated in
 * place) and registry; both must outlive it.
 *
 * Usage Example:
 *   @code
 *   FunctionRegistry registry;
 *   FieldCalculator calculator(report, registry, CalculatorOptions(false, false));
 *   auto results = calculator.process_config(config);
 *   @endcode
 */
class FieldCalculator {
public:
    FieldCalculator(
        nlohmann::json& report,
        const FunctionRegistry& registry,
        const CalculatorOptions& options = CalculatorOptions()
    );

    /**
     * @brief Read a value by dot path
     *
     * @throws FieldNotFoundError If the path does not resolve or holds null
     */
    FieldValue get_value(const std::string& field_path) const;

    /**
     * @brief Calculate one mapping and write its result into the report
     *
     * @throws FieldNotFoundError In strict mode, for a missing argument
     * @throws FunctionNotFoundError If the function is not registered
     * @throws CalculationError If the function throws
     */
    FieldValue calculate_field(const FieldMapping& mapping);

    /**
     * @brief Calculate every mapping that names a function
     *
     * @return Results keyed by template field
     * @throws FunctionNotFoundError Always propagated
     * @throws CalculatorError First other failure, when raise_on_error is set
     */
    std::map<std::string, FieldValue> process_config(const FieldMappingConfig& config);

    /**
     * @brief All values computed so far, keyed by target path
     */
    const std::map<std::string, FieldValue>& calculated_values() const { return calculated_values_; }

    const nlohmann::json& report() const { return report_; }
    const CalculatorOptions& options() const { return options_; }

    /**
     * @brief Target path for a mapping's source_field
     *
     * Paths not rooted in a report section are placed under calculated_data.
     */
    static std::string resolve_target_path(const std::string& source_field);

private:
    nlohmann::json& report_;
    const FunctionRegistry& registry_;
    CalculatorOptions options_;
    std::map<std::string, FieldValue> calculated_values_;

    std::map<std::string, std::vector<std::string>> available_fields() const;
};

} // namespace reportcalc

#endif // REPORTCALC_FIELD_CALCULATOR_HPP
