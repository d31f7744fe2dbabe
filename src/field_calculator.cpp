/**
 * @file field_calculator.cpp
 * @brief Implementation of FieldCalculator
 */

#include "field_calculator.hpp"
#include "logger.hpp"
#include "path_navigator.hpp"
#include "value_utils.hpp"
#include <sstream>

namespace reportcalc {

namespace {

const char* const kSections[] = {"metadata", "extracted_data", "calculated_data"};

std::string describe_args(const std::vector<nlohmann::json>& args) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << to_display_string(args[i]);
    }
    oss << "]";
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// Errors and FieldValue
// ============================================================================

FieldNotFoundError::FieldNotFoundError(
    const std::string& field_path,
    const std::map<std::string, std::vector<std::string>>& available_fields
) : CalculatorError(build_message(field_path, available_fields)),
    field_path_(field_path) {}

std::string FieldNotFoundError::build_message(
    const std::string& field_path,
    const std::map<std::string, std::vector<std::string>>& available_fields
) {
    std::ostringstream oss;
    oss << "Field not found: " << field_path;
    if (!available_fields.empty()) {
        oss << "\nAvailable fields:";
        for (const auto& [section, keys] : available_fields) {
            oss << " " << section << "=[";
            for (size_t i = 0; i < keys.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << keys[i];
            }
            oss << "]";
        }
    }
    return oss.str();
}

FieldValue::FieldValue(const nlohmann::json& value_, const std::string& source_, const std::string& field_name_)
    : value(coerce_numeric_string(value_)), source(source_), field_name(field_name_) {}

// ============================================================================
// FieldCalculator
// ============================================================================

FieldCalculator::FieldCalculator(
    nlohmann::json& report,
    const FunctionRegistry& registry,
    const CalculatorOptions& options
) : report_(report), registry_(registry), options_(options) {}

FieldValue FieldCalculator::get_value(const std::string& field_path) const {
    const nlohmann::json* value = PathNavigator::get(report_, field_path);
    if (value == nullptr || value->is_null()) {
        throw FieldNotFoundError(field_path, available_fields());
    }
    return FieldValue(*value, "report", field_path);
}

std::map<std::string, std::vector<std::string>> FieldCalculator::available_fields() const {
    std::map<std::string, std::vector<std::string>> available;
    if (!report_.is_object()) {
        return available;
    }
    for (const char* section : kSections) {
        auto it = report_.find(section);
        if (it == report_.end() || !it->is_object()) {
            continue;
        }
        auto& keys = available[section];
        for (auto field = it->begin(); field != it->end(); ++field) {
            keys.push_back(field.key());
        }
    }
    return available;
}

std::string FieldCalculator::resolve_target_path(const std::string& source_field) {
    for (const char* section : kSections) {
        std::string prefix = std::string(section) + ".";
        if (source_field.compare(0, prefix.size(), prefix) == 0) {
            return source_field;
        }
    }
    return "calculated_data." + source_field;
}

FieldValue FieldCalculator::calculate_field(const FieldMapping& mapping) {
    if (mapping.source_field.empty()) {
        throw CalculatorError("Field mapping '" + mapping.template_field + "' has no source_field");
    }

    // Resolve arguments
    std::vector<nlohmann::json> args;
    args.reserve(mapping.args.size());
    for (const auto& arg_path : mapping.args) {
        try {
            args.push_back(get_value(arg_path).value);
        } catch (const FieldNotFoundError&) {
            if (options_.strict_mode) {
                throw;
            }
            args.push_back(nullptr);
        }
    }

    nlohmann::json result;
    if (!mapping.function.empty()) {
        const FunctionRegistry::CalcFunction* fn = registry_.get(mapping.function);
        if (fn == nullptr) {
            throw FunctionNotFoundError(mapping.function);
        }

        try {
            result = (*fn)(args);
        } catch (const std::exception& e) {
            throw CalculationError(
                "Error executing function '" + mapping.function + "' with args " +
                describe_args(args) + ": " + e.what()
            );
        }
    } else if (!args.empty()) {
        // No function: pass the first argument through
        result = args.front();
    }

    std::string target_path = resolve_target_path(mapping.source_field);
    try {
        PathNavigator::set(report_, target_path, result);
    } catch (const PathError& e) {
        throw CalculationError(e.what());
    }

    FieldValue field_value(result, "calculated_data", target_path);
    calculated_values_[target_path] = field_value;
    return field_value;
}

std::map<std::string, FieldValue> FieldCalculator::process_config(const FieldMappingConfig& config) {
    Logger& logger = Logger::get_instance();
    std::map<std::string, FieldValue> results;

    for (const auto& mapping : config.field_mappings) {
        if (mapping.function.empty()) {
            continue;  // Only mappings with a function are calculated
        }

        LogContext ctx("calculator", mapping.template_field);
        try {
            FieldValue field_value = calculate_field(mapping);
            results[mapping.template_field] = field_value;
            logger.log_field_calculated(ctx, field_value.field_name, to_display_string(field_value.value));
        } catch (const FunctionNotFoundError& e) {
            logger.log_field_failed(ctx, "function_not_found", e.what(), true);
            throw;
        } catch (const FieldNotFoundError& e) {
            logger.log_field_failed(ctx, "field_not_found", e.what(), options_.raise_on_error);
            if (options_.raise_on_error) {
                throw;
            }
        } catch (const CalculatorError& e) {
            logger.log_field_failed(ctx, "calculation_error", e.what(), options_.raise_on_error);
            if (options_.raise_on_error) {
                throw;
            }
        }
    }

    return results;
}

} // namespace reportcalc
