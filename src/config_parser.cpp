#include "config_parser.hpp"
#include "value_utils.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace reportcalc {

namespace {

std::string required_string(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key)) {
        throw ConfigParseError(where + " missing required field: " + key);
    }
    if (!j[key].is_string()) {
        throw ConfigParseError(where + " field '" + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

size_t parse_index(const json& value, const std::string& what) {
    if (!value.is_number_integer()) {
        throw ConfigParseError(what + " must be an integer");
    }
    long long index = value.get<long long>();
    if (index < 0) {
        throw ConfigParseError(what + " must not be negative");
    }
    return static_cast<size_t>(index);
}

std::vector<size_t> parse_index_list(const json& j, const std::string& key) {
    std::vector<size_t> indices;
    if (!j.contains(key)) {
        return indices;
    }
    if (!j[key].is_array()) {
        throw ConfigParseError("'" + key + "' must be an array of column indices");
    }
    for (const auto& value : j[key]) {
        indices.push_back(parse_index(value, "Column index in '" + key + "'"));
    }
    return indices;
}

std::optional<int> parse_decimal(const json& j) {
    if (!j.contains("decimal") || j["decimal"].is_null()) {
        return std::nullopt;
    }
    size_t decimal = parse_index(j["decimal"], "'decimal'");
    if (decimal > static_cast<size_t>(kMaxDecimalPlaces)) {
        throw ConfigParseError("'decimal' must not exceed " + std::to_string(kMaxDecimalPlaces));
    }
    return static_cast<int>(decimal);
}

size_t required_column(const json& j, const std::string& type) {
    if (!j.contains("column")) {
        throw ConfigParseError("Step '" + type + "' missing required field: column");
    }
    return parse_index(j["column"], "'column'");
}

std::optional<AggregateOp> aggregate_op_from_string(const std::string& operation) {
    if (operation == "average") return AggregateOp::Average;
    if (operation == "sum") return AggregateOp::Sum;
    if (operation == "max") return AggregateOp::Max;
    if (operation == "min") return AggregateOp::Min;
    return std::nullopt;
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

// ============================================================================
// Field mappings
// ============================================================================

FieldMappingConfig parse_field_mapping_config(const json& j) {
    FieldMappingConfig config;

    try {
        if (!j.is_object() || !j.contains("field_mappings")) {
            throw ConfigParseError("Missing required field: field_mappings");
        }
        if (!j["field_mappings"].is_array()) {
            throw ConfigParseError("field_mappings must be an array");
        }

        for (const auto& mapping_json : j["field_mappings"]) {
            if (!mapping_json.is_object()) {
                throw ConfigParseError("Field mapping must be an object");
            }

            FieldMapping mapping;
            mapping.template_field = required_string(mapping_json, "template_field", "Field mapping");
            std::string where = "Field mapping '" + mapping.template_field + "'";
            mapping.source_field = required_string(mapping_json, "source_field", where);
            mapping.type = required_string(mapping_json, "type", where);

            // function (optional, null means not calculated)
            if (mapping_json.contains("function") && !mapping_json["function"].is_null()) {
                mapping.function = mapping_json["function"].get<std::string>();
            }

            // args (optional array of paths)
            if (mapping_json.contains("args") && !mapping_json["args"].is_null()) {
                for (const auto& arg : mapping_json["args"]) {
                    mapping.args.push_back(arg.get<std::string>());
                }
            }

            config.field_mappings.push_back(mapping);
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

FieldMappingConfig parse_field_mapping_config_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse_field_mapping_config(j);
}

FieldMappingConfig parse_field_mapping_config_from_file(const std::string& file_path) {
    return parse_field_mapping_config_from_string(read_file(file_path));
}

// ============================================================================
// Transform steps
// ============================================================================

std::optional<TransformStep> parse_transform_step(const json& j) {
    if (!j.is_object()) {
        throw ConfigParseError("Transform step must be an object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        return std::nullopt;
    }

    try {
        std::string type = j["type"].get<std::string>();

        if (type == "skip_columns") {
            SkipColumnsStep step;
            step.columns = parse_index_list(j, "columns");
            return TransformStep(step);
        }

        if (type == "add_column") {
            AddColumnStep step;
            if (j.contains("position")) {
                step.position = parse_index(j["position"], "'position'");
            }
            step.source = j.value("source", "");
            return TransformStep(step);
        }

        if (type == "calculate") {
            size_t column = required_column(j, type);
            std::string operation = j.value("operation", "");

            const std::string formula_prefix = "formula=";
            if (operation.compare(0, formula_prefix.size(), formula_prefix) == 0) {
                FormulaStep step;
                step.column = column;
                step.formula = operation.substr(formula_prefix.size());
                step.decimal = parse_decimal(j);
                return TransformStep(step);
            }

            auto op = aggregate_op_from_string(operation);
            if (!op) {
                return std::nullopt;
            }
            AggregateStep step;
            step.column = column;
            step.op = *op;
            step.decimal = parse_decimal(j);
            step.function = j.value("function", "");
            return TransformStep(step);
        }

        if (type == "format_column") {
            FormatColumnStep step;
            step.column = required_column(j, type);
            step.function = j.value("function", "");
            step.decimal = parse_decimal(j);
            return TransformStep(step);
        }

        if (type == "reorder") {
            ReorderStep step;
            step.order = parse_index_list(j, "order");
            return TransformStep(step);
        }

        if (type == "filter_rows") {
            FilterRowsStep step;
            step.condition = j.value("condition", "");
            return TransformStep(step);
        }

        if (type == "custom_transform") {
            CustomTransformStep step;
            step.transformer = required_string(j, "transformer", "Step 'custom_transform'");
            step.params = j;
            step.params.erase("type");
            step.params.erase("transformer");
            return TransformStep(step);
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return std::nullopt;
}

std::vector<TransformStep> parse_transform_steps(const json& j) {
    if (!j.is_array()) {
        throw ConfigParseError("Transform steps must be an array");
    }

    std::vector<TransformStep> steps;
    for (size_t i = 0; i < j.size(); ++i) {
        auto step = parse_transform_step(j[i]);
        if (!step) {
            LogContext ctx("config_parser");
            ctx.step_index = i;
            Logger::get_instance().log_warning(ctx, "Skipping unsupported transform step: " + j[i].dump());
            continue;
        }
        steps.push_back(*step);
    }
    return steps;
}

std::vector<TransformStep> parse_transform_steps_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse_transform_steps(j);
}

// ============================================================================
// Options
// ============================================================================

CalculatorOptions parse_calculator_options(const json& j) {
    CalculatorOptions options;
    try {
        if (j.contains("strict_mode")) {
            options.strict_mode = j["strict_mode"].get<bool>();
        }
        if (j.contains("raise_on_error")) {
            options.raise_on_error = j["raise_on_error"].get<bool>();
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
    return options;
}

LoggerConfig parse_logger_config(const json& j) {
    LoggerConfig config;
    try {
        if (j.contains("level")) {
            std::string level = j["level"].get<std::string>();
            if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
                throw ConfigParseError("Invalid log level: " + level);
            }
            config.min_level = string_to_level(level);
        }
        if (j.contains("console")) {
            config.enable_console = j["console"].get<bool>();
        }
        if (j.contains("file") && !j["file"].is_null()) {
            config.enable_file = true;
            config.log_file_path = j["file"].get<std::string>();
        }
        if (j.contains("json")) {
            config.enable_json = j["json"].get<bool>();
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
    return config;
}

} // namespace reportcalc
