/**
 * @file custom_functions_example.cpp
 * @brief Registering caller-defined calculation functions
 *
 * This example shows how to:
 * - Register lighting calculations next to the built-in functions
 * - Drive them from a field mapping configuration
 * - Transform a measurement table with a formula step and an aggregate row
 */

#include "../src/config_parser.hpp"
#include "../src/field_calculator.hpp"
#include "../src/function_registry.hpp"
#include "../src/logger.hpp"
#include "../src/value_utils.hpp"
#include "../src/table/data_transformer.hpp"
#include <cmath>
#include <iostream>

using namespace reportcalc;
using json = nlohmann::json;

namespace {

const double kPi = 3.14159265358979323846;

std::optional<double> arg_number(const std::vector<json>& args, size_t index) {
    if (index >= args.size()) {
        return std::nullopt;
    }
    return to_double(args[index]);
}

void register_lighting_functions(FunctionRegistry& registry) {
    // Luminous efficacy in lm/W, 1 decimal
    registry.register_function("calculate_lumen_per_watt", [](const std::vector<json>& args) {
        auto lumen = arg_number(args, 0);
        auto watt = arg_number(args, 1);
        if (!lumen || !watt || *watt == 0.0) {
            return json("0.0");
        }
        return json(format_fixed(*lumen / *watt, 1));
    });

    registry.register_function("calculate_power_factor", [](const std::vector<json>& args) {
        auto active = arg_number(args, 0);
        auto apparent = arg_number(args, 1);
        if (!active || !apparent || *apparent == 0.0) {
            return json("0.00");
        }
        return json(format_fixed(*active / *apparent, 2));
    });

    // value, unit[, decimal_places = 2]
    registry.register_function("format_with_unit", [](const std::vector<json>& args) {
        if (args.size() < 2) {
            throw std::invalid_argument("format_with_unit requires value and unit");
        }
        std::string unit = to_display_string(args[1]);
        auto value = to_double(args[0]);
        auto decimals = arg_number(args, 2);
        if (!value || (args.size() > 2 && !decimals)) {
            return json(to_display_string(args[0]) + " " + unit);
        }
        int places = decimals ? static_cast<int>(*decimals) : 2;
        return json(format_fixed(*value, places) + " " + unit);
    });

    // Signed deviation of measured from rated CCT, in percent
    registry.register_function("calculate_cct_deviation", [](const std::vector<json>& args) {
        auto measured = arg_number(args, 0);
        auto rated = arg_number(args, 1);
        if (!measured || !rated || *rated == 0.0) {
            return json("0.0%");
        }
        double deviation = (*measured - *rated) / *rated * 100.0;
        return json((deviation > 0 ? "+" : "") + format_fixed(deviation, 1) + "%");
    });

    registry.register_function("calculate_average", [](const std::vector<json>& args) {
        double total = 0.0;
        size_t count = 0;
        for (const auto& arg : args) {
            if (arg.is_null()) {
                continue;
            }
            auto value = to_double(arg);
            if (!value) {
                return json("0.00");
            }
            total += *value;
            count++;
        }
        return json(count == 0 ? "0.00" : format_fixed(total / static_cast<double>(count), 2));
    });

    registry.register_function("check_pass_fail", [](const std::vector<json>& args) {
        auto value = arg_number(args, 0);
        auto low = arg_number(args, 1);
        auto high = arg_number(args, 2);
        if (!value || !low || !high) {
            return json("N/A");
        }
        return json(*low <= *value && *value <= *high ? "Pass" : "Fail");
    });

    // I = flux / solid angle, solid angle = 2 pi (1 - cos(angle / 2))
    registry.register_function("calculate_luminous_intensity", [](const std::vector<json>& args) {
        auto flux = arg_number(args, 0);
        auto angle = arg_number(args, 1);
        if (!flux || !angle || *angle <= 0.0 || *angle > 360.0) {
            return json("0.0");
        }
        double half_angle = (*angle / 2.0) * kPi / 180.0;
        double solid_angle = 2.0 * kPi * (1.0 - std::cos(half_angle));
        if (solid_angle == 0.0) {
            return json("0.0");
        }
        return json(format_fixed(*flux / solid_angle, 1));
    });
}

} // anonymous namespace

int main() {
    LoggerConfig log_config;
    log_config.min_level = LogLevel::INFO;
    log_config.enable_console = true;
    log_config.enable_json = true;
    Logger::get_instance().configure(log_config);

    FunctionRegistry registry;
    register_lighting_functions(registry);

    std::cout << "Registered functions:\n";
    for (const auto& name : registry.list_functions()) {
        std::cout << "  " << name << "\n";
    }

    json report = {
        {"metadata", {{"report_no", "LT-2024-001"}}},
        {"extracted_data", {
            {"total_luminous_flux", "1650"},
            {"rated_wattage", "10"},
            {"active_power", 9.6},
            {"apparent_power", 10.1},
            {"measured_cct", "4120"},
            {"rated_cct", 4000},
            {"beam_angle", "36"},
            {"unit_watt", "W"}
        }},
        {"calculated_data", json::object()}
    };

    const std::string config_json = R"({
        "field_mappings": [
            {"template_field": "efficacy_formatted", "source_field": "efficacy_formatted", "type": "text",
             "function": "calculate_lumen_per_watt",
             "args": ["extracted_data.total_luminous_flux", "extracted_data.rated_wattage"]},
            {"template_field": "power_factor_display", "source_field": "power_factor_display", "type": "text",
             "function": "calculate_power_factor",
             "args": ["extracted_data.active_power", "extracted_data.apparent_power"]},
            {"template_field": "wattage_with_unit", "source_field": "wattage_with_unit", "type": "text",
             "function": "format_with_unit",
             "args": ["extracted_data.rated_wattage", "extracted_data.unit_watt"]},
            {"template_field": "cct_deviation", "source_field": "cct_deviation", "type": "text",
             "function": "calculate_cct_deviation",
             "args": ["extracted_data.measured_cct", "extracted_data.rated_cct"]},
            {"template_field": "energy_class", "source_field": "energy_class", "type": "text",
             "function": "energy_class_rating",
             "args": ["extracted_data.rated_wattage", "extracted_data.total_luminous_flux"]},
            {"template_field": "center_intensity", "source_field": "center_intensity", "type": "text",
             "function": "calculate_luminous_intensity",
             "args": ["extracted_data.total_luminous_flux", "extracted_data.beam_angle"]}
        ]
    })";

    try {
        FieldMappingConfig config = parse_field_mapping_config_from_string(config_json);
        FieldCalculator calculator(report, registry);
        auto results = calculator.process_config(config);

        std::cout << "\nCalculated fields:\n";
        for (const auto& pair : results) {
            std::cout << "  " << pair.first << " = " << to_display_string(pair.second.value) << "\n";
        }
        std::cout << "\ncalculated_data: " << report["calculated_data"].dump(2) << "\n";
    } catch (const ConfigParseError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const CalculatorError& e) {
        std::cerr << "Calculation error: " << e.what() << "\n";
        return 1;
    }

    // Efficacy column and an aggregate row for a measurement table
    Grid measurements = {
        {"S1", "10.2", "1650"},
        {"S2", "9.8", "1602"},
        {"S3", "10.0", "1633"}
    };
    json steps = json::parse(R"([
        {"type": "calculate", "column": 3, "operation": "formula=C{row}/B{row}", "decimal": 1},
        {"type": "calculate", "column": 1, "operation": "average", "decimal": 2},
        {"type": "calculate", "column": 2, "operation": "average", "function": "lambda x: f'{x:.0f} lm'"}
    ])");

    TableDataTransformer transformer;
    Grid table;
    try {
        // Formula column 3 does not exist yet: widen the rows first
        Grid widened = measurements;
        for (auto& row : widened) {
            row.emplace_back(std::string());
        }
        table = transformer.transform(widened, steps, TransformContext(), "photometric_summary");
    } catch (const ConfigParseError& e) {
        std::cerr << "Transform configuration error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nTransformed table:\n";
    for (const auto& row : table) {
        std::cout << " ";
        for (const auto& cell : row) {
            std::cout << " | " << cell_to_string(cell);
        }
        std::cout << " |\n";
    }

    Logger::get_instance().flush();
    return 0;
}
