#include "custom_transformers.hpp"
#include "format_rule.hpp"
#include "../expr/safe_eval.hpp"
#include "../logger.hpp"
#include "../value_utils.hpp"
#include <algorithm>
#include <numeric>
#include <regex>
#include <stdexcept>

namespace reportcalc {

using json = nlohmann::json;

namespace {

const json kEmptyObject = json::object();

const json& extracted_or_empty(const TransformContext& context) {
    if (context.extracted_data == nullptr || !context.extracted_data->is_object()) {
        return kEmptyObject;
    }
    return *context.extracted_data;
}

json cell_to_json(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        return *number;
    }
    return std::get<std::string>(cell);
}

// Format rules when any are configured, else fixed decimals, else the
// display form. Non-numeric values pass through as text.
std::string format_value(const json& value, const std::vector<FormatRule>& rules, std::optional<int> decimal) {
    if (!rules.empty()) {
        return format_with_rules(value, rules);
    }
    if (value.is_null()) {
        return "";
    }
    auto number = to_double(value);
    if (!number) {
        return to_display_string(value);
    }
    if (decimal) {
        return format_fixed(*number, *decimal);
    }
    return format_float_repr(*number);
}

std::vector<FormatRule> rules_for_column(const json& rules_by_column, const std::string& key) {
    if (!rules_by_column.is_object() || !rules_by_column.contains(key)) {
        return {};
    }
    return parse_format_rules(rules_by_column[key]);
}

// Replace A1-style references (single letter + row number) with the value
// of that column in the current row
std::string substitute_cell_references(const std::string& formula, const Row& row) {
    static const std::regex reference(R"(([A-Z])\d+)");

    std::string out;
    size_t last = 0;
    for (auto it = std::sregex_iterator(formula.begin(), formula.end(), reference);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        out.append(formula, last, start - last);

        size_t column = static_cast<size_t>(match[1].str()[0] - 'A');
        std::string text = "0";
        if (column < row.size()) {
            if (auto number = cell_number(row[column])) {
                text = format_float_repr(*number);
                if (text[0] == '-') {
                    text = "(" + text + ")";
                }
            }
        }
        out += text;
        last = start + static_cast<size_t>(match.length(0));
    }
    out.append(formula, last, std::string::npos);
    return out;
}

std::string replace_row_token(std::string formula, size_t row_number) {
    const std::string token = "{row}";
    const std::string number = std::to_string(row_number);
    size_t pos = 0;
    while ((pos = formula.find(token, pos)) != std::string::npos) {
        formula.replace(pos, token.size(), number);
        pos += number.size();
    }
    return formula;
}

std::vector<size_t> index_list(const json& params, const std::string& key) {
    std::vector<size_t> indices;
    if (!params.contains(key)) {
        return indices;
    }
    for (const auto& value : params.at(key)) {
        long long index = value.get<long long>();
        if (index < 0) {
            throw TransformError("Negative column index in '" + key + "'");
        }
        indices.push_back(static_cast<size_t>(index));
    }
    return indices;
}

} // anonymous namespace

// ============================================================================
// Registry
// ============================================================================

CustomTransformerRegistry::CustomTransformerRegistry(bool include_builtins) {
    if (!include_builtins) {
        return;
    }
    registry_[TransformerName::PHOTOMETRIC] = photometric_data_transformer;
    registry_[TransformerName::LIFE] = life_table_transformer;
    registry_[TransformerName::BEAM] = beam_table_transformer;
    registry_[TransformerName::EEI] = eei_table_transformer;
    registry_[TransformerName::ZONE] = zone_table_transformer;
}

void CustomTransformerRegistry::register_transformer(const std::string& name, TransformerFunction fn) {
    if (name.empty()) {
        throw std::invalid_argument("Transformer name must not be empty");
    }
    if (!fn) {
        throw std::invalid_argument("Transformer function must not be empty: " + name);
    }
    bool replaced = registry_.find(name) != registry_.end();
    registry_[name] = std::move(fn);
    Logger::get_instance().log_registration("transformers", name, replaced);
}

bool CustomTransformerRegistry::has_transformer(const std::string& name) const {
    return registry_.find(name) != registry_.end();
}

std::vector<std::string> CustomTransformerRegistry::list_transformers() const {
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& pair : registry_) {
        names.push_back(pair.first);
    }
    return names;
}

Grid CustomTransformerRegistry::transform(
    const std::string& name,
    const Grid& grid,
    const json& params,
    const TransformContext& context
) const {
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        std::string available;
        for (const auto& pair : registry_) {
            if (!available.empty()) available += ", ";
            available += pair.first;
        }
        throw TransformError("Unknown transformer: " + name + ". Available transformers: " + available);
    }

    try {
        return it->second(grid, params.is_object() ? params : kEmptyObject, context);
    } catch (const json::exception& e) {
        throw TransformError("Invalid params for transformer " + name + ": " + e.what());
    }
}

// ============================================================================
// Built-in transformers
// ============================================================================

Grid photometric_data_transformer(const Grid& grid, const json& params, const TransformContext& /*context*/) {
    if (grid.empty()) {
        return {};
    }

    Grid result = grid;
    auto& logger = Logger::get_instance();
    LogContext ctx("custom_transformer", TransformerName::PHOTOMETRIC);

    // 1. Per-row formulas; {row} is the 1-based row number
    const json formulas = params.value("formulas", json::object());
    for (size_t column : index_list(params, "calculate_columns")) {
        std::string key = std::to_string(column);
        if (!formulas.contains(key)) {
            continue;
        }
        std::string formula = formulas.at(key).get<std::string>();

        for (size_t row_index = 0; row_index < result.size(); ++row_index) {
            Row& row = result[row_index];
            std::string expression = substitute_cell_references(replace_row_token(formula, row_index + 1), row);

            EvalResult evaluated = try_evaluate_formula(expression, VariableMap());
            if (!evaluated.success) {
                logger.log_cell_failed(ctx, row_index, column, expression, evaluated.error_message);
                continue;
            }
            if (row.size() <= column) {
                row.resize(column + 1, Cell(std::string()));
            }
            if (const auto* number = std::get_if<double>(&evaluated.value)) {
                row[column] = *number;
            } else {
                row[column] = expr::display_string(evaluated.value);
            }
        }
    }

    // 2. Average row
    std::vector<size_t> average_columns = index_list(params, "average_columns");
    const json format_rules = params.value("format_rules", json::object());
    const json average_format_rules = params.value("average_format_rules", json::object());

    if (!average_columns.empty()) {
        Row average_row(std::max<size_t>(result[0].size(), 1), Cell(std::string()));
        average_row[0] = std::string("Average");

        for (size_t column : average_columns) {
            std::vector<double> values;
            for (const auto& row : result) {
                if (column < row.size()) {
                    if (auto number = cell_number(row[column])) {
                        values.push_back(*number);
                    }
                }
            }
            if (values.empty()) {
                continue;
            }

            double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
            std::string key = std::to_string(column);
            std::string text;
            if (average_format_rules.contains(key)) {
                text = format_value(mean, rules_for_column(average_format_rules, key), std::nullopt);
            } else if (format_rules.contains(key)) {
                text = format_value(mean, rules_for_column(format_rules, key), std::nullopt);
            } else {
                text = format_value(mean, {}, 2);
            }

            if (average_row.size() <= column) {
                average_row.resize(column + 1, Cell(std::string()));
            }
            average_row[column] = text;
        }
        result.push_back(std::move(average_row));
    }

    // 3. Format rules on data rows (the average row is already formatted)
    size_t data_rows = average_columns.empty() ? result.size() : result.size() - 1;
    for (auto it = format_rules.begin(); it != format_rules.end(); ++it) {
        auto column = parse_integer(it.key());
        if (!column || *column < 0) {
            logger.log_warning(ctx, "Ignoring format rules for invalid column '" + it.key() + "'");
            continue;
        }
        std::vector<FormatRule> rules = parse_format_rules(it.value());
        size_t index = static_cast<size_t>(*column);

        for (size_t row_index = 0; row_index < data_rows; ++row_index) {
            Row& row = result[row_index];
            if (index < row.size()) {
                row[index] = format_value(cell_to_json(row[index]), rules, std::nullopt);
            }
        }
    }

    return result;
}

Grid life_table_transformer(const Grid& grid, const json& params, const TransformContext& context) {
    return photometric_data_transformer(grid, params, context);
}

Grid beam_table_transformer(const Grid& /*grid*/, const json& params, const TransformContext& context) {
    const json& extracted = extracted_or_empty(context);
    if (extracted.empty()) {
        return {};
    }

    auto format_field = [&](const std::string& field_key, const std::string& default_field,
                            const std::string& format_key, const std::string& default_format) {
        std::string field = params.value(field_key, default_field);
        std::string format = params.value(format_key, default_format);
        json value = extracted.contains(field) ? extracted.at(field) : json("");
        auto number = to_double(value);
        if (!number) {
            return to_display_string(value);
        }
        return format_number_with(*number, format);
    };

    std::string beam_angle = format_field("beam_angle_field", "beam_angle", "beam_angle_format", "{:.1f}");
    std::string intensity = format_field("peak_intensity_field", "peak_intensity", "peak_intensity_format", "{:.0f}");

    return {
        {std::string(), std::string()},
        {std::string(), beam_angle},
        {std::string(), intensity}
    };
}

Grid eei_table_transformer(const Grid& /*grid*/, const json& params, const TransformContext& context) {
    const json& extracted = extracted_or_empty(context);
    if (extracted.empty()) {
        return {};
    }

    std::string photometric_ref = params.value("photometric_data_ref", "photometric_data");
    long long efficacy_column = params.value("efficacy_column", 5LL);
    const json thresholds = params.value("eei_thresholds", json{
        {"A++", 130}, {"A+", 110}, {"A", 90}, {"B", 70}, {"C", 50}, {"D", 30}
    });
    std::vector<size_t> merge_columns = params.contains("merge_columns")
        ? index_list(params, "merge_columns")
        : std::vector<size_t>{3, 4};
    const json format_rules = params.value("format_rules", json::object());

    // Average efficacy over the referenced grid
    std::vector<double> values;
    if (extracted.contains(photometric_ref) && extracted.at(photometric_ref).is_array() && efficacy_column >= 0) {
        size_t column = static_cast<size_t>(efficacy_column);
        for (const auto& row : extracted.at(photometric_ref)) {
            if (row.is_array() && row.size() > column) {
                if (auto number = to_double(row[column])) {
                    values.push_back(*number);
                }
            }
        }
    }
    double average = values.empty()
        ? 0.0
        : std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());

    // Highest threshold reached wins
    std::vector<std::pair<double, std::string>> classes;
    for (auto it = thresholds.begin(); it != thresholds.end(); ++it) {
        classes.emplace_back(it.value().get<double>(), it.key());
    }
    std::stable_sort(classes.begin(), classes.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });
    std::string eei_class = "E";
    for (const auto& entry : classes) {
        if (average >= entry.first) {
            eei_class = entry.second;
            break;
        }
    }

    std::string efficacy = format_rules.contains("1")
        ? format_value(average, rules_for_column(format_rules, "1"), std::nullopt)
        : format_value(average, {}, 1);

    auto make_row = [&](const std::string& model) {
        Row row = {model, efficacy, eei_class};
        for (size_t column : merge_columns) {
            if (row.size() <= column) {
                row.resize(column + 1, Cell(std::string()));
            }
            row[column] = std::string(kMergeMarker);
        }
        return row;
    };

    Grid result;
    if (params.contains("model_fields")) {
        for (const auto& field : params.at("model_fields")) {
            std::string name = field.get<std::string>();
            if (extracted.contains(name) && is_truthy(extracted.at(name))) {
                result.push_back(make_row(to_display_string(extracted.at(name))));
            }
        }
    }
    if (result.empty()) {
        result.push_back(make_row(""));
    }
    return result;
}

Grid zone_table_transformer(const Grid& /*grid*/, const json& params, const TransformContext& context) {
    const json& extracted = extracted_or_empty(context);
    if (extracted.empty()) {
        return {};
    }

    const json zone_angles = params.value("zone_angles", json{30, 60, 90, 120, 150, 180});
    std::string beam_angle_field = params.value("beam_angle_field", "beam_angle");
    std::string format = params.value("format", "{:.1f}");
    double min_angle = params.value("min_angle", 30.0);

    double beam_angle = 0.0;
    if (extracted.contains(beam_angle_field)) {
        beam_angle = to_double(extracted.at(beam_angle_field)).value_or(0.0);
    }

    // The widest zone must cover the beam
    double max_angle = std::max(beam_angle * 1.2, 180.0);
    if (params.contains("max_angle_override") && is_truthy(params.at("max_angle_override"))) {
        max_angle = params.at("max_angle_override").get<double>();
    }

    Grid result;
    for (const auto& angle : zone_angles) {
        double degrees = angle.get<double>();
        if (degrees < min_angle || degrees > max_angle) {
            continue;
        }
        std::string label = to_display_string(angle);
        std::string field = "zone_" + label;
        if (!extracted.contains(field)) {
            continue;
        }
        const json& value = extracted.at(field);
        if (value.is_null() || (value.is_string() && value.get<std::string>().empty())) {
            continue;
        }

        auto number = to_double(value);
        std::string text = number ? format_number_with(*number, format) : to_display_string(value);
        result.push_back(Row{"0-" + label + "\xC2\xB0", text});
    }
    return result;
}

} // namespace reportcalc
