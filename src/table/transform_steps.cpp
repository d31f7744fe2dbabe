#include "transform_steps.hpp"
#include "../expr/safe_eval.hpp"
#include "../value_utils.hpp"
#include <algorithm>
#include <numeric>
#include <set>

namespace reportcalc {

using json = nlohmann::json;

namespace {

std::string lookup_named_value(const json* source, const std::string& list_key, const std::string& name) {
    if (source == nullptr || !source->is_object() || !source->contains(list_key)) {
        return "";
    }
    const json& entries = (*source)[list_key];
    if (!entries.is_array()) {
        return "";
    }
    for (const auto& entry : entries) {
        if (!entry.is_object()) {
            continue;
        }
        auto name_it = entry.find("name");
        if (name_it != entry.end() && name_it->is_string() && name_it->get<std::string>() == name) {
            auto value_it = entry.find("value");
            if (value_it == entry.end() || value_it->is_null()) {
                return "";
            }
            return to_display_string(*value_it);
        }
    }
    return "";
}

} // anonymous namespace

std::string step_type_name(const TransformStep& step) {
    switch (step.index()) {
        case 0: return "skip_columns";
        case 1: return "add_column";
        case 2: return "calculate";
        case 3: return "calculate";
        case 4: return "format_column";
        case 5: return "reorder";
        case 6: return "filter_rows";
        case 7: return "custom_transform";
        default: return "unknown";
    }
}

bool is_aggregation(const TransformStep& step) {
    return std::holds_alternative<AggregateStep>(step);
}

std::string aggregate_op_to_string(AggregateOp op) {
    switch (op) {
        case AggregateOp::Average: return "average";
        case AggregateOp::Sum: return "sum";
        case AggregateOp::Max: return "max";
        case AggregateOp::Min: return "min";
        default: return "unknown";
    }
}

std::string resolve_column_source(const std::string& source, size_t row_index, const TransformContext& context) {
    if (source == "row_index") {
        return std::to_string(row_index + 1);
    }

    size_t colon = source.find(':');
    if (colon == std::string::npos) {
        return "";
    }
    std::string kind = source.substr(0, colon);
    std::string key = source.substr(colon + 1);

    if (kind == "metadata") {
        return lookup_named_value(context.metadata, "fields", key);
    }
    if (kind == "targets") {
        return lookup_named_value(context.targets, "targets", key);
    }
    if (kind == "value") {
        return key;
    }
    return "";
}

Grid apply_skip_columns(const Grid& grid, const SkipColumnsStep& step) {
    if (step.columns.empty()) {
        return grid;
    }

    std::set<size_t> skipped(step.columns.begin(), step.columns.end());
    Grid result;
    result.reserve(grid.size());
    for (const auto& row : grid) {
        Row filtered;
        for (size_t i = 0; i < row.size(); ++i) {
            if (skipped.count(i) == 0) {
                filtered.push_back(row[i]);
            }
        }
        result.push_back(std::move(filtered));
    }
    return result;
}

Grid apply_add_column(const Grid& grid, const AddColumnStep& step, const TransformContext& context) {
    Grid result;
    result.reserve(grid.size());

    for (size_t row_index = 0; row_index < grid.size(); ++row_index) {
        Row row = grid[row_index];
        std::string value = resolve_column_source(step.source, row_index, context);
        size_t position = std::min(step.position, row.size());

        if (row_index == 0 && step.position >= row.size()) {
            row.emplace_back(value);
        } else if (row_index == 0 && !value.empty()) {
            row.insert(row.begin() + static_cast<std::ptrdiff_t>(position), Cell(value));
        } else {
            row.insert(row.begin() + static_cast<std::ptrdiff_t>(position), Cell(std::string()));
        }
        result.push_back(std::move(row));
    }
    return result;
}

Grid apply_formula(const Grid& grid, const FormulaStep& step, const LogContext& ctx) {
    Grid result = grid;
    auto& logger = Logger::get_instance();

    for (size_t row_index = 0; row_index < result.size(); ++row_index) {
        Row& row = result[row_index];
        if (step.column >= row.size()) {
            logger.log_cell_failed(ctx, row_index, step.column, step.formula, "Column out of range");
            continue;
        }

        EvalResult evaluated = try_evaluate_row_formula(step.formula, row_index, row);
        if (!evaluated.success) {
            logger.log_cell_failed(ctx, row_index, step.column, step.formula, evaluated.error_message);
            continue;
        }

        if (step.decimal) {
            if (!expr::is_number(evaluated.value)) {
                logger.log_cell_failed(ctx, row_index, step.column, step.formula,
                                       "Cannot apply decimal format to " + expr::type_name(evaluated.value));
                continue;
            }
            row[step.column] = format_fixed(expr::as_double(evaluated.value), *step.decimal);
        } else {
            row[step.column] = expr::display_string(evaluated.value);
        }
    }
    return result;
}

Grid apply_format_column(const Grid& grid, const FormatColumnStep& step, const LogContext& ctx) {
    auto& logger = Logger::get_instance();

    if (!step.function.empty()) {
        std::optional<FormatFunction> format_fn;
        try {
            format_fn = compile_format(step.function);
        } catch (const SafeEvalError& e) {
            logger.log_warning(ctx, "Failed to create format function: " + std::string(e.what()));
            return grid;
        }

        Grid result = grid;
        for (size_t row_index = 0; row_index < result.size(); ++row_index) {
            Row& row = result[row_index];
            if (step.column >= row.size()) {
                continue;
            }
            auto number = cell_number(row[step.column]);
            if (!number) {
                continue;
            }
            try {
                row[step.column] = (*format_fn)(*number);
            } catch (const SafeEvalError& e) {
                logger.log_cell_failed(ctx, row_index, step.column, step.function, e.what());
                row[step.column] = format_float_repr(*number);
            }
        }
        return result;
    }

    if (!step.decimal) {
        return grid;
    }

    Grid result = grid;
    for (auto& row : result) {
        if (step.column >= row.size()) {
            continue;
        }
        if (auto number = cell_number(row[step.column])) {
            row[step.column] = format_fixed(*number, *step.decimal);
        }
    }
    return result;
}

Grid apply_reorder(const Grid& grid, const ReorderStep& step) {
    Grid result;
    result.reserve(grid.size());
    for (const auto& row : grid) {
        Row reordered;
        for (size_t index : step.order) {
            if (index < row.size()) {
                reordered.push_back(row[index]);
            }
        }
        result.push_back(std::move(reordered));
    }
    return result;
}

Grid apply_filter_rows(const Grid& grid, const FilterRowsStep& step) {
    if (step.condition != "remove_empty" && step.condition != "remove_all_empty") {
        return grid;
    }

    Grid result;
    for (const auto& row : grid) {
        bool has_content = std::any_of(row.begin(), row.end(),
                                       [](const Cell& cell) { return !is_blank_cell(cell); });
        if (has_content) {
            result.push_back(row);
        }
    }
    return result;
}

Grid apply_aggregates(const Grid& grid, const std::vector<AggregateStep>& steps, const LogContext& ctx) {
    if (grid.empty() || steps.empty()) {
        return grid;
    }

    size_t width = 0;
    for (const auto& row : grid) {
        width = std::max(width, row.size());
    }
    for (const auto& step : steps) {
        width = std::max(width, step.column + 1);
    }

    Row summary(width, Cell(std::string()));
    auto& logger = Logger::get_instance();

    for (const auto& step : steps) {
        std::vector<double> values;
        for (const auto& row : grid) {
            if (step.column < row.size()) {
                if (auto number = cell_number(row[step.column])) {
                    values.push_back(*number);
                }
            }
        }
        if (values.empty()) {
            continue;
        }

        double aggregate = 0.0;
        switch (step.op) {
            case AggregateOp::Average:
                aggregate = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
                break;
            case AggregateOp::Sum:
                aggregate = std::accumulate(values.begin(), values.end(), 0.0);
                break;
            case AggregateOp::Max:
                aggregate = *std::max_element(values.begin(), values.end());
                break;
            case AggregateOp::Min:
                aggregate = *std::min_element(values.begin(), values.end());
                break;
        }

        std::string text;
        if (step.decimal) {
            text = format_fixed(aggregate, *step.decimal);
        } else if (!step.function.empty()) {
            EvalResult formatted = try_evaluate_format(step.function, aggregate);
            if (formatted.success) {
                text = expr::display_string(formatted.value);
            } else {
                logger.log_cell_failed(ctx, grid.size(), step.column, step.function, formatted.error_message);
                text = format_float_repr(aggregate);
            }
        } else {
            text = format_float_repr(aggregate);
        }
        summary[step.column] = text;
    }

    Grid result = grid;
    result.push_back(std::move(summary));
    return result;
}

} // namespace reportcalc
