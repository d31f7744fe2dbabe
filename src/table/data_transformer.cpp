#include "data_transformer.hpp"
#include "transform_steps.hpp"
#include "../config_parser.hpp"

namespace reportcalc {

TableDataTransformer::TableDataTransformer(const CustomTransformerRegistry* transformers)
    : transformers_(transformers) {}

Grid TableDataTransformer::transform(
    const Grid& grid,
    const std::vector<TransformStep>& steps,
    const TransformContext& context,
    const std::string& table_name
) const {
    auto& logger = Logger::get_instance();
    LogContext ctx("transformer", table_name);

    Grid current = grid;
    std::vector<AggregateStep> aggregates;

    for (size_t i = 0; i < steps.size(); ++i) {
        const TransformStep& step = steps[i];
        if (const auto* aggregate = std::get_if<AggregateStep>(&step)) {
            aggregates.push_back(*aggregate);
            continue;
        }

        ctx.step_index = i;
        size_t rows_in = current.size();
        current = apply_step(current, step, context, ctx);
        logger.log_transform_step(ctx, step_type_name(step), rows_in, current.size());
    }

    if (!aggregates.empty()) {
        ctx.step_index = steps.size();
        size_t rows_in = current.size();
        current = apply_aggregates(current, aggregates, ctx);
        logger.log_transform_step(ctx, "aggregate", rows_in, current.size());
    }

    return current;
}

Grid TableDataTransformer::transform(
    const Grid& grid,
    const nlohmann::json& steps_config,
    const TransformContext& context,
    const std::string& table_name
) const {
    return transform(grid, parse_transform_steps(steps_config), context, table_name);
}

Grid TableDataTransformer::apply_step(
    const Grid& grid,
    const TransformStep& step,
    const TransformContext& context,
    const LogContext& ctx
) const {
    if (const auto* skip = std::get_if<SkipColumnsStep>(&step)) {
        return apply_skip_columns(grid, *skip);
    }
    if (const auto* add = std::get_if<AddColumnStep>(&step)) {
        return apply_add_column(grid, *add, context);
    }
    if (const auto* formula = std::get_if<FormulaStep>(&step)) {
        return apply_formula(grid, *formula, ctx);
    }
    if (const auto* format = std::get_if<FormatColumnStep>(&step)) {
        return apply_format_column(grid, *format, ctx);
    }
    if (const auto* reorder = std::get_if<ReorderStep>(&step)) {
        return apply_reorder(grid, *reorder);
    }
    if (const auto* filter = std::get_if<FilterRowsStep>(&step)) {
        return apply_filter_rows(grid, *filter);
    }
    if (const auto* custom = std::get_if<CustomTransformStep>(&step)) {
        if (transformers_ == nullptr) {
            throw TransformError("No custom transformer registry for transformer: " + custom->transformer);
        }
        return transformers_->transform(custom->transformer, grid, custom->params, context);
    }
    // Aggregation steps are collected by transform()
    return grid;
}

} // namespace reportcalc
