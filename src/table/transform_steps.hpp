#ifndef REPORTCALC_TABLE_TRANSFORM_STEPS_HPP
#define REPORTCALC_TABLE_TRANSFORM_STEPS_HPP

#include "grid.hpp"
#include "transform_step.hpp"
#include "../logger.hpp"
#include <vector>

namespace reportcalc {

// Each step takes the grid by const reference and returns a new grid.
// Per-cell failures are logged against ctx and leave the cell unchanged.

Grid apply_skip_columns(const Grid& grid, const SkipColumnsStep& step);

// Only the first row receives the resolved value; later rows get "".
// Existing configurations depend on this.
Grid apply_add_column(const Grid& grid, const AddColumnStep& step, const TransformContext& context);

Grid apply_formula(const Grid& grid, const FormulaStep& step, const LogContext& ctx);

Grid apply_format_column(const Grid& grid, const FormatColumnStep& step, const LogContext& ctx);

Grid apply_reorder(const Grid& grid, const ReorderStep& step);

Grid apply_filter_rows(const Grid& grid, const FilterRowsStep& step);

// Append one row holding every aggregate. Nothing is appended for an empty
// grid or an empty step list.
Grid apply_aggregates(const Grid& grid, const std::vector<AggregateStep>& steps, const LogContext& ctx);

// Value resolved for an add_column source ("" when the key is not found)
std::string resolve_column_source(const std::string& source, size_t row_index, const TransformContext& context);

} // namespace reportcalc

#endif // REPORTCALC_TABLE_TRANSFORM_STEPS_HPP
