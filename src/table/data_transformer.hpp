/**
 * @file data_transformer.hpp
 * @brief Multi-step transformation pipeline for tabular report data
 *
 * Steps run in two phases:
 * 1. Every non-aggregation step, strictly in configured order, each one
 *    consuming the previous step's output grid
 * 2. All aggregation steps (calculate average|sum|max|min) together,
 *    writing into one summary row appended at the end
 *
 * The input grid is never modified.
 */

#ifndef REPORTCALC_TABLE_DATA_TRANSFORMER_HPP
#define REPORTCALC_TABLE_DATA_TRANSFORMER_HPP

#include "custom_transformers.hpp"
#include "grid.hpp"
#include "transform_step.hpp"
#include "../logger.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reportcalc {

/**
 * @brief Runs transform pipelines over grids
 *
 * Usage Example:
 *   @code
 *   CustomTransformerRegistry transformers;
 *   TableDataTransformer transformer(&transformers);
 *   Grid out = transformer.transform(grid, parse_transform_steps(config));
 *   @endcode
 */
class TableDataTransformer {
public:
    /**
     * @brief Constructor
     *
     * @param transformers Registry for custom_transform steps (not owned,
     *        may be null when no pipeline uses custom transformers)
     */
    explicit TableDataTransformer(const CustomTransformerRegistry* transformers = nullptr);

    /**
     * @brief Run a pipeline
     *
     * @param grid Input grid (unchanged)
     * @param steps Ordered steps
     * @param context Lookup data for add_column and custom transformers
     * @param table_name Name used in log records
     * @return Transformed grid
     *
     * @throws TransformError For a custom_transform step naming an unknown
     *         transformer, or when no registry was supplied
     */
    Grid transform(
        const Grid& grid,
        const std::vector<TransformStep>& steps,
        const TransformContext& context = TransformContext(),
        const std::string& table_name = ""
    ) const;

    /**
     * @brief Parse a JSON step array and run it
     *
     * @throws ConfigParseError If a step is malformed
     */
    Grid transform(
        const Grid& grid,
        const nlohmann::json& steps_config,
        const TransformContext& context = TransformContext(),
        const std::string& table_name = ""
    ) const;

private:
    const CustomTransformerRegistry* transformers_;

    Grid apply_step(
        const Grid& grid,
        const TransformStep& step,
        const TransformContext& context,
        const LogContext& ctx
    ) const;
};

} // namespace reportcalc

#endif // REPORTCALC_TABLE_DATA_TRANSFORMER_HPP
