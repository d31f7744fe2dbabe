/**
 * @file custom_transformers.hpp
 * @brief Named table transformers for domain-specific table shapes
 *
 * A custom transformer has the same contract as a built-in transform step,
 * (grid, params, context) -> grid, and is invoked by name from a
 * "custom_transform" step:
 *
 *   {"type": "custom_transform", "transformer": "zone_table_transformer",
 *    "zone_angles": [30, 60, 90], "format": "{:.1f}"}
 *
 * Design Pattern: Registry
 * - Built-in transformers are registered by the constructor
 * - Callers add their own before running pipelines
 * - Registration replaces an existing entry of the same name
 */

#ifndef REPORTCALC_TABLE_CUSTOM_TRANSFORMERS_HPP
#define REPORTCALC_TABLE_CUSTOM_TRANSFORMERS_HPP

#include "grid.hpp"
#include "transform_step.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace reportcalc {

/**
 * @brief Built-in transformer names
 */
namespace TransformerName {
    constexpr const char* PHOTOMETRIC = "photometric_data_transformer";
    constexpr const char* LIFE = "life_table_transformer";
    constexpr const char* BEAM = "beam_table_transformer";
    constexpr const char* EEI = "eei_table_transformer";
    constexpr const char* ZONE = "zone_table_transformer";
}

/**
 * @brief Registry of named table transformers
 *
 * Usage Example:
 *   @code
 *   CustomTransformerRegistry registry;
 *   Grid zones = registry.transform("zone_table_transformer", {}, params, context);
 *   @endcode
 */
class CustomTransformerRegistry {
public:
    /**
     * @brief Transformer function type
     *
     * Must not modify its input grid.
     */
    using TransformerFunction = std::function<Grid(const Grid&, const nlohmann::json&, const TransformContext&)>;

    /**
     * @brief Constructor
     *
     * @param include_builtins Register the built-in transformers
     */
    explicit CustomTransformerRegistry(bool include_builtins = true);

    /**
     * @brief Register a transformer, replacing any existing entry of that name
     *
     * @throws std::invalid_argument If name is empty or fn is empty
     */
    void register_transformer(const std::string& name, TransformerFunction fn);

    bool has_transformer(const std::string& name) const;

    /**
     * @brief Registered names, sorted
     */
    std::vector<std::string> list_transformers() const;

    /**
     * @brief Run a transformer by name
     *
     * @throws TransformError If no transformer has this name, or its
     *         params have the wrong shape
     */
    Grid transform(
        const std::string& name,
        const Grid& grid,
        const nlohmann::json& params,
        const TransformContext& context
    ) const;

private:
    std::map<std::string, TransformerFunction> registry_;
};

// Built-in transformers

// Evaluate per-row formulas, append an "Average" row, apply format rules
Grid photometric_data_transformer(const Grid& grid, const nlohmann::json& params, const TransformContext& context);

// Same behaviour as photometric_data_transformer
Grid life_table_transformer(const Grid& grid, const nlohmann::json& params, const TransformContext& context);

// 3x2 table: beam angle at [1][1], peak intensity at [2][1]
Grid beam_table_transformer(const Grid& grid, const nlohmann::json& params, const TransformContext& context);

// One row per model: name, average efficacy, energy class, merge markers
Grid eei_table_transformer(const Grid& grid, const nlohmann::json& params, const TransformContext& context);

// One "0-<angle>°" row per zone field within the angle range
Grid zone_table_transformer(const Grid& grid, const nlohmann::json& params, const TransformContext& context);

// Marker placed in cells that the document layer merges vertically
constexpr const char* kMergeMarker = "__MERGE__";

} // namespace reportcalc

#endif // REPORTCALC_TABLE_CUSTOM_TRANSFORMERS_HPP
