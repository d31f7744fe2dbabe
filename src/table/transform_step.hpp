/**
 * @file transform_step.hpp
 * @brief Typed table transform steps and their lookup context
 *
 * A pipeline is an ordered list of steps parsed from configuration such as
 *   {"type": "calculate", "column": 4, "operation": "formula=B{row}/A{row}*1000", "decimal": 1}
 * Column indices always refer to the grid entering the step.
 */

#ifndef REPORTCALC_TABLE_TRANSFORM_STEP_HPP
#define REPORTCALC_TABLE_TRANSFORM_STEP_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace reportcalc {

// Drop the given columns from every row
struct SkipColumnsStep {
    std::vector<size_t> columns;
};

// Insert a column; source is "row_index", "metadata:<key>", "targets:<key>" or "value:<literal>"
struct AddColumnStep {
    size_t position = 0;
    std::string source;
};

// calculate with operation "formula=<expr>"
struct FormulaStep {
    size_t column = 0;
    std::string formula;
    std::optional<int> decimal;
};

enum class AggregateOp { Average, Sum, Max, Min };

// calculate with operation average|sum|max|min; runs after all other steps
struct AggregateStep {
    size_t column = 0;
    AggregateOp op = AggregateOp::Average;
    std::optional<int> decimal;
    std::string function;            // Format-mode rule, used when decimal is absent
};

struct FormatColumnStep {
    size_t column = 0;
    std::string function;            // Format-mode rule; takes precedence over decimal
    std::optional<int> decimal;
};

// Keep only the listed columns, in the listed order
struct ReorderStep {
    std::vector<size_t> order;
};

// condition: "remove_empty" or "remove_all_empty"
struct FilterRowsStep {
    std::string condition;
};

// Run a named transformer from the CustomTransformerRegistry
struct CustomTransformStep {
    std::string transformer;
    nlohmann::json params = nlohmann::json::object();
};

using TransformStep = std::variant<
    SkipColumnsStep,
    AddColumnStep,
    FormulaStep,
    AggregateStep,
    FormatColumnStep,
    ReorderStep,
    FilterRowsStep,
    CustomTransformStep
>;

// Configuration type name of a step ("skip_columns", "calculate", ...)
std::string step_type_name(const TransformStep& step);

bool is_aggregation(const TransformStep& step);

std::string aggregate_op_to_string(AggregateOp op);

// Raised for an unknown custom transformer or unusable transformer params
class TransformError : public std::runtime_error {
public:
    explicit TransformError(const std::string& msg) : std::runtime_error(msg) {}
};

// Lookup data for add_column and custom transformers. Pointers are not
// owned and may be null.
struct TransformContext {
    const nlohmann::json* metadata = nullptr;        // {"fields": [{"name", "value"}, ...]}
    const nlohmann::json* targets = nullptr;         // {"targets": [{"name", "value"}, ...]}
    const nlohmann::json* extracted_data = nullptr;  // Report extracted_data section
};

} // namespace reportcalc

#endif // REPORTCALC_TABLE_TRANSFORM_STEP_HPP
