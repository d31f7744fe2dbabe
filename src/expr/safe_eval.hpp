/**
 * @file safe_eval.hpp
 * @brief Sandboxed evaluation of formulas and formatting rules from configuration
 *
 * Expressions are parsed into a typed tree restricted to a whitelist of node
 * kinds and evaluated by walking that tree. Nothing is ever executed as
 * free-form code, and a rejected expression is never partially evaluated.
 *
 * Two modes:
 * - Formula mode: arithmetic over named numeric variables ("A / B * 1000").
 *   Division by zero yields 0.0.
 * - Format mode: a one-parameter rule "lambda x: f'{x:.2f}' if x < 1 else
 *   f'{x:.1f}'" that turns a number into display text.
 */

#ifndef REPORTCALC_EXPR_SAFE_EVAL_HPP
#define REPORTCALC_EXPR_SAFE_EVAL_HPP

#include "eval_error.hpp"
#include "expr_ast.hpp"
#include "expr_value.hpp"
#include "../table/grid.hpp"
#include <map>
#include <memory>
#include <string>

namespace reportcalc {

using VariableMap = std::map<std::string, ExprValue>;

// Maximum tree depth accepted in each mode
constexpr size_t kFormatMaxDepth = 10;
constexpr size_t kFormulaMaxDepth = 100;

/**
 * @brief Outcome of a non-throwing evaluation
 */
struct EvalResult {
    bool success;
    ExprValue value;
    SafeEvalErrorKind error_kind;
    std::string error_message;

    EvalResult()
        : success(false), value(0.0), error_kind(SafeEvalErrorKind::ExecutionFailed) {}

    static EvalResult ok(ExprValue v) {
        EvalResult result;
        result.success = true;
        result.value = std::move(v);
        return result;
    }

    static EvalResult failure(SafeEvalErrorKind kind, const std::string& message) {
        EvalResult result;
        result.error_kind = kind;
        result.error_message = message;
        return result;
    }
};

// ----------------------------------------------------------------------------
// Formula mode
// ----------------------------------------------------------------------------

/**
 * @brief Evaluate an arithmetic formula against a variable binding
 *
 * @throws SafeEvalError on an empty formula, rejected syntax, an unbound
 *         name or an execution failure. Division by zero returns 0.0.
 */
ExprValue evaluate_formula(const std::string& formula, const VariableMap& variables);

EvalResult try_evaluate_formula(const std::string& formula, const VariableMap& variables);

/**
 * @brief Replace column references such as "B{row}" with cell values
 *
 * The letters pick a cell of `row` (A = 0, AA = 26). Numeric cells are
 * substituted by value, anything else (or a column past the end of the row)
 * by 0. Remaining "{row}" tokens become the zero-based row index.
 */
std::string substitute_column_references(const std::string& formula, size_t row_index, const Row& row);

// substitute_column_references followed by evaluate_formula with no variables
ExprValue evaluate_row_formula(const std::string& formula, size_t row_index, const Row& row);

EvalResult try_evaluate_row_formula(const std::string& formula, size_t row_index, const Row& row);

// ----------------------------------------------------------------------------
// Format mode
// ----------------------------------------------------------------------------

/**
 * @brief A validated formatting rule, reusable across values
 */
class FormatFunction {
public:
    FormatFunction(std::string parameter, std::shared_ptr<const expr::Node> body)
        : parameter_(std::move(parameter)), body_(std::move(body)) {}

    // Throws SafeEvalError(ExecutionFailed) if evaluation fails for this value
    std::string operator()(const ExprValue& value) const;

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
    std::shared_ptr<const expr::Node> body_;
};

// Validate a "lambda x: ..." rule. Throws SafeEvalError.
FormatFunction compile_format(const std::string& func_str);

std::string evaluate_format(const std::string& func_str, const ExprValue& value);

EvalResult try_evaluate_format(const std::string& func_str, const ExprValue& value);

// True if the rule compiles and runs on the sample value 1.0
bool is_safe_format(const std::string& func_str);

} // namespace reportcalc

#endif // REPORTCALC_EXPR_SAFE_EVAL_HPP
