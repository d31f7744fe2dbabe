#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/expr/safe_eval.hpp"

using namespace reportcalc;

namespace {

SafeEvalErrorKind formula_error(const std::string& formula, const VariableMap& variables = VariableMap()) {
    EvalResult result = try_evaluate_formula(formula, variables);
    REQUIRE_FALSE(result.success);
    return result.error_kind;
}

SafeEvalErrorKind format_error(const std::string& func_str) {
    try {
        compile_format(func_str);
    } catch (const SafeEvalError& e) {
        return e.kind();
    }
    FAIL("Expected SafeEvalError for: " << func_str);
    return SafeEvalErrorKind::ExecutionFailed;
}

std::string repeat_sum(size_t terms) {
    std::string out = "1";
    for (size_t i = 1; i < terms; ++i) {
        out += "+1";
    }
    return out;
}

} // namespace

TEST_CASE("Formula arithmetic", "[safe_eval]") {
    VariableMap vars;
    vars["A"] = ExprValue(2.0);
    vars["B"] = ExprValue(8LL);

    SECTION("Variables and true division") {
        ExprValue result = evaluate_formula("B / A * 1000", vars);
        REQUIRE(std::get<double>(result) == 4000.0);
    }

    SECTION("Integer operators stay integral") {
        REQUIRE(std::get<long long>(evaluate_formula("2 ** 10", vars)) == 1024);
        REQUIRE(std::get<long long>(evaluate_formula("7 // 2", vars)) == 3);
        REQUIRE(std::get<long long>(evaluate_formula("-7 // 2", vars)) == -4);
        REQUIRE(std::get<long long>(evaluate_formula("-7 % 3", vars)) == 2);
        REQUIRE(std::get<long long>(evaluate_formula("B - 3 * 2", vars)) == 2);
    }

    SECTION("Precedence and unary minus") {
        REQUIRE(std::get<long long>(evaluate_formula("-2 ** 2", vars)) == -4);
        REQUIRE(std::get<long long>(evaluate_formula("(1 + 2) * 3", vars)) == 9);
        REQUIRE(std::get<double>(evaluate_formula("2 ** -1", vars)) == 0.5);
    }

    SECTION("Comparisons and conditionals") {
        REQUIRE(std::get<bool>(evaluate_formula("1 < 2 < 3", vars)) == true);
        REQUIRE(std::get<bool>(evaluate_formula("3 > 2 > 2", vars)) == false);
        REQUIRE(std::get<long long>(evaluate_formula("10 if B > 5 else 20", vars)) == 10);
        REQUIRE(std::get<long long>(evaluate_formula("10 if A > 5 else 20", vars)) == 20);
    }

    SECTION("Whitelisted functions") {
        REQUIRE(std::get<long long>(evaluate_formula("abs(-3)", vars)) == 3);
        REQUIRE(std::get<long long>(evaluate_formula("round(2.5)", vars)) == 2);
        REQUIRE(std::get<long long>(evaluate_formula("max(1, B, 3)", vars)) == 8);
        REQUIRE(std::get<double>(evaluate_formula("min(A, B)", vars)) == 2.0);
        REQUIRE(std::get<double>(evaluate_formula("float(B)", vars)) == 8.0);
        REQUIRE(std::get<long long>(evaluate_formula("int(A)", vars)) == 2);
    }

    SECTION("Division by zero yields zero") {
        REQUIRE(std::get<double>(evaluate_formula("1 / 0", vars)) == 0.0);
        REQUIRE(std::get<double>(evaluate_formula("B / (A - 2)", vars)) == 0.0);
        REQUIRE(std::get<double>(evaluate_formula("B % 0", vars)) == 0.0);
    }

    SECTION("Does not modify the bindings") {
        evaluate_formula("A + B", vars);
        REQUIRE(vars.size() == 2);
        REQUIRE(std::get<double>(vars["A"]) == 2.0);
    }
}

TEST_CASE("Formula rejection", "[safe_eval]") {
    SECTION("Empty formula") {
        REQUIRE(formula_error("") == SafeEvalErrorKind::Syntax);
        REQUIRE(formula_error("   ") == SafeEvalErrorKind::Syntax);
    }

    SECTION("Malformed input") {
        REQUIRE(formula_error("1 +") == SafeEvalErrorKind::Syntax);
        REQUIRE(formula_error("(1 + 2") == SafeEvalErrorKind::Syntax);
        REQUIRE(formula_error("2 $ 3") == SafeEvalErrorKind::Syntax);
    }

    SECTION("Code execution constructs") {
        REQUIRE(formula_error("__import__('os').system('x')") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(formula_error("open(1)") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(formula_error("lambda: 1") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(formula_error("x.real", {{"x", ExprValue(1.0)}}) == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(formula_error("x[0]", {{"x", ExprValue(1.0)}}) == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(formula_error("x = 1") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(formula_error("1 and 2") == SafeEvalErrorKind::DisallowedConstruct);
    }

    SECTION("Strings are not formulas") {
        REQUIRE(formula_error("'abc'") == SafeEvalErrorKind::DisallowedConstruct);
    }

    SECTION("Unbound names") {
        EvalResult result = try_evaluate_formula("A + C", {{"A", ExprValue(1.0)}});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == SafeEvalErrorKind::UndefinedName);
        REQUIRE(result.error_message.find("C") != std::string::npos);
    }

    SECTION("Unbound name in an untaken branch is still rejected") {
        REQUIRE(formula_error("1 if True else missing") == SafeEvalErrorKind::UndefinedName);
    }

    SECTION("Depth cap") {
        REQUIRE(try_evaluate_formula(repeat_sum(50), VariableMap()).success);
        REQUIRE(formula_error(repeat_sum(150)) == SafeEvalErrorKind::TooComplex);
        REQUIRE(formula_error(std::string(300, '(') + "1" + std::string(300, ')')) == SafeEvalErrorKind::TooComplex);
    }

    SECTION("Type errors are execution failures") {
        REQUIRE(formula_error("abs(1, 2)") == SafeEvalErrorKind::ExecutionFailed);
    }

    SECTION("Throwing form carries the kind") {
        try {
            evaluate_formula("__class__", VariableMap());
            FAIL("Expected SafeEvalError");
        } catch (const SafeEvalError& e) {
            REQUIRE(e.kind() == SafeEvalErrorKind::DisallowedConstruct);
        }
    }
}

TEST_CASE("Row formulas", "[safe_eval]") {
    Row row{std::string("2"), std::string("8"), std::string("n/a"), -1.5};

    SECTION("Column references") {
        REQUIRE(substitute_column_references("B{row}/A{row}*1000", 0, row) == "8/2*1000");
        REQUIRE(std::get<double>(evaluate_row_formula("B{row}/A{row}*1000", 0, row)) == 4000.0);
    }

    SECTION("Non-numeric and missing cells become zero") {
        REQUIRE(substitute_column_references("C{row}+Z{row}", 0, row) == "0+0");
        REQUIRE(std::get<long long>(evaluate_row_formula("A{row}+C{row}", 0, row)) == 2);
    }

    SECTION("Negative cells keep their sign under powers") {
        REQUIRE(substitute_column_references("D{row}**2", 0, row) == "(-1.5)**2");
        REQUIRE(std::get<double>(evaluate_row_formula("D{row}**2", 0, row)) == 2.25);
    }

    SECTION("Out-of-range column letters become zero") {
        std::string letters(14, 'Z');
        REQUIRE(substitute_column_references(letters + "{row}+A{row}", 0, row) == "0+2");
        REQUIRE(std::get<long long>(evaluate_row_formula(letters + "{row}+B{row}", 0, row)) == 8);
    }

    SECTION("Remaining row tokens are the row index") {
        REQUIRE(substitute_column_references("A{row} + {row}", 3, row) == "2 + 3");
    }

    SECTION("Division by zero in a row") {
        Row zero{std::string("0"), std::string("5")};
        REQUIRE(std::get<double>(evaluate_row_formula("B{row}/A{row}", 0, zero)) == 0.0);
    }

    SECTION("Failures are reported, not thrown") {
        EvalResult result = try_evaluate_row_formula("A{row} +", 0, row);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == SafeEvalErrorKind::Syntax);
    }
}

TEST_CASE("Format functions", "[safe_eval]") {
    SECTION("Conditional precision") {
        const std::string rule = "lambda x: f'{x:.4f}' if x < 1 else f'{x:.2f}'";
        REQUIRE(evaluate_format(rule, ExprValue(0.12345)) == "0.1235");
        REQUIRE(evaluate_format(rule, ExprValue(12.345678)) == "12.35");
    }

    SECTION("Compiled rule is reusable") {
        FormatFunction fn = compile_format("lambda v: f'{v:.1f} lm'");
        REQUIRE(fn.parameter() == "v");
        REQUIRE(fn(ExprValue(1650.0)) == "1650.0 lm");
        REQUIRE(fn(ExprValue(3LL)) == "3.0 lm");
    }

    SECTION("Non-string results use display text") {
        REQUIRE(evaluate_format("lambda x: x * 2", ExprValue(1.5)) == "3.0");
        REQUIRE(evaluate_format("lambda x: round(x, 1)", ExprValue(2.25)) == "2.2");
        REQUIRE(evaluate_format("lambda x: 'high' if x > 10 else 'low'", ExprValue(11.0)) == "high");
    }

    SECTION("Percent and integer specs") {
        REQUIRE(evaluate_format("lambda x: f'{x:.1%}'", ExprValue(0.256)) == "25.6%");
        REQUIRE(evaluate_format("lambda x: f'{int(x):d} W'", ExprValue(9.7)) == "9 W");
    }

    SECTION("Rejected rules") {
        REQUIRE(format_error("") == SafeEvalErrorKind::Syntax);
        REQUIRE(format_error("x * 2") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(format_error("lambda: 1") == SafeEvalErrorKind::Syntax);
        REQUIRE(format_error("lambda x: y") == SafeEvalErrorKind::UndefinedName);
        REQUIRE(format_error("lambda x: x.__class__") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(format_error("lambda x: f'{x!r}'") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(format_error("lambda x: f'{x:>{10}}'") == SafeEvalErrorKind::DisallowedConstruct);
        REQUIRE(format_error("lambda x: " + repeat_sum(12)) == SafeEvalErrorKind::TooComplex);
    }

    SECTION("Execution failures") {
        EvalResult result = try_evaluate_format("lambda x: f'{x:d}'", ExprValue(1.5));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == SafeEvalErrorKind::ExecutionFailed);

        result = try_evaluate_format("lambda x: 1 / x", ExprValue(0.0));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_kind == SafeEvalErrorKind::ExecutionFailed);
    }

    SECTION("Safety check") {
        REQUIRE(is_safe_format("lambda x: f'{x:.2f}'"));
        REQUIRE_FALSE(is_safe_format("lambda x: __import__('os')"));
        REQUIRE_FALSE(is_safe_format("not a lambda"));
        REQUIRE_FALSE(is_safe_format("lambda x: f'{x:d}'"));
    }
}
