#ifndef REPORTCALC_EXPR_EXPR_VALUE_HPP
#define REPORTCALC_EXPR_EXPR_VALUE_HPP

#include <string>
#include <variant>
#include <vector>

namespace reportcalc {

// Runtime value of an expression: boolean, integer, float or string
using ExprValue = std::variant<bool, long long, double, std::string>;

namespace expr {

enum class BinaryOp { Add, Sub, Mul, Div, FloorDiv, Mod, Pow };
enum class UnaryOp { Plus, Minus };
enum class CompareOp { Lt, Le, Gt, Ge, Eq, Ne };

std::string op_symbol(BinaryOp op);
std::string op_symbol(CompareOp op);

// "bool", "int", "float" or "str"
std::string type_name(const ExprValue& value);

// bool and int count as integers, like in the formulas' source language
bool is_integral(const ExprValue& value);
bool is_number(const ExprValue& value);

// Integer view of a bool or int. Precondition: is_integral(value)
long long as_integer(const ExprValue& value);

// Float view of any number. Throws SafeEvalError for strings.
double as_double(const ExprValue& value);

bool truthy(const ExprValue& value);

// str() of a value: "True", "42", "4000.0", text
std::string display_string(const ExprValue& value);

// Arithmetic. Integers stay integral where the operator allows it and are
// promoted to float on overflow. Division by zero throws ZeroDivisionError;
// every other failure throws SafeEvalError(ExecutionFailed).
ExprValue apply_binary(BinaryOp op, const ExprValue& left, const ExprValue& right);
ExprValue apply_unary(UnaryOp op, const ExprValue& operand);
bool apply_compare(CompareOp op, const ExprValue& left, const ExprValue& right);

// Whitelisted functions: abs round max min sum len float int str
bool is_allowed_function(const std::string& name);
ExprValue call_function(const std::string& name, const std::vector<ExprValue>& args);

} // namespace expr
} // namespace reportcalc

#endif // REPORTCALC_EXPR_EXPR_VALUE_HPP
