#include "safe_eval.hpp"
#include "expr_parser.hpp"
#include "../value_utils.hpp"
#include <cctype>
#include <regex>

namespace reportcalc {

using expr::Node;
using expr::NodePtr;
using expr::ParseMode;

namespace {

// Walks a validated tree. Every node kind the parser can produce is handled
// here; there is no fallback to any other form of execution.
class Evaluator {
public:
    explicit Evaluator(const VariableMap& variables) : variables_(variables) {}

    ExprValue eval(const Node& node) const {
        switch (node.kind) {
            case Node::Kind::Literal:
                return node.literal;

            case Node::Kind::Name: {
                auto it = variables_.find(node.name);
                if (it == variables_.end()) {
                    throw SafeEvalError(SafeEvalErrorKind::UndefinedName,
                                        "Undefined variable or function: " + node.name);
                }
                return it->second;
            }

            case Node::Kind::Unary:
                return expr::apply_unary(node.unary_op, eval(*node.children[0]));

            case Node::Kind::Binary:
                return expr::apply_binary(node.binary_op,
                                          eval(*node.children[0]),
                                          eval(*node.children[1]));

            case Node::Kind::Compare: {
                // Chained: a < b < c is (a < b) and (b < c), stopping early
                ExprValue left = eval(*node.children[0]);
                for (size_t i = 0; i < node.compare_ops.size(); ++i) {
                    ExprValue right = eval(*node.children[i + 1]);
                    if (!expr::apply_compare(node.compare_ops[i], left, right)) {
                        return false;
                    }
                    left = std::move(right);
                }
                return true;
            }

            case Node::Kind::Conditional:
                return expr::truthy(eval(*node.children[1]))
                    ? eval(*node.children[0])
                    : eval(*node.children[2]);

            case Node::Kind::Call: {
                std::vector<ExprValue> args;
                args.reserve(node.children.size());
                for (const auto& child : node.children) {
                    args.push_back(eval(*child));
                }
                return expr::call_function(node.name, args);
            }

            case Node::Kind::FString: {
                std::string out;
                for (const auto& part : node.parts) {
                    if (part.expression) {
                        out += expr::apply_format_spec(eval(*part.expression), part.spec);
                    } else {
                        out += part.text;
                    }
                }
                return out;
            }
        }
        throw SafeEvalError(SafeEvalErrorKind::DisallowedConstruct, "Unsupported node type");
    }

private:
    const VariableMap& variables_;
};

std::string cell_reference_text(const std::string& letters, const Row& row) {
    size_t column = 0;
    try {
        column = column_letters_to_index(letters);
    } catch (const std::invalid_argument&) {
        return "0";
    }
    if (column >= row.size()) {
        return "0";
    }

    std::string text;
    const Cell& cell = row[column];
    if (const auto* number = std::get_if<double>(&cell)) {
        text = format_float_repr(*number);
    } else {
        const std::string& raw = std::get<std::string>(cell);
        if (auto integer = parse_integer(raw)) {
            text = std::to_string(*integer);
        } else if (auto real = parse_double(raw)) {
            text = format_float_repr(*real);
        } else {
            return "0";
        }
    }

    // Keep "A{row}**2" meaning (A)**2 for negative cells
    if (!text.empty() && text[0] == '-') {
        text = "(" + text + ")";
    }
    return text;
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

// ============================================================================
// Formula mode
// ============================================================================

ExprValue evaluate_formula(const std::string& formula, const VariableMap& variables) {
    if (trim(formula).empty()) {
        throw SafeEvalError(SafeEvalErrorKind::Syntax, "Formula must be a non-empty string");
    }

    NodePtr tree = expr::parse_expression(formula, ParseMode::Formula, kFormulaMaxDepth);

    std::vector<std::string> names;
    expr::collect_names(*tree, names);
    for (const auto& name : names) {
        if (variables.find(name) == variables.end()) {
            throw SafeEvalError(SafeEvalErrorKind::UndefinedName,
                                "Undefined variable or function: " + name);
        }
    }

    try {
        return Evaluator(variables).eval(*tree);
    } catch (const expr::ZeroDivisionError&) {
        return 0.0;
    }
}

EvalResult try_evaluate_formula(const std::string& formula, const VariableMap& variables) {
    try {
        return EvalResult::ok(evaluate_formula(formula, variables));
    } catch (const SafeEvalError& e) {
        return EvalResult::failure(e.kind(), e.what());
    }
}

std::string substitute_column_references(const std::string& formula, size_t row_index, const Row& row) {
    static const std::regex reference(R"(([A-Z]+)\{row\})");

    std::string out;
    size_t last = 0;
    for (auto it = std::sregex_iterator(formula.begin(), formula.end(), reference);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        out.append(formula, last, start - last);
        out += cell_reference_text(match[1].str(), row);
        last = start + static_cast<size_t>(match.length(0));
    }
    out.append(formula, last, std::string::npos);

    replace_all(out, "{row}", std::to_string(row_index));
    return out;
}

ExprValue evaluate_row_formula(const std::string& formula, size_t row_index, const Row& row) {
    return evaluate_formula(substitute_column_references(formula, row_index, row), VariableMap());
}

EvalResult try_evaluate_row_formula(const std::string& formula, size_t row_index, const Row& row) {
    try {
        return EvalResult::ok(evaluate_row_formula(formula, row_index, row));
    } catch (const SafeEvalError& e) {
        return EvalResult::failure(e.kind(), e.what());
    }
}

// ============================================================================
// Format mode
// ============================================================================

std::string FormatFunction::operator()(const ExprValue& value) const {
    VariableMap variables;
    variables[parameter_] = value;
    try {
        return expr::display_string(Evaluator(variables).eval(*body_));
    } catch (const expr::ZeroDivisionError&) {
        throw SafeEvalError(SafeEvalErrorKind::ExecutionFailed,
                            "Function execution failed: division by zero");
    }
}

FormatFunction compile_format(const std::string& func_str) {
    std::string text = trim(func_str);
    if (text.empty()) {
        throw SafeEvalError(SafeEvalErrorKind::Syntax, "Function must be a non-empty string");
    }
    if (text.compare(0, 6, "lambda") != 0) {
        throw SafeEvalError(SafeEvalErrorKind::DisallowedConstruct, "Only lambda expressions are allowed");
    }

    // lambda <name> : <body>
    size_t pos = 6;
    size_t param_start = pos;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
    bool spaced = pos > param_start;
    param_start = pos;
    while (pos < text.size() && (std::isalnum(static_cast<unsigned char>(text[pos])) || text[pos] == '_')) pos++;
    std::string parameter = text.substr(param_start, pos - param_start);
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
    if (!spaced || parameter.empty() || pos >= text.size() || text[pos] != ':') {
        throw SafeEvalError(SafeEvalErrorKind::Syntax, "Invalid lambda syntax");
    }
    std::string body = trim(text.substr(pos + 1));
    if (body.empty()) {
        throw SafeEvalError(SafeEvalErrorKind::Syntax, "Invalid lambda syntax");
    }

    NodePtr tree = expr::parse_expression(body, ParseMode::Format, kFormatMaxDepth);

    std::vector<std::string> names;
    expr::collect_names(*tree, names);
    for (const auto& name : names) {
        if (name != parameter) {
            throw SafeEvalError(SafeEvalErrorKind::UndefinedName, "Undefined name: " + name);
        }
    }

    return FormatFunction(parameter, std::shared_ptr<const Node>(tree.release()));
}

std::string evaluate_format(const std::string& func_str, const ExprValue& value) {
    return compile_format(func_str)(value);
}

EvalResult try_evaluate_format(const std::string& func_str, const ExprValue& value) {
    try {
        return EvalResult::ok(evaluate_format(func_str, value));
    } catch (const SafeEvalError& e) {
        return EvalResult::failure(e.kind(), e.what());
    }
}

bool is_safe_format(const std::string& func_str) {
    return try_evaluate_format(func_str, 1.0).success;
}

} // namespace reportcalc
