#ifndef REPORTCALC_EXPR_EVAL_ERROR_HPP
#define REPORTCALC_EXPR_EVAL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace reportcalc {

// Why an expression was rejected or failed
enum class SafeEvalErrorKind {
    Syntax,               // Not a well-formed expression
    DisallowedConstruct,  // Well-formed but outside the whitelist
    UndefinedName,        // Variable not bound
    TooComplex,           // Nesting deeper than the cap
    ExecutionFailed       // Type error, overflow, bad format, ...
};

inline std::string error_kind_to_string(SafeEvalErrorKind kind) {
    switch (kind) {
        case SafeEvalErrorKind::Syntax: return "syntax_error";
        case SafeEvalErrorKind::DisallowedConstruct: return "disallowed_construct";
        case SafeEvalErrorKind::UndefinedName: return "undefined_name";
        case SafeEvalErrorKind::TooComplex: return "too_complex";
        case SafeEvalErrorKind::ExecutionFailed: return "execution_failed";
        default: return "unknown";
    }
}

// Exception thrown by the safe expression evaluator
class SafeEvalError : public std::runtime_error {
public:
    SafeEvalError(SafeEvalErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    SafeEvalErrorKind kind() const { return kind_; }

private:
    SafeEvalErrorKind kind_;
};

namespace expr {

// Raised for x / 0, x // 0, x % 0 and 0 ** -n. Formula mode turns it into 0.
class ZeroDivisionError : public SafeEvalError {
public:
    ZeroDivisionError()
        : SafeEvalError(SafeEvalErrorKind::ExecutionFailed, "division by zero") {}
};

} // namespace expr
} // namespace reportcalc

#endif // REPORTCALC_EXPR_EVAL_ERROR_HPP
