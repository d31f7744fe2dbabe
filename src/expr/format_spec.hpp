#ifndef REPORTCALC_EXPR_FORMAT_SPEC_HPP
#define REPORTCALC_EXPR_FORMAT_SPEC_HPP

#include "expr_value.hpp"
#include <string>

namespace reportcalc {
namespace expr {

// A constrained format specifier: [.][digits](d|f|g|e|%)
// With a leading dot the digits are the precision, otherwise the width.
struct FormatSpec {
    bool has_dot;
    int precision;       // -1 when not given
    int width;           // -1 when not given
    char type;           // 'd', 'f', 'g', 'e', '%', or 0 for no specifier

    FormatSpec() : has_dot(false), precision(-1), width(-1), type(0) {}

    bool empty() const { return type == 0; }
};

// True if spec is empty or matches ^\.?\d*[dfge%]$
bool is_allowed_format_spec(const std::string& spec);

// Parse a specifier. Throws SafeEvalError(DisallowedConstruct) for anything
// outside the allowed pattern.
FormatSpec parse_format_spec(const std::string& spec);

// Format a value. An empty spec gives the display string. Throws
// SafeEvalError(ExecutionFailed) when the spec does not apply to the value
// (e.g. 'd' on a float, 'f' on a string, '.f' without precision).
std::string apply_format_spec(const ExprValue& value, const FormatSpec& spec);

// Format through a template such as "{:.1f}" or "{:.1f} lm" ({{ and }} are
// literal braces), or through a bare specifier such as ".1f".
std::string format_with_template(const std::string& format, const ExprValue& value);

} // namespace expr
} // namespace reportcalc

#endif // REPORTCALC_EXPR_FORMAT_SPEC_HPP
