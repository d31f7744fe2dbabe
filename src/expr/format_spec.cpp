#include "format_spec.hpp"
#include "eval_error.hpp"
#include "../value_utils.hpp"
#include <cmath>
#include <cstdio>
#include <regex>

namespace reportcalc {
namespace expr {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw SafeEvalError(SafeEvalErrorKind::ExecutionFailed, message);
}

std::string pad_left(const std::string& text, int width) {
    if (width < 0 || static_cast<size_t>(width) <= text.size()) {
        return text;
    }
    return std::string(static_cast<size_t>(width) - text.size(), ' ') + text;
}

std::string format_float(double value, char type, int precision) {
    if (std::isnan(value)) return type == '%' ? "nan%" : "nan";
    if (std::isinf(value)) {
        std::string text = value > 0 ? "inf" : "-inf";
        return type == '%' ? text + "%" : text;
    }

    char format[8] = {'%', '.', '*', type, '\0'};
    if (type == '%') {
        return format_fixed(value * 100.0, precision) + "%";
    }
    if (type == 'f') {
        return format_fixed(value, precision);
    }

    int size = std::snprintf(nullptr, 0, format, precision, value);
    std::string out(static_cast<size_t>(size) + 1, '\0');
    std::snprintf(&out[0], out.size(), format, precision, value);
    out.resize(static_cast<size_t>(size));
    return out;
}

} // anonymous namespace

bool is_allowed_format_spec(const std::string& spec) {
    static const std::regex pattern(R"(^\.?\d*[dfge%]$)");
    return spec.empty() || std::regex_match(spec, pattern);
}

FormatSpec parse_format_spec(const std::string& spec) {
    FormatSpec result;
    if (spec.empty()) {
        return result;
    }
    if (!is_allowed_format_spec(spec)) {
        throw SafeEvalError(SafeEvalErrorKind::DisallowedConstruct, "Unsafe format spec: " + spec);
    }

    size_t pos = 0;
    if (spec[0] == '.') {
        result.has_dot = true;
        pos = 1;
    }
    std::string digits = spec.substr(pos, spec.size() - 1 - pos);
    if (!digits.empty()) {
        if (digits.size() > 3) {
            throw SafeEvalError(SafeEvalErrorKind::DisallowedConstruct, "Format spec too large: " + spec);
        }
        int number = std::stoi(digits);
        if (result.has_dot) {
            result.precision = number;
        } else {
            result.width = number;
        }
    }
    result.type = spec.back();
    return result;
}

std::string apply_format_spec(const ExprValue& value, const FormatSpec& spec) {
    if (spec.empty()) {
        return display_string(value);
    }
    if (spec.has_dot && spec.precision < 0) {
        fail("Format specifier missing precision");
    }
    if (std::holds_alternative<std::string>(value)) {
        fail(std::string("Unknown format code '") + spec.type + "' for object of type 'str'");
    }

    if (spec.type == 'd') {
        if (!is_integral(value)) {
            fail(std::string("Unknown format code 'd' for object of type '") + type_name(value) + "'");
        }
        if (spec.has_dot) {
            fail("Precision not allowed in integer format specifier");
        }
        return pad_left(std::to_string(as_integer(value)), spec.width);
    }

    int precision = spec.precision >= 0 ? spec.precision : 6;
    return pad_left(format_float(as_double(value), spec.type, precision), spec.width);
}

std::string format_with_template(const std::string& format, const ExprValue& value) {
    if (format.find('{') == std::string::npos && format.find('}') == std::string::npos) {
        return apply_format_spec(value, parse_format_spec(format));
    }

    std::string out;
    size_t i = 0;
    while (i < format.size()) {
        char c = format[i];
        if (c == '{') {
            if (i + 1 < format.size() && format[i + 1] == '{') {
                out += '{';
                i += 2;
                continue;
            }
            size_t close = format.find('}', i);
            if (close == std::string::npos) {
                fail("Single '{' encountered in format string");
            }
            std::string field = format.substr(i + 1, close - i - 1);
            std::string spec;
            size_t colon = field.find(':');
            if (colon != std::string::npos) {
                spec = field.substr(colon + 1);
                field = field.substr(0, colon);
            }
            if (!field.empty() && field != "0") {
                fail("Replacement field '" + field + "' has no matching argument");
            }
            out += apply_format_spec(value, parse_format_spec(spec));
            i = close + 1;
        } else if (c == '}') {
            if (i + 1 < format.size() && format[i + 1] == '}') {
                out += '}';
                i += 2;
                continue;
            }
            fail("Single '}' encountered in format string");
        } else {
            out += c;
            i++;
        }
    }
    return out;
}

} // namespace expr
} // namespace reportcalc
