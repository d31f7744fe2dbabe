#include "expr_value.hpp"
#include "eval_error.hpp"
#include "../value_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <set>

namespace reportcalc {
namespace expr {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw SafeEvalError(SafeEvalErrorKind::ExecutionFailed, message);
}

[[noreturn]] void unsupported_operands(const std::string& op, const ExprValue& left, const ExprValue& right) {
    fail("unsupported operand type(s) for " + op + ": '" + type_name(left) + "' and '" + type_name(right) + "'");
}

double checked_float(double result, const std::string& what) {
    if (std::isinf(result)) {
        fail(what + " result too large");
    }
    return result;
}

// Python-style float divmod
void float_divmod(double vx, double wx, double& floordiv, double& mod) {
    mod = std::fmod(vx, wx);
    double div = (vx - mod) / wx;
    if (mod != 0.0) {
        if ((wx < 0) != (mod < 0)) {
            mod += wx;
            div -= 1.0;
        }
    } else {
        mod = std::copysign(0.0, wx);
    }
    if (div != 0.0) {
        floordiv = std::floor(div);
        if (div - floordiv > 0.5) {
            floordiv += 1.0;
        }
    } else {
        floordiv = std::copysign(0.0, vx / wx);
    }
}

ExprValue integer_power(long long base, long long exponent) {
    long long result = 1;
    long long factor = base;
    long long remaining = exponent;
    while (remaining > 0) {
        if (remaining & 1) {
            if (__builtin_mul_overflow(result, factor, &result)) {
                return checked_float(std::pow(static_cast<double>(base), static_cast<double>(exponent)), "power");
            }
        }
        remaining >>= 1;
        if (remaining > 0 && __builtin_mul_overflow(factor, factor, &factor)) {
            return checked_float(std::pow(static_cast<double>(base), static_cast<double>(exponent)), "power");
        }
    }
    return result;
}

double round_half_even(double value) {
    double floor_value = std::floor(value);
    double diff = value - floor_value;
    if (diff > 0.5) return floor_value + 1.0;
    if (diff < 0.5) return floor_value;
    return std::fmod(floor_value, 2.0) == 0.0 ? floor_value : floor_value + 1.0;
}

long long float_to_integer(double value, const std::string& what) {
    if (std::isnan(value)) {
        fail("cannot convert float NaN to integer in " + what);
    }
    if (std::isinf(value)) {
        fail("cannot convert float infinity to integer in " + what);
    }
    if (value >= 9.2233720368547758e18 || value < -9.2233720368547758e18) {
        fail("integer too large in " + what);
    }
    return static_cast<long long>(value);
}

ExprValue round_value(const std::vector<ExprValue>& args) {
    if (args.empty() || args.size() > 2) {
        fail("round() takes 1 or 2 arguments (" + std::to_string(args.size()) + " given)");
    }
    const ExprValue& value = args[0];
    if (!is_number(value)) {
        fail("type " + type_name(value) + " doesn't define __round__ method");
    }

    if (args.size() == 1) {
        if (is_integral(value)) {
            return as_integer(value);
        }
        return float_to_integer(round_half_even(std::get<double>(value)), "round()");
    }

    if (!is_integral(args[1])) {
        fail("'" + type_name(args[1]) + "' object cannot be interpreted as an integer");
    }
    long long ndigits = as_integer(args[1]);

    if (is_integral(value)) {
        long long number = as_integer(value);
        if (ndigits >= 0) {
            return number;
        }
        if (ndigits < -18) {
            return 0LL;
        }
        long long scale = 1;
        for (long long i = 0; i < -ndigits; ++i) scale *= 10;
        double scaled = round_half_even(static_cast<double>(number) / static_cast<double>(scale));
        return float_to_integer(scaled * static_cast<double>(scale), "round()");
    }

    double number = std::get<double>(value);
    if (!std::isfinite(number)) {
        return number;
    }
    if (ndigits >= 0) {
        if (ndigits > 300) {
            return number;
        }
        // printf rounds the exact binary value, which is what correct rounding needs
        std::string text = format_fixed(number, static_cast<int>(ndigits));
        return std::strtod(text.c_str(), nullptr);
    }
    if (ndigits < -308) {
        return std::copysign(0.0, number);
    }
    double scale = std::pow(10.0, static_cast<double>(-ndigits));
    return round_half_even(number / scale) * scale;
}

ExprValue extremum(const std::string& name, const std::vector<ExprValue>& args, bool want_max) {
    if (args.empty()) {
        fail(name + " expected at least 1 argument, got 0");
    }
    if (args.size() == 1) {
        const ExprValue& only = args[0];
        if (!std::holds_alternative<std::string>(only)) {
            fail("'" + type_name(only) + "' object is not iterable");
        }
        const std::string& text = std::get<std::string>(only);
        if (text.empty()) {
            fail(name + "() arg is an empty sequence");
        }
        char c = want_max ? *std::max_element(text.begin(), text.end())
                          : *std::min_element(text.begin(), text.end());
        return std::string(1, c);
    }

    ExprValue best = args[0];
    for (size_t i = 1; i < args.size(); ++i) {
        bool better = want_max ? apply_compare(CompareOp::Gt, args[i], best)
                               : apply_compare(CompareOp::Lt, args[i], best);
        if (better) {
            best = args[i];
        }
    }
    return best;
}

} // anonymous namespace

std::string op_symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::FloorDiv: return "//";
        case BinaryOp::Mod: return "%";
        case BinaryOp::Pow: return "**";
    }
    return "?";
}

std::string op_symbol(CompareOp op) {
    switch (op) {
        case CompareOp::Lt: return "<";
        case CompareOp::Le: return "<=";
        case CompareOp::Gt: return ">";
        case CompareOp::Ge: return ">=";
        case CompareOp::Eq: return "==";
        case CompareOp::Ne: return "!=";
    }
    return "?";
}

std::string type_name(const ExprValue& value) {
    switch (value.index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "float";
        default: return "str";
    }
}

bool is_integral(const ExprValue& value) {
    return std::holds_alternative<bool>(value) || std::holds_alternative<long long>(value);
}

bool is_number(const ExprValue& value) {
    return !std::holds_alternative<std::string>(value);
}

long long as_integer(const ExprValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    return std::get<long long>(value);
}

double as_double(const ExprValue& value) {
    if (const double* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (is_integral(value)) {
        return static_cast<double>(as_integer(value));
    }
    fail("must be real number, not str");
}

bool truthy(const ExprValue& value) {
    switch (value.index()) {
        case 0: return std::get<bool>(value);
        case 1: return std::get<long long>(value) != 0;
        case 2: return std::get<double>(value) != 0.0;
        default: return !std::get<std::string>(value).empty();
    }
}

std::string display_string(const ExprValue& value) {
    switch (value.index()) {
        case 0: return std::get<bool>(value) ? "True" : "False";
        case 1: return std::to_string(std::get<long long>(value));
        case 2: return format_float_repr(std::get<double>(value));
        default: return std::get<std::string>(value);
    }
}

ExprValue apply_binary(BinaryOp op, const ExprValue& left, const ExprValue& right) {
    const bool left_str = std::holds_alternative<std::string>(left);
    const bool right_str = std::holds_alternative<std::string>(right);

    if (left_str || right_str) {
        if (op == BinaryOp::Add && left_str && right_str) {
            return std::get<std::string>(left) + std::get<std::string>(right);
        }
        unsupported_operands(op_symbol(op), left, right);
    }

    if (is_integral(left) && is_integral(right)) {
        long long a = as_integer(left);
        long long b = as_integer(right);
        long long result = 0;
        switch (op) {
            case BinaryOp::Add:
                if (!__builtin_add_overflow(a, b, &result)) return result;
                return static_cast<double>(a) + static_cast<double>(b);
            case BinaryOp::Sub:
                if (!__builtin_sub_overflow(a, b, &result)) return result;
                return static_cast<double>(a) - static_cast<double>(b);
            case BinaryOp::Mul:
                if (!__builtin_mul_overflow(a, b, &result)) return result;
                return checked_float(static_cast<double>(a) * static_cast<double>(b), "multiplication");
            case BinaryOp::Div:
                if (b == 0) throw ZeroDivisionError();
                return static_cast<double>(a) / static_cast<double>(b);
            case BinaryOp::FloorDiv: {
                if (b == 0) throw ZeroDivisionError();
                if (a == std::numeric_limits<long long>::min() && b == -1) {
                    return -static_cast<double>(a);
                }
                long long q = a / b;
                if ((a % b != 0) && ((a < 0) != (b < 0))) q -= 1;
                return q;
            }
            case BinaryOp::Mod: {
                if (b == 0) throw ZeroDivisionError();
                if (b == -1) return 0LL;
                long long r = a % b;
                if (r != 0 && ((r < 0) != (b < 0))) r += b;
                return r;
            }
            case BinaryOp::Pow:
                if (b >= 0) return integer_power(a, b);
                if (a == 0) throw ZeroDivisionError();
                return std::pow(static_cast<double>(a), static_cast<double>(b));
        }
    }

    double a = as_double(left);
    double b = as_double(right);
    switch (op) {
        case BinaryOp::Add: return a + b;
        case BinaryOp::Sub: return a - b;
        case BinaryOp::Mul: return a * b;
        case BinaryOp::Div:
            if (b == 0.0) throw ZeroDivisionError();
            return a / b;
        case BinaryOp::FloorDiv: {
            if (b == 0.0) throw ZeroDivisionError();
            double floordiv = 0.0, mod = 0.0;
            float_divmod(a, b, floordiv, mod);
            return floordiv;
        }
        case BinaryOp::Mod: {
            if (b == 0.0) throw ZeroDivisionError();
            double floordiv = 0.0, mod = 0.0;
            float_divmod(a, b, floordiv, mod);
            return mod;
        }
        case BinaryOp::Pow: {
            if (a == 0.0 && b < 0.0) throw ZeroDivisionError();
            if (a < 0.0 && std::floor(b) != b && std::isfinite(b)) {
                fail("negative number cannot be raised to a fractional power");
            }
            double result = std::pow(a, b);
            if (std::isfinite(a) && std::isfinite(b)) {
                checked_float(result, "power");
            }
            return result;
        }
    }
    fail("unknown operator");
}

ExprValue apply_unary(UnaryOp op, const ExprValue& operand) {
    if (std::holds_alternative<std::string>(operand)) {
        fail(std::string("bad operand type for unary ") + (op == UnaryOp::Minus ? "-" : "+") + ": 'str'");
    }
    if (is_integral(operand)) {
        long long value = as_integer(operand);
        if (op == UnaryOp::Plus) return value;
        if (value == std::numeric_limits<long long>::min()) return -static_cast<double>(value);
        return -value;
    }
    double value = std::get<double>(operand);
    return op == UnaryOp::Minus ? -value : value;
}

bool apply_compare(CompareOp op, const ExprValue& left, const ExprValue& right) {
    const bool left_str = std::holds_alternative<std::string>(left);
    const bool right_str = std::holds_alternative<std::string>(right);

    if (left_str != right_str) {
        if (op == CompareOp::Eq) return false;
        if (op == CompareOp::Ne) return true;
        fail("'" + op_symbol(op) + "' not supported between instances of '" +
             type_name(left) + "' and '" + type_name(right) + "'");
    }

    int order = 0;
    if (left_str) {
        int cmp = std::get<std::string>(left).compare(std::get<std::string>(right));
        order = cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    } else if (is_integral(left) && is_integral(right)) {
        long long a = as_integer(left);
        long long b = as_integer(right);
        order = a < b ? -1 : (a > b ? 1 : 0);
    } else {
        double a = as_double(left);
        double b = as_double(right);
        if (std::isnan(a) || std::isnan(b)) {
            return op == CompareOp::Ne;
        }
        order = a < b ? -1 : (a > b ? 1 : 0);
    }

    switch (op) {
        case CompareOp::Lt: return order < 0;
        case CompareOp::Le: return order <= 0;
        case CompareOp::Gt: return order > 0;
        case CompareOp::Ge: return order >= 0;
        case CompareOp::Eq: return order == 0;
        case CompareOp::Ne: return order != 0;
    }
    return false;
}

bool is_allowed_function(const std::string& name) {
    static const std::set<std::string> allowed = {
        "abs", "round", "max", "min", "sum", "len", "float", "int", "str"
    };
    return allowed.count(name) > 0;
}

ExprValue call_function(const std::string& name, const std::vector<ExprValue>& args) {
    auto expect_args = [&](size_t count) {
        if (args.size() != count) {
            fail(name + "() takes exactly " + std::to_string(count) + " argument (" +
                 std::to_string(args.size()) + " given)");
        }
    };

    if (name == "abs") {
        expect_args(1);
        if (std::holds_alternative<std::string>(args[0])) {
            fail("bad operand type for abs(): 'str'");
        }
        if (is_integral(args[0])) {
            long long value = as_integer(args[0]);
            if (value == std::numeric_limits<long long>::min()) return -static_cast<double>(value);
            return value < 0 ? -value : value;
        }
        return std::fabs(std::get<double>(args[0]));
    }
    if (name == "round") {
        return round_value(args);
    }
    if (name == "max") {
        return extremum(name, args, true);
    }
    if (name == "min") {
        return extremum(name, args, false);
    }
    if (name == "sum") {
        ExprValue total = 0LL;
        for (const auto& arg : args) {
            if (!is_number(arg)) {
                fail("unsupported operand type(s) for +: '" + type_name(total) + "' and 'str'");
            }
            total = apply_binary(BinaryOp::Add, total, arg);
        }
        return total;
    }
    if (name == "len") {
        expect_args(1);
        if (!std::holds_alternative<std::string>(args[0])) {
            fail("object of type '" + type_name(args[0]) + "' has no len()");
        }
        return static_cast<long long>(std::get<std::string>(args[0]).size());
    }
    if (name == "float") {
        if (args.empty()) return 0.0;
        expect_args(1);
        if (const std::string* text = std::get_if<std::string>(&args[0])) {
            auto parsed = parse_double(*text);
            if (!parsed) {
                fail("could not convert string to float: '" + *text + "'");
            }
            return *parsed;
        }
        return as_double(args[0]);
    }
    if (name == "int") {
        if (args.empty()) return 0LL;
        expect_args(1);
        if (const std::string* text = std::get_if<std::string>(&args[0])) {
            auto parsed = parse_integer(*text);
            if (!parsed) {
                fail("invalid literal for int() with base 10: '" + *text + "'");
            }
            return *parsed;
        }
        if (is_integral(args[0])) {
            return as_integer(args[0]);
        }
        return float_to_integer(std::trunc(std::get<double>(args[0])), "int()");
    }
    if (name == "str") {
        if (args.empty()) return std::string();
        expect_args(1);
        return display_string(args[0]);
    }

    throw SafeEvalError(SafeEvalErrorKind::DisallowedConstruct, "Function not allowed: " + name);
}

} // namespace expr
} // namespace reportcalc
