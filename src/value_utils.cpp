#include "value_utils.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace reportcalc {

std::string trim(const std::string& str) {
    size_t begin = 0;
    while (begin < str.size() && std::isspace(static_cast<unsigned char>(str[begin]))) {
        begin++;
    }
    size_t end = str.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return str.substr(begin, end - begin);
}

std::optional<long long> parse_integer(const std::string& str) {
    std::string text = trim(str);
    if (text.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }

    // Digits with single underscores between them
    std::string digits;
    bool last_was_digit = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
            last_was_digit = true;
        } else if (c == '_' && last_was_digit && pos + 1 < text.size()) {
            last_was_digit = false;
        } else {
            return std::nullopt;
        }
    }
    if (!last_was_digit) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long magnitude = std::strtoull(digits.c_str(), &end, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }

    const unsigned long long max_positive =
        static_cast<unsigned long long>(std::numeric_limits<long long>::max());
    if (negative) {
        if (magnitude > max_positive + 1) {
            return std::nullopt;
        }
        if (magnitude == max_positive + 1) {
            return std::numeric_limits<long long>::min();
        }
        return -static_cast<long long>(magnitude);
    }
    if (magnitude > max_positive) {
        return std::nullopt;
    }
    return static_cast<long long>(magnitude);
}

std::optional<double> parse_double(const std::string& str) {
    std::string text = trim(str);
    if (text.empty()) {
        return std::nullopt;
    }
    // strtod would also read hexadecimal floats
    if (text.find_first_of("xXpP") != std::string::npos) {
        return std::nullopt;
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

nlohmann::json coerce_numeric_string(const nlohmann::json& value) {
    if (!value.is_string()) {
        return value;
    }
    const std::string& text = value.get_ref<const std::string&>();
    if (text.empty()) {
        return value;
    }
    if (auto as_int = parse_integer(text)) {
        return *as_int;
    }
    if (auto as_double = parse_double(text)) {
        return *as_double;
    }
    return value;
}

std::optional<double> to_double(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? 1.0 : 0.0;
    }
    if (value.is_string()) {
        return parse_double(value.get_ref<const std::string&>());
    }
    return std::nullopt;
}

bool is_truthy(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<long long>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return value.get<unsigned long long>() != 0;
        case nlohmann::json::value_t::number_float:
            return value.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            return !value.empty();
        default:
            return true;
    }
}

std::string format_float_repr(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    // Shortest scientific form that reads back to the same double
    char sci[40];
    int precision = 1;
    for (; precision <= 17; ++precision) {
        std::snprintf(sci, sizeof(sci), "%.*e", precision - 1, value);
        if (std::strtod(sci, nullptr) == value) {
            break;
        }
    }
    if (precision > 17) {
        precision = 17;
    }

    const char* exp_mark = std::strchr(sci, 'e');
    int exponent = exp_mark ? std::atoi(exp_mark + 1) : 0;

    if (exponent < -4 || exponent >= 16) {
        return sci;
    }

    int decimals = precision - 1 - exponent;
    if (decimals < 0) {
        decimals = 0;
    }
    char fixed[400];
    std::snprintf(fixed, sizeof(fixed), "%.*f", decimals, value);
    std::string out(fixed);
    if (out.find('.') == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string format_fixed(double value, int decimals) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    if (decimals > kMaxDecimalPlaces) {
        decimals = kMaxDecimalPlaces;
    }
    int size = std::snprintf(nullptr, 0, "%.*f", decimals, value);
    if (size < 0) {
        return format_float_repr(value);
    }
    std::string out(static_cast<size_t>(size) + 1, '\0');
    std::snprintf(&out[0], out.size(), "%.*f", decimals, value);
    out.resize(static_cast<size_t>(size));
    return out;
}

std::string to_display_string(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return "None";
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case nlohmann::json::value_t::number_integer:
            return std::to_string(value.get<long long>());
        case nlohmann::json::value_t::number_unsigned:
            return std::to_string(value.get<unsigned long long>());
        case nlohmann::json::value_t::number_float:
            return format_float_repr(value.get<double>());
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        default:
            return value.dump();
    }
}

} // namespace reportcalc
