#include "builtin_functions.hpp"
#include "function_registry.hpp"
#include "value_utils.hpp"
#include <cmath>
#include <stdexcept>

namespace reportcalc {

namespace {

using Args = std::vector<nlohmann::json>;

void require_args(const Args& args, size_t count, const std::string& name) {
    if (args.size() < count) {
        throw std::invalid_argument(name + "() takes at least " + std::to_string(count) +
                                    " argument(s), " + std::to_string(args.size()) + " given");
    }
}

bool is_zero(const nlohmann::json& value) {
    auto number = value.is_number() ? to_double(value) : std::nullopt;
    return number && *number == 0.0;
}

// Efficacy in lm/W, or nullopt when the guards say "N/A"
std::optional<double> efficacy(const nlohmann::json& wattage, const nlohmann::json& flux) {
    if (!is_truthy(wattage) || is_zero(wattage)) {
        return std::nullopt;
    }
    if (!is_truthy(flux)) {
        return std::nullopt;
    }

    auto watts = to_double(wattage);
    auto lumens = to_double(flux);
    if (!watts || !lumens || *watts == 0.0) {
        return std::nullopt;
    }
    return *lumens / *watts;
}

} // anonymous namespace

std::string energy_class_rating(const nlohmann::json& wattage, const nlohmann::json& flux) {
    auto value = efficacy(wattage, flux);
    if (!value) {
        return "N/A";
    }

    if (*value >= 210) return "A++";
    if (*value >= 185) return "A+";
    if (*value >= 160) return "A";
    if (*value >= 135) return "B";
    if (*value >= 110) return "C";
    if (*value >= 85) return "D";
    return "E";
}

std::string energy_efficacy(const nlohmann::json& wattage, const nlohmann::json& flux) {
    auto value = efficacy(wattage, flux);
    if (!value) {
        return "N/A";
    }
    return format_fixed(*value, 2);
}

std::string percentage(const nlohmann::json& value, const nlohmann::json& total) {
    if (!is_truthy(total) || is_zero(total)) {
        return "0.00%";
    }

    auto part = to_double(value);
    auto whole = to_double(total);
    if (!part || !whole || *whole == 0.0) {
        return "0.00%";
    }
    return format_fixed((*part / *whole) * 100.0, 2) + "%";
}

std::string format_number(const nlohmann::json& value, const nlohmann::json& decimals) {
    auto number = to_double(value);
    if (!number) {
        return to_display_string(value);
    }

    std::optional<long long> places;
    if (decimals.is_number_integer()) {
        places = decimals.get<long long>();
    } else if (decimals.is_number_float()) {
        double d = decimals.get<double>();
        if (std::isfinite(d)) {
            places = static_cast<long long>(d);  // int() truncation
        }
    } else if (decimals.is_string()) {
        places = parse_integer(decimals.get<std::string>());
    }

    if (!places || *places < 0 || *places > kMaxDecimalPlaces) {
        return to_display_string(value);
    }
    return format_fixed(*number, static_cast<int>(*places));
}

std::string concat(const std::vector<nlohmann::json>& values, const std::string& separator) {
    std::string result;
    bool first = true;
    for (const auto& value : values) {
        if (value.is_null()) {
            continue;
        }
        if (!first) {
            result += separator;
        }
        result += to_display_string(value);
        first = false;
    }
    return result;
}

double multiply(const nlohmann::json& a, const nlohmann::json& b) {
    auto left = to_double(a);
    auto right = to_double(b);
    if (!left || !right) {
        return 0.0;
    }
    return *left * *right;
}

double divide(const nlohmann::json& a, const nlohmann::json& b, const nlohmann::json& fallback) {
    double fallback_value = to_double(fallback).value_or(0.0);

    auto divisor = to_double(b);
    if (!divisor || *divisor == 0.0) {
        return fallback_value;
    }
    auto dividend = to_double(a);
    if (!dividend) {
        return fallback_value;
    }
    return *dividend / *divisor;
}

void register_builtin_functions(FunctionRegistry& registry) {
    auto class_rating = [](const Args& args) -> nlohmann::json {
        require_args(args, 2, "energy_class_rating");
        return energy_class_rating(args[0], args[1]);
    };
    auto efficacy_fn = [](const Args& args) -> nlohmann::json {
        require_args(args, 2, "energy_efficacy");
        return energy_efficacy(args[0], args[1]);
    };
    auto percentage_fn = [](const Args& args) -> nlohmann::json {
        require_args(args, 2, "percentage");
        return percentage(args[0], args[1]);
    };

    registry.register_function("energy_class_rating", class_rating);
    registry.register_function("energy_efficacy", efficacy_fn);
    registry.register_function("percentage", percentage_fn);

    // Names used by existing report configurations
    registry.register_function("calculate_energy_class_rating", class_rating);
    registry.register_function("calculate_energy_efficacy", efficacy_fn);
    registry.register_function("calculate_percentage", percentage_fn);

    registry.register_function("format_number", [](const Args& args) -> nlohmann::json {
        require_args(args, 1, "format_number");
        return args.size() > 1 ? format_number(args[0], args[1]) : format_number(args[0]);
    });
    registry.register_function("concat", [](const Args& args) -> nlohmann::json {
        return concat(args);
    });
    registry.register_function("multiply", [](const Args& args) -> nlohmann::json {
        require_args(args, 2, "multiply");
        return multiply(args[0], args[1]);
    });
    registry.register_function("divide", [](const Args& args) -> nlohmann::json {
        require_args(args, 2, "divide");
        return args.size() > 2 ? divide(args[0], args[1], args[2]) : divide(args[0], args[1]);
    });
}

} // namespace reportcalc
