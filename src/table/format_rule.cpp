#include "format_rule.hpp"
#include "../expr/eval_error.hpp"
#include "../expr/format_spec.hpp"
#include "../logger.hpp"
#include "../value_utils.hpp"
#include <regex>

namespace reportcalc {

using json = nlohmann::json;

bool FormatRule::matches(double value) const {
    switch (comparison) {
        case RuleComparison::GreaterEqual: return value >= threshold;
        case RuleComparison::LessEqual: return value <= threshold;
        case RuleComparison::Greater: return value > threshold;
        case RuleComparison::Less: return value < threshold;
        case RuleComparison::Equal: return value == threshold;
        case RuleComparison::Always: return true;
    }
    return true;
}

std::vector<FormatRule> parse_format_rules(const json& rules_config) {
    static const std::regex condition_pattern(R"(^x\s*([><=!]+)\s*([\d.]+))");

    std::vector<FormatRule> rules;
    if (!rules_config.is_array()) {
        return rules;
    }

    for (const auto& entry : rules_config) {
        if (!entry.is_object()) {
            continue;
        }
        std::string condition = entry.value("condition", "");
        if (condition.empty()) {
            continue;
        }

        std::smatch match;
        if (!std::regex_search(condition, match, condition_pattern)) {
            continue;
        }
        auto threshold = parse_double(match[2].str());
        if (!threshold) {
            continue;
        }

        FormatRule rule;
        std::string op = match[1].str();
        if (op == ">=" || op == "=>") rule.comparison = RuleComparison::GreaterEqual;
        else if (op == "<=" || op == "=<") rule.comparison = RuleComparison::LessEqual;
        else if (op == ">") rule.comparison = RuleComparison::Greater;
        else if (op == "<") rule.comparison = RuleComparison::Less;
        else if (op == "==") rule.comparison = RuleComparison::Equal;
        else rule.comparison = RuleComparison::Always;

        rule.threshold = *threshold;
        rule.format = entry.value("format", "{:.1f}");
        rules.push_back(rule);
    }
    return rules;
}

std::string format_number_with(double value, const std::string& format) {
    try {
        return expr::format_with_template(format, value);
    } catch (const SafeEvalError& e) {
        Logger::get_instance().log_warning(LogContext("format_rule"),
                                           "Cannot apply format '" + format + "': " + e.what());
        return format_float_repr(value);
    }
}

std::string format_with_rules(const json& value, const std::vector<FormatRule>& rules) {
    if (value.is_null()) {
        return "";
    }
    auto number = to_double(value);
    if (!number) {
        return to_display_string(value);
    }

    for (const auto& rule : rules) {
        if (rule.matches(*number)) {
            return format_number_with(*number, rule.format);
        }
    }
    std::string fallback = rules.empty() ? FormatRule().default_format : rules.front().default_format;
    return format_number_with(*number, fallback);
}

} // namespace reportcalc
