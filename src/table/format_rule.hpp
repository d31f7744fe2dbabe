#ifndef REPORTCALC_TABLE_FORMAT_RULE_HPP
#define REPORTCALC_TABLE_FORMAT_RULE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reportcalc {

enum class RuleComparison { GreaterEqual, LessEqual, Greater, Less, Equal, Always };

// Conditional number format: "x >= 100" -> "{:.1f}"
struct FormatRule {
    RuleComparison comparison;
    double threshold;
    std::string format;              // Template ("{:.1f} lm") or bare spec (".1f")
    std::string default_format;      // Used when no rule of the list matches

    FormatRule()
        : comparison(RuleComparison::Always), threshold(0.0),
          format("{:.1f}"), default_format("{:.2f}") {}

    bool matches(double value) const;
};

// Parse [{"condition": "x >= 100", "format": "{:.1f}"}, ...]. Entries whose
// condition is missing or does not parse are dropped.
std::vector<FormatRule> parse_format_rules(const nlohmann::json& rules_config);

// First matching rule's format, else the default format. A value with no
// numeric reading is returned in display form ("" for null). A format that
// cannot be applied falls back to the display form of the number.
std::string format_with_rules(const nlohmann::json& value, const std::vector<FormatRule>& rules);

// Number formatted with a template or bare spec; display form on failure
std::string format_number_with(double value, const std::string& format);

} // namespace reportcalc

#endif // REPORTCALC_TABLE_FORMAT_RULE_HPP
