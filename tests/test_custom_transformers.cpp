#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/table/custom_transformers.hpp"
#include "../src/table/format_rule.hpp"
#include "../src/logger.hpp"

using namespace reportcalc;
using json = nlohmann::json;

namespace {

std::string text(const Grid& grid, size_t row, size_t column) {
    return cell_to_string(grid.at(row).at(column));
}

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

} // namespace

TEST_CASE("Format rules", "[format_rule]") {
    quiet_logger();
    json config = json::parse(R"([
        {"condition": "x >= 100", "format": "{:.0f}"},
        {"condition": "x<10", "format": "{:.2f}"},
        {"condition": "y > 3", "format": "{:.3f}"},
        {"format": "{:.4f}"}
    ])");
    std::vector<FormatRule> rules = parse_format_rules(config);

    SECTION("Parsing drops unusable entries") {
        REQUIRE(rules.size() == 2);
        REQUIRE(rules[0].comparison == RuleComparison::GreaterEqual);
        REQUIRE(rules[0].threshold == 100.0);
        REQUIRE(rules[1].comparison == RuleComparison::Less);
        REQUIRE(parse_format_rules(json::object()).empty());
    }

    SECTION("First matching rule wins") {
        REQUIRE(format_with_rules(150.4, rules) == "150");
        REQUIRE(format_with_rules(5, rules) == "5.00");
        REQUIRE(format_with_rules("12.5", rules) == "12.50");
    }

    SECTION("Default and non-numeric values") {
        REQUIRE(format_with_rules(50.0, rules) == "50.00");
        REQUIRE(format_with_rules(2.0, {}) == "2.00");
        REQUIRE(format_with_rules(nullptr, rules) == "");
        REQUIRE(format_with_rules("n/a", rules) == "n/a");
    }

    SECTION("Unusable formats fall back to the number") {
        REQUIRE(format_number_with(1.0, "{:q}") == "1.0");
        REQUIRE(format_number_with(1.25, "{:.1f} lm") == "1.2 lm");
    }
}

TEST_CASE("Custom transformer registry", "[custom_transformers]") {
    quiet_logger();

    SECTION("Built-ins") {
        CustomTransformerRegistry registry;
        std::vector<std::string> names = registry.list_transformers();

        REQUIRE(names.size() == 5);
        REQUIRE(names.front() == TransformerName::BEAM);
        REQUIRE(registry.has_transformer(TransformerName::ZONE));
        REQUIRE_FALSE(CustomTransformerRegistry(false).has_transformer(TransformerName::ZONE));
    }

    SECTION("Registration replaces") {
        CustomTransformerRegistry registry;
        registry.register_transformer(TransformerName::BEAM, [](const Grid&, const json&, const TransformContext&) {
            return Grid{{std::string("replaced")}};
        });
        Grid out = registry.transform(TransformerName::BEAM, Grid(), json::object(), TransformContext());
        REQUIRE(text(out, 0, 0) == "replaced");
        REQUIRE(registry.list_transformers().size() == 5);
    }

    SECTION("Invalid registrations") {
        CustomTransformerRegistry registry(false);
        REQUIRE_THROWS_AS(registry.register_transformer("", [](const Grid& g, const json&, const TransformContext&) { return g; }),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(registry.register_transformer("x", CustomTransformerRegistry::TransformerFunction()),
                          std::invalid_argument);
    }

    SECTION("Unknown name lists what is available") {
        CustomTransformerRegistry registry;
        try {
            registry.transform("nope", Grid(), json::object(), TransformContext());
            FAIL("Expected TransformError");
        } catch (const TransformError& e) {
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("nope"));
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("zone_table_transformer"));
        }
    }

    SECTION("Params of the wrong shape") {
        CustomTransformerRegistry registry;
        json extracted = {{"beam_angle", 40}, {"zone_30", 1.0}};
        TransformContext context;
        context.extracted_data = &extracted;
        json params = {{"zone_angles", "abc"}};
        REQUIRE_THROWS_AS(registry.transform(TransformerName::ZONE, Grid(), params, context), TransformError);
    }
}

TEST_CASE("Photometric transformer", "[custom_transformers]") {
    quiet_logger();
    Grid grid{
        {std::string("1000"), std::string("10"), std::string("")},
        {std::string("500"), std::string("10"), std::string("")}
    };

    SECTION("Formulas, average row and format rules") {
        json params = json::parse(R"({
            "calculate_columns": [2],
            "formulas": {"2": "A{row}/B{row}"},
            "average_columns": [2],
            "format_rules": {"2": [
                {"condition": "x >= 100", "format": "{:.0f}"},
                {"condition": "x < 100", "format": "{:.1f}"}
            ]}
        })");
        Grid out = photometric_data_transformer(grid, params, TransformContext());

        REQUIRE(out.size() == 3);
        REQUIRE(text(out, 0, 2) == "100");
        REQUIRE(text(out, 1, 2) == "50.0");
        REQUIRE(text(out, 2, 0) == "Average");
        REQUIRE(text(out, 2, 2) == "75.0");
        REQUIRE(grid[0][2] == Cell(std::string("")));
    }

    SECTION("Average without rules uses two decimals") {
        json params = json::parse(R"({
            "calculate_columns": [2],
            "formulas": {"2": "A{row}/B{row}"},
            "average_columns": [2]
        })");
        Grid out = photometric_data_transformer(grid, params, TransformContext());

        REQUIRE(text(out, 0, 2) == "100.0");
        REQUIRE(text(out, 2, 2) == "75.00");
    }

    SECTION("Division by zero and rejected formulas") {
        json params = json::parse(R"({
            "calculate_columns": [1, 2],
            "formulas": {"1": "A{row}/0", "2": "__import__('os')"}
        })");
        Grid out = photometric_data_transformer(grid, params, TransformContext());

        REQUIRE(out.size() == 2);
        REQUIRE(text(out, 0, 1) == "0.0");
        REQUIRE(text(out, 0, 2) == "");
    }

    SECTION("Life table behaves the same") {
        json params = json::parse(R"({"average_columns": [0]})");
        Grid out = life_table_transformer(grid, params, TransformContext());
        REQUIRE(text(out, 2, 0) == "750.00");
    }

    SECTION("Empty grid") {
        REQUIRE(photometric_data_transformer(Grid(), json::object(), TransformContext()).empty());
    }
}

TEST_CASE("Beam transformer", "[custom_transformers]") {
    json extracted = {{"beam_angle", 36.04}, {"peak_intensity", "1234.6"}};
    TransformContext context;
    context.extracted_data = &extracted;

    Grid out = beam_table_transformer(Grid(), json::object(), context);
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].size() == 2);
    REQUIRE(text(out, 1, 1) == "36.0");
    REQUIRE(text(out, 2, 1) == "1235");

    REQUIRE(beam_table_transformer(Grid(), json::object(), TransformContext()).empty());
}

TEST_CASE("EEI transformer", "[custom_transformers]") {
    json extracted = json::parse(R"({
        "photometric_data": [["Model", "Efficacy"], ["a", "120"], ["b", 100]],
        "model_a": "LX-1",
        "model_b": ""
    })");
    TransformContext context;
    context.extracted_data = &extracted;

    SECTION("One row per present model") {
        json params = json::parse(R"({"efficacy_column": 1, "model_fields": ["model_a", "model_b"]})");
        Grid out = eei_table_transformer(Grid(), params, context);

        REQUIRE(out.size() == 1);
        REQUIRE(out[0].size() == 5);
        REQUIRE(text(out, 0, 0) == "LX-1");
        REQUIRE(text(out, 0, 1) == "110.0");
        REQUIRE(text(out, 0, 2) == "A+");
        REQUIRE(text(out, 0, 3) == kMergeMarker);
        REQUIRE(text(out, 0, 4) == kMergeMarker);
    }

    SECTION("Below every threshold") {
        json params = json::parse(R"({"efficacy_column": 1, "eei_thresholds": {"A": 200}, "merge_columns": []})");
        Grid out = eei_table_transformer(Grid(), params, context);

        REQUIRE(out.size() == 1);
        REQUIRE(out[0].size() == 3);
        REQUIRE(text(out, 0, 0) == "");
        REQUIRE(text(out, 0, 2) == "E");
    }
}

TEST_CASE("Zone transformer", "[custom_transformers]") {
    json extracted = json::parse(R"({
        "beam_angle": 40,
        "zone_30": 100.26,
        "zone_60": "250",
        "zone_90": null,
        "zone_120": ""
    })");
    TransformContext context;
    context.extracted_data = &extracted;

    SECTION("Present zones within range") {
        json params = json::parse(R"({"zone_angles": [30, 60, 90, 120, 200]})");
        Grid out = zone_table_transformer(Grid(), params, context);

        REQUIRE(out.size() == 2);
        REQUIRE(text(out, 0, 0) == "0-30\xC2\xB0");
        REQUIRE(text(out, 0, 1) == "100.3");
        REQUIRE(text(out, 1, 0) == "0-60\xC2\xB0");
        REQUIRE(text(out, 1, 1) == "250.0");
    }

    SECTION("Angle override and format") {
        json params = json::parse(R"({"max_angle_override": 45, "format": "{:.2f}"})");
        Grid out = zone_table_transformer(Grid(), params, context);

        REQUIRE(out.size() == 1);
        REQUIRE(text(out, 0, 1) == "100.26");
    }
}
