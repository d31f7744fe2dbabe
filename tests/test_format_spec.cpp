#include <catch2/catch_test_macros.hpp>
#include "../src/expr/format_spec.hpp"
#include "../src/expr/eval_error.hpp"

using namespace reportcalc;
using namespace reportcalc::expr;

TEST_CASE("Format spec whitelist", "[format_spec]") {
    SECTION("Allowed") {
        REQUIRE(is_allowed_format_spec(""));
        REQUIRE(is_allowed_format_spec(".2f"));
        REQUIRE(is_allowed_format_spec("d"));
        REQUIRE(is_allowed_format_spec("8d"));
        REQUIRE(is_allowed_format_spec(".3e"));
        REQUIRE(is_allowed_format_spec(".1%"));
        REQUIRE(is_allowed_format_spec("g"));
    }

    SECTION("Rejected") {
        REQUIRE_FALSE(is_allowed_format_spec(">10"));
        REQUIRE_FALSE(is_allowed_format_spec(",.2f"));
        REQUIRE_FALSE(is_allowed_format_spec(".2fx"));
        REQUIRE_FALSE(is_allowed_format_spec("s"));
        REQUIRE_THROWS_AS(parse_format_spec("0>10"), SafeEvalError);
    }

    SECTION("Parsed fields") {
        FormatSpec precision = parse_format_spec(".2f");
        REQUIRE(precision.has_dot);
        REQUIRE(precision.precision == 2);
        REQUIRE(precision.type == 'f');

        FormatSpec width = parse_format_spec("5d");
        REQUIRE_FALSE(width.has_dot);
        REQUIRE(width.width == 5);
        REQUIRE(width.type == 'd');

        REQUIRE(parse_format_spec("").empty());
    }

    SECTION("Oversized numbers are rejected") {
        try {
            parse_format_spec(".9999f");
            FAIL("Expected SafeEvalError");
        } catch (const SafeEvalError& e) {
            REQUIRE(e.kind() == SafeEvalErrorKind::DisallowedConstruct);
        }
    }
}

TEST_CASE("Applying format specs", "[format_spec]") {
    SECTION("Fixed point") {
        REQUIRE(apply_format_spec(ExprValue(3.14159), parse_format_spec(".2f")) == "3.14");
        REQUIRE(apply_format_spec(ExprValue(2LL), parse_format_spec(".1f")) == "2.0");
        REQUIRE(apply_format_spec(ExprValue(1.0), parse_format_spec("f")) == "1.000000");
    }

    SECTION("Integers") {
        REQUIRE(apply_format_spec(ExprValue(42LL), parse_format_spec("d")) == "42");
        REQUIRE(apply_format_spec(ExprValue(42LL), parse_format_spec("5d")) == "   42");
        REQUIRE(apply_format_spec(ExprValue(true), parse_format_spec("d")) == "1");
    }

    SECTION("Exponent, general and percent") {
        REQUIRE(apply_format_spec(ExprValue(12345.678), parse_format_spec(".2e")) == "1.23e+04");
        REQUIRE(apply_format_spec(ExprValue(0.5), parse_format_spec(".0%")) == "50%");
        REQUIRE(apply_format_spec(ExprValue(0.00001234), parse_format_spec(".3g")) == "1.23e-05");
    }

    SECTION("Empty spec is the display text") {
        REQUIRE(apply_format_spec(ExprValue(4000.0), FormatSpec()) == "4000.0");
        REQUIRE(apply_format_spec(ExprValue(std::string("lm")), FormatSpec()) == "lm");
    }

    SECTION("Type mismatches fail at execution") {
        REQUIRE_THROWS_AS(apply_format_spec(ExprValue(1.5), parse_format_spec("d")), SafeEvalError);
        REQUIRE_THROWS_AS(apply_format_spec(ExprValue(std::string("a")), parse_format_spec(".1f")), SafeEvalError);
        REQUIRE_THROWS_AS(apply_format_spec(ExprValue(1.5), parse_format_spec(".f")), SafeEvalError);
    }
}

TEST_CASE("Format templates", "[format_spec]") {
    REQUIRE(format_with_template("{:.1f}", ExprValue(1650.04)) == "1650.0");
    REQUIRE(format_with_template("{:.1f} lm", ExprValue(1650.04)) == "1650.0 lm");
    REQUIRE(format_with_template("{0:.2f}", ExprValue(1.005)) == "1.00");
    REQUIRE(format_with_template("{{{:d}}}", ExprValue(7LL)) == "{7}");
    REQUIRE(format_with_template("{}", ExprValue(2.5)) == "2.5");
    REQUIRE(format_with_template(".3f", ExprValue(2.0)) == "2.000");

    REQUIRE_THROWS_AS(format_with_template("{:.1f", ExprValue(1.0)), SafeEvalError);
    REQUIRE_THROWS_AS(format_with_template("{name}", ExprValue(1.0)), SafeEvalError);
    REQUIRE_THROWS_AS(format_with_template("x}", ExprValue(1.0)), SafeEvalError);
}
