#include <catch2/catch_test_macros.hpp>
#include "../src/table/grid.hpp"

using namespace reportcalc;
using json = nlohmann::json;

TEST_CASE("Column letters", "[grid]") {
    SECTION("Letters to index") {
        REQUIRE(column_letters_to_index("A") == 0);
        REQUIRE(column_letters_to_index("Z") == 25);
        REQUIRE(column_letters_to_index("AA") == 26);
        REQUIRE(column_letters_to_index("AZ") == 51);
        REQUIRE(column_letters_to_index("BA") == 52);
    }

    SECTION("Index to letters") {
        REQUIRE(column_index_to_letters(0) == "A");
        REQUIRE(column_index_to_letters(25) == "Z");
        REQUIRE(column_index_to_letters(26) == "AA");
        REQUIRE(column_index_to_letters(701) == "ZZ");
        REQUIRE(column_index_to_letters(702) == "AAA");
    }

    SECTION("Inverse") {
        for (size_t i = 0; i < 1000; ++i) {
            REQUIRE(column_letters_to_index(column_index_to_letters(i)) == i);
        }
    }

    SECTION("Invalid letters") {
        REQUIRE_THROWS_AS(column_letters_to_index(""), std::invalid_argument);
        REQUIRE_THROWS_AS(column_letters_to_index("a"), std::invalid_argument);
        REQUIRE_THROWS_AS(column_letters_to_index("A1"), std::invalid_argument);
    }

    SECTION("Overlong letters do not wrap around") {
        REQUIRE(column_letters_to_index("ZZZZ") == 475253);
        REQUIRE_THROWS_AS(column_letters_to_index(std::string(14, 'Z')), std::invalid_argument);
        REQUIRE_THROWS_AS(column_letters_to_index(std::string(40, 'B')), std::invalid_argument);
    }
}

TEST_CASE("Cell helpers", "[grid]") {
    REQUIRE(cell_to_string(Cell(4000.0)) == "4000.0");
    REQUIRE(cell_to_string(Cell(std::string("abc"))) == "abc");

    REQUIRE(cell_number(Cell(std::string(" 12.5 "))).value() == 12.5);
    REQUIRE(cell_number(Cell(2.0)).value() == 2.0);
    REQUIRE_FALSE(cell_number(Cell(std::string("12 lm"))).has_value());

    REQUIRE(is_numeric_cell(Cell(std::string("1e3"))));
    REQUIRE_FALSE(is_numeric_cell(Cell(std::string(""))));

    REQUIRE(is_blank_cell(Cell(std::string("  "))));
    REQUIRE_FALSE(is_blank_cell(Cell(0.0)));
    REQUIRE_FALSE(is_blank_cell(Cell(std::string("x"))));
}

TEST_CASE("Grid JSON conversion", "[grid]") {
    SECTION("Scalars") {
        json data = json::parse(R"([["Model", 10, 1.5, null, true]])");
        Grid grid = grid_from_json(data);

        REQUIRE(grid.size() == 1);
        REQUIRE(grid[0].size() == 5);
        REQUIRE(std::get<std::string>(grid[0][0]) == "Model");
        REQUIRE(std::get<std::string>(grid[0][1]) == "10");
        REQUIRE(std::get<double>(grid[0][2]) == 1.5);
        REQUIRE(std::get<std::string>(grid[0][3]) == "");
        REQUIRE(std::get<std::string>(grid[0][4]) == "True");
    }

    SECTION("Ragged rows are kept") {
        Grid grid = grid_from_json(json::parse(R"([["a"], [], ["b", "c"]])"));
        REQUIRE(grid.size() == 3);
        REQUIRE(grid[1].empty());
        REQUIRE(grid[2].size() == 2);
    }

    SECTION("Back to JSON") {
        Grid grid{{std::string("a"), 2.5}, {}};
        json out = grid_to_json(grid);
        REQUIRE(out == json::parse(R"([["a", 2.5], []])"));
    }

    SECTION("Invalid shapes") {
        REQUIRE_THROWS_AS(grid_from_json(json::object()), std::invalid_argument);
        REQUIRE_THROWS_AS(grid_from_json(json::parse("[1, 2]")), std::invalid_argument);
    }
}
