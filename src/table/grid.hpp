#ifndef REPORTCALC_TABLE_GRID_HPP
#define REPORTCALC_TABLE_GRID_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reportcalc {

// A table cell holds text or a number
using Cell = std::variant<std::string, double>;
using Row = std::vector<Cell>;
using Grid = std::vector<Row>;

// Spreadsheet column letters to zero-based index: A -> 0, Z -> 25, AA -> 26.
// Throws std::invalid_argument for an empty string or non A-Z characters.
size_t column_letters_to_index(const std::string& letters);

// Inverse of column_letters_to_index: 0 -> A, 26 -> AA
std::string column_index_to_letters(size_t index);

// Text of a cell; numbers use the shortest round-trip form ("4000.0")
std::string cell_to_string(const Cell& cell);

// Numeric reading of a cell: a number, or text that parses fully as a float
std::optional<double> cell_number(const Cell& cell);

bool is_numeric_cell(const Cell& cell);

// True if the cell is blank once surrounding whitespace is removed
bool is_blank_cell(const Cell& cell);

// JSON array of arrays to a grid. Integers and other scalars keep their
// display text, floats become numeric cells, null becomes "".
// Throws std::invalid_argument if the value is not an array of arrays.
Grid grid_from_json(const nlohmann::json& data);

nlohmann::json grid_to_json(const Grid& grid);

} // namespace reportcalc

#endif // REPORTCALC_TABLE_GRID_HPP
