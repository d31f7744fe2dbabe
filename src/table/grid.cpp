#include "grid.hpp"
#include "../value_utils.hpp"
#include <limits>
#include <stdexcept>

namespace reportcalc {

using json = nlohmann::json;

size_t column_letters_to_index(const std::string& letters) {
    if (letters.empty()) {
        throw std::invalid_argument("Column letters must not be empty");
    }
    size_t index = 0;
    for (char c : letters) {
        if (c < 'A' || c > 'Z') {
            throw std::invalid_argument("Invalid column letters: " + letters);
        }
        if (index > (std::numeric_limits<size_t>::max() - 26) / 26) {
            throw std::invalid_argument("Column letters out of range: " + letters);
        }
        index = index * 26 + static_cast<size_t>(c - 'A' + 1);
    }
    return index - 1;
}

std::string column_index_to_letters(size_t index) {
    std::string letters;
    size_t n = index + 1;
    while (n > 0) {
        size_t rem = (n - 1) % 26;
        letters.insert(letters.begin(), static_cast<char>('A' + rem));
        n = (n - 1) / 26;
    }
    return letters;
}

std::string cell_to_string(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        return format_float_repr(*number);
    }
    return std::get<std::string>(cell);
}

std::optional<double> cell_number(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        return *number;
    }
    return parse_double(std::get<std::string>(cell));
}

bool is_numeric_cell(const Cell& cell) {
    return cell_number(cell).has_value();
}

bool is_blank_cell(const Cell& cell) {
    if (std::holds_alternative<double>(cell)) {
        return false;
    }
    return trim(std::get<std::string>(cell)).empty();
}

Grid grid_from_json(const json& data) {
    if (!data.is_array()) {
        throw std::invalid_argument("Grid must be a JSON array of rows");
    }

    Grid grid;
    grid.reserve(data.size());
    for (const auto& json_row : data) {
        if (!json_row.is_array()) {
            throw std::invalid_argument("Grid row must be a JSON array");
        }
        Row row;
        row.reserve(json_row.size());
        for (const auto& value : json_row) {
            if (value.is_null()) {
                row.emplace_back(std::string());
            } else if (value.is_number_float()) {
                row.emplace_back(value.get<double>());
            } else if (value.is_string()) {
                row.emplace_back(value.get<std::string>());
            } else {
                row.emplace_back(to_display_string(value));
            }
        }
        grid.push_back(std::move(row));
    }
    return grid;
}

json grid_to_json(const Grid& grid) {
    json out = json::array();
    for (const auto& row : grid) {
        json json_row = json::array();
        for (const auto& cell : row) {
            if (const auto* number = std::get_if<double>(&cell)) {
                json_row.push_back(*number);
            } else {
                json_row.push_back(std::get<std::string>(cell));
            }
        }
        out.push_back(std::move(json_row));
    }
    return out;
}

} // namespace reportcalc
