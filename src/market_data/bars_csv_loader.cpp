#include "bars_csv_loader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace QuantSignal {
namespace Core {

namespace {

const char* const REQUIRED_COLUMNS[] = {"timestamp", "open", "high", "low", "close", "volume"};
constexpr size_t REQUIRED_COLUMN_COUNT = 6;

std::string trim(const std::string& input_string) {
    const char* whitespace_chars = " \t\r\n";
    size_t begin_position = input_string.find_first_not_of(whitespace_chars);
    if (begin_position == std::string::npos) return "";
    size_t end_position = input_string.find_last_not_of(whitespace_chars);
    return input_string.substr(begin_position, end_position - begin_position + 1);
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream line_stream(line);
    std::string field;
    while (std::getline(line_stream, field, ',')) {
        fields.push_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.push_back("");
    }
    return fields;
}

double parse_numeric_field(const std::string& field_value, const std::string& column_name, size_t line_number) {
    size_t parsed_characters = 0;
    double numeric_value = 0.0;
    try {
        numeric_value = std::stod(field_value, &parsed_characters);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + column_name + " value '" + field_value + "' on line " + std::to_string(line_number));
    }
    if (parsed_characters != field_value.size()) {
        throw std::runtime_error("Invalid " + column_name + " value '" + field_value + "' on line " + std::to_string(line_number));
    }
    return numeric_value;
}

} // anonymous namespace

PriceSeries load_bars_from_csv(const std::string& file_path) {
    std::ifstream bars_file(file_path);
    if (!bars_file.is_open()) {
        throw std::runtime_error("Cannot open bars file: " + file_path);
    }
    return parse_bars_csv(bars_file, file_path);
}

PriceSeries parse_bars_csv(std::istream& input_stream, const std::string& file_label) {
    std::string line;
    size_t line_number = 0;

    std::vector<std::string> header_fields;
    while (std::getline(input_stream, line)) {
        ++line_number;
        if (!trim(line).empty()) {
            header_fields = split_csv_line(trim(line));
            break;
        }
    }
    if (header_fields.empty()) {
        throw std::runtime_error("Bars file is empty: " + file_label);
    }

    for (std::string& header_field : header_fields) {
        std::transform(header_field.begin(), header_field.end(), header_field.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    }

    size_t column_positions[REQUIRED_COLUMN_COUNT];
    for (size_t column_index = 0; column_index < REQUIRED_COLUMN_COUNT; ++column_index) {
        std::vector<std::string>::const_iterator header_iterator =
            std::find(header_fields.begin(), header_fields.end(), REQUIRED_COLUMNS[column_index]);
        if (header_iterator == header_fields.end()) {
            throw std::runtime_error("Bars file " + file_label + " is missing column: " + REQUIRED_COLUMNS[column_index]);
        }
        column_positions[column_index] = static_cast<size_t>(header_iterator - header_fields.begin());
    }

    PriceSeries bars;
    while (std::getline(input_stream, line)) {
        ++line_number;
        std::string trimmed_line = trim(line);
        if (trimmed_line.empty()) {
            continue;
        }

        std::vector<std::string> fields = split_csv_line(trimmed_line);
        if (fields.size() != header_fields.size()) {
            throw std::runtime_error("Expected " + std::to_string(header_fields.size()) + " fields on line " +
                                     std::to_string(line_number) + " of " + file_label + ", got " + std::to_string(fields.size()));
        }

        Bar bar;
        bar.timestamp = fields[column_positions[0]];
        bar.open_price = parse_numeric_field(fields[column_positions[1]], "open", line_number);
        bar.high_price = parse_numeric_field(fields[column_positions[2]], "high", line_number);
        bar.low_price = parse_numeric_field(fields[column_positions[3]], "low", line_number);
        bar.close_price = parse_numeric_field(fields[column_positions[4]], "close", line_number);
        bar.volume = parse_numeric_field(fields[column_positions[5]], "volume", line_number);
        bars.push_back(bar);
    }
    return bars;
}

} // namespace Core
} // namespace QuantSignal
