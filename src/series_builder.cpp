#include "series_builder.hpp"
#include <algorithm> // For std::stable_sort, std::find
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility> // For std::move

namespace growth_fit {

namespace {

std::string
trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) { return ""; }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

// Splits one CSV record. Quoted fields may contain commas and "" for a literal quote;
// whitespace outside the quotes is dropped.
std::vector<std::string>
split_csv_line(const std::string &line, size_t line_no) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c != '"') {
                cell += c;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                in_quotes = false;
            }
        } else if (c == ',') {
            cells.push_back(quoted ? cell : trim(cell));
            cell.clear();
            quoted = false;
        } else if (c == '"') {
            if (quoted || !trim(cell).empty()) {
                throw std::runtime_error("Line " + std::to_string(line_no) + ": unexpected quote inside a field.");
            }
            cell.clear();
            quoted = true;
            in_quotes = true;
        } else if (quoted) {
            if (c != ' ' && c != '\t' && c != '\r') {
                throw std::runtime_error("Line " + std::to_string(line_no) + ": text after a closing quote.");
            }
        } else {
            cell += c;
        }
    }
    if (in_quotes) { throw std::runtime_error("Line " + std::to_string(line_no) + ": unterminated quoted field."); }
    cells.push_back(quoted ? cell : trim(cell));
    return cells;
}

size_t
column_index(const std::vector<std::string> &header, const std::string &name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) { throw std::runtime_error("CSV header is missing required column '" + name + "'."); }
    return static_cast<size_t>(it - header.begin());
}

bool
is_missing_cell(const std::string &cell) {
    return cell.empty() || cell == "NA" || cell == "NaN" || cell == "nan";
}

double
parse_number(const std::string &cell, const std::string &column, size_t line_no) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception &) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != cell.size()) {
        throw std::runtime_error("Line " + std::to_string(line_no) + ": cannot parse " + column + " value '" + cell +
                                 "'.");
    }
    return value;
}

} // namespace

GroupedSeries
build_grouped_series(const std::vector<TidyRow> &rows) {
    GroupedSeries grouped;
    for (const auto &row : rows) {
        if (!std::isfinite(row.time) || row.time < 0.0) {
            std::ostringstream msg;
            msg << "Invalid time " << row.time << " for group " << row.key << "; times must be finite and >= 0.";
            throw std::invalid_argument(msg.str());
        }
        if (row.density < 0.0) {
            std::ostringstream msg;
            msg << "Negative density " << row.density << " at time " << row.time << " for group " << row.key << ".";
            throw std::invalid_argument(msg.str());
        }
        grouped[row.key].emplace_back(row.time, row.density);
    }
    for (auto &pair : grouped) {
        std::stable_sort(pair.second.begin(), pair.second.end(), [](const Observation &a, const Observation &b) {
            return a.time < b.time;
        });
    }
    return grouped;
}

std::vector<TidyRow>
read_tidy_csv(std::istream &input, const TidyColumns &columns) {
    std::string line;
    if (!std::getline(input, line)) { throw std::runtime_error("CSV input is empty; expected a header row."); }

    const std::vector<std::string> header = split_csv_line(line, 1);
    const size_t organism_col = column_index(header, columns.organism);
    const size_t experiment_col = column_index(header, columns.experiment);
    const size_t replicate_col = column_index(header, columns.replicate);
    const size_t time_col = column_index(header, columns.time);
    const size_t density_col = column_index(header, columns.density);

    std::vector<TidyRow> rows;
    size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (trim(line).empty()) { continue; }

        const std::vector<std::string> cells = split_csv_line(line, line_no);
        if (cells.size() != header.size()) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": expected " + std::to_string(header.size()) +
                                     " columns, found " + std::to_string(cells.size()) + ".");
        }

        TidyRow row;
        row.key = GroupKey(cells[organism_col], cells[experiment_col], cells[replicate_col]);
        if (is_missing_cell(cells[time_col])) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": time value is missing.");
        }
        row.time = parse_number(cells[time_col], columns.time, line_no);
        row.density = is_missing_cell(cells[density_col]) ? std::numeric_limits<double>::quiet_NaN()
                                                          : parse_number(cells[density_col], columns.density, line_no);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<TidyRow>
read_tidy_csv(const std::string &path, const TidyColumns &columns) {
    std::ifstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Cannot open CSV file: " + path); }
    return read_tidy_csv(file, columns);
}

} // namespace growth_fit
