/**
 * @file resistance_table.cpp
 * @brief Resistance table implementation and delimited-text reader
 */

#include "ripsim/succession/resistance_table.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

namespace ripsim {

ResistanceTable::ResistanceTable(const std::map<int, Real>& thresholds)
    : thresholds_(thresholds) {}

void ResistanceTable::set(int code, Real threshold, std::optional<Real> roughness) {
    thresholds_[code] = threshold;
    if (roughness) {
        roughness_[code] = *roughness;
    } else {
        roughness_.erase(code);
    }
}

Real ResistanceTable::threshold(int code) const {
    auto it = thresholds_.find(code);
    if (it == thresholds_.end()) {
        throw std::out_of_range("No shear resistance for vegetation code " +
                                std::to_string(code));
    }
    return it->second;
}

Real ResistanceTable::roughness(int code) const {
    auto it = roughness_.find(code);
    if (it == roughness_.end()) {
        throw std::out_of_range("No roughness for vegetation code " + std::to_string(code));
    }
    return it->second;
}

std::vector<int> ResistanceTable::codes() const {
    std::vector<int> result;
    result.reserve(thresholds_.size());
    for (const auto& [code, threshold] : thresholds_) {
        result.push_back(code);
    }
    return result;
}

// ============================================================================
// Delimited text
// ============================================================================

namespace table_io {

std::vector<std::string> split_row(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (Size i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == delimiter && !quoted) {
            cells.push_back(cell);
            cell.clear();
        } else if (c != '\r' && c != '\n') {
            cell += c;
        }
    }
    cells.push_back(cell);

    for (auto& s : cells) {
        auto start = s.find_first_not_of(" \t");
        auto end = s.find_last_not_of(" \t");
        s = (start == std::string::npos) ? std::string() : s.substr(start, end - start + 1);
    }
    return cells;
}

std::vector<std::string> disambiguate_columns(const std::vector<std::string>& names) {
    std::vector<std::string> result;
    result.reserve(names.size());
    std::set<std::string> taken(names.begin(), names.end());
    std::map<std::string, int> seen;
    for (const auto& name : names) {
        int& count = seen[name];
        if (count == 0) {
            result.push_back(name);
        } else {
            // Skip suffixes that collide with a real column name
            std::string renamed;
            do {
                renamed = name + "." + std::to_string(count++);
            } while (taken.count(renamed) > 0);
            taken.insert(renamed);
            result.push_back(renamed);
            continue;
        }
        ++count;
    }
    return result;
}

} // namespace table_io

namespace {

char detect_delimiter(const std::string& header_line) {
    const auto count = [&](char c) {
        return std::count(header_line.begin(), header_line.end(), c);
    };
    if (count('\t') > count(',') && count('\t') > count(';')) return '\t';
    if (count(';') > count(',')) return ';';
    return ',';
}

Index find_column(const std::vector<std::string>& columns, const std::string& name,
                  bool required) {
    Index found = -1;
    for (Size c = 0; c < columns.size(); ++c) {
        if (columns[c] == name) {
            found = static_cast<Index>(c);
            break;
        }
    }
    if (found < 0 && required) {
        std::string available;
        for (const auto& col : columns) {
            available += (available.empty() ? "" : ", ") + col;
        }
        throw FormatError("Resistance table has no column '" + name +
                          "' (columns: " + available + ")");
    }
    return found;
}

Real parse_cell(const std::string& cell, const std::string& column, Index row) {
    std::size_t consumed = 0;
    Real value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != cell.size()) {
        throw FormatError("Resistance table row " + std::to_string(row) +
                          ": cannot parse " + column + " value '" + cell + "'");
    }
    return value;
}

} // namespace

ResistanceTable ResistanceTable::parse_csv(std::istream& in, const TableConfig& config) {
    std::string line;
    std::string header_line;
    while (std::getline(in, header_line)) {
        if (header_line.find_first_not_of(" \t\r") != std::string::npos) break;
    }
    if (header_line.empty()) {
        throw FormatError("Resistance table is empty");
    }

    const char delim = detect_delimiter(header_line);
    const auto raw_columns = table_io::split_row(header_line, delim);
    const auto columns = table_io::disambiguate_columns(raw_columns);

    // The threshold column must be unique in the raw header
    const auto n_resistance = std::count(raw_columns.begin(), raw_columns.end(),
                                         config.resistance_column);
    if (n_resistance > 1) {
        throw FormatError("Resistance table must have exactly one '" +
                          config.resistance_column + "' column");
    }

    const Index code_col = find_column(columns, config.code_column, true);
    const Index resis_col = find_column(columns, config.resistance_column, true);
    const Index n_col = config.roughness_column.empty()
                            ? -1
                            : find_column(columns, config.roughness_column, false);

    ResistanceTable table;
    Index row = 1;
    while (std::getline(in, line)) {
        ++row;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        const auto cells = table_io::split_row(line, delim);
        const auto cell = [&](Index c) -> std::string {
            return c < static_cast<Index>(cells.size()) ? cells[static_cast<Size>(c)]
                                                        : std::string();
        };

        // Rows without a code belong to the other code column only
        const std::string code_cell = cell(code_col);
        if (code_cell.empty()) continue;

        const Real code_value = parse_cell(code_cell, config.code_column, row);
        if (code_value != std::floor(code_value)) {
            throw FormatError("Resistance table row " + std::to_string(row) +
                              ": vegetation code '" + code_cell + "' is not an integer");
        }
        const Real threshold = parse_cell(cell(resis_col), config.resistance_column, row);

        std::optional<Real> roughness;
        if (n_col >= 0 && !cell(n_col).empty()) {
            roughness = parse_cell(cell(n_col), config.roughness_column, row);
        }
        table.set(static_cast<int>(code_value), threshold, roughness);
    }
    return table;
}

ResistanceTable ResistanceTable::from_csv(const std::filesystem::path& filepath,
                                          const TableConfig& config) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open resistance table: " + filepath.string());
    }
    try {
        return parse_csv(file, config);
    } catch (const FormatError& e) {
        throw FormatError(filepath.string() + ": " + e.what());
    }
}

} // namespace ripsim
