/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "ripsim/core/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace ripsim {

Config Config::from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath.string());
    }
    return parse(file);
}

Config Config::parse(std::istream& in) {
    Config config;

    // Simple sectioned key-value parser (no YAML library dependency)
    std::string line;
    std::string current_section;

    while (std::getline(in, line)) {
        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        // Trim whitespace
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string key = line.substr(0, colon_pos);
        std::string value = line.substr(colon_pos + 1);

        // Trim value
        auto val_start = value.find_first_not_of(" \t");
        if (val_start == std::string::npos) {
            // Section header
            auto key_end = key.find_last_not_of(" \t");
            current_section = key.substr(0, key_end + 1);
            continue;
        }
        value = value.substr(val_start);
        auto val_end = value.find_last_not_of(" \t\r\n");
        if (val_end != std::string::npos) {
            value = value.substr(0, val_end + 1);
        }
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        // Trim key
        auto key_end = key.find_last_not_of(" \t");
        if (key_end != std::string::npos) {
            key = key.substr(0, key_end + 1);
        }

        // Parse based on section
        if (current_section == "inputs") {
            if (key == "vegetation_map")
                config.inputs.vegetation_map = value;
            else if (key == "zone_map")
                config.inputs.zone_map = value;
            else if (key == "resistance_table")
                config.inputs.resistance_table = value;
        } else if (current_section == "mesh") {
            if (key == "x_variable")
                config.mesh.x_variable = value;
            else if (key == "y_variable")
                config.mesh.y_variable = value;
            else if (key == "field_variable")
                config.mesh.field_variable = value;
        } else if (current_section == "table") {
            if (key == "code_column")
                config.table.code_column = value;
            else if (key == "resistance_column")
                config.table.resistance_column = value;
            else if (key == "roughness_column")
                config.table.roughness_column = value;
        } else if (current_section == "output") {
            if (key == "roughness_file")
                config.output.roughness_file = value;
        } else if (current_section == "run") {
            if (key == "verbose")
                config.run.verbose = config_io::bool_from_string(value);
            else if (key == "num_threads")
                config.run.num_threads = std::stoi(value);
        }
    }

    config.validate();
    return config;
}

bool Config::validate() const {
    if (mesh.x_variable.empty() || mesh.y_variable.empty() ||
        mesh.field_variable.empty()) {
        throw std::invalid_argument("mesh variable names must not be empty");
    }
    if (table.code_column.empty() || table.resistance_column.empty()) {
        throw std::invalid_argument("table code_column and resistance_column must not be empty");
    }
    if (run.num_threads < 0) {
        throw std::invalid_argument("num_threads must be >= 0");
    }
    return true;
}

void Config::print_summary(std::ostream& os) const {
    os << "=== ripsim Configuration ===\n";
    os << "Inputs:\n";
    os << "  Vegetation map:   " << inputs.vegetation_map.string() << "\n";
    os << "  Zone map:         " << inputs.zone_map.string() << "\n";
    os << "  Resistance table: " << inputs.resistance_table.string() << "\n";
    os << "Mesh variables:\n";
    os << "  x: " << mesh.x_variable << ", y: " << mesh.y_variable
       << ", field: " << mesh.field_variable << "\n";
    os << "Table columns:\n";
    os << "  code: " << table.code_column
       << ", resistance: " << table.resistance_column
       << ", roughness: " << table.roughness_column << "\n";
    if (!output.roughness_file.empty()) {
        os << "Roughness map: " << output.roughness_file.string() << "\n";
    }
    os << "Threads: " << (run.num_threads == 0 ? std::string("default")
                                               : std::to_string(run.num_threads)) << "\n";
    os << "============================\n";
}

namespace config_io {

bool bool_from_string(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
    throw std::invalid_argument("Unknown boolean value: " + s);
}

} // namespace config_io

} // namespace ripsim
