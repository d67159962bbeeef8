/**
 * @file resistance_table.hpp
 * @brief Vegetation class → shear resistance / roughness lookup
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>

namespace ripsim {

/**
 * @brief Landscape lookup table for succession
 *
 * Maps each vegetation class code to the bed shear stress [N/m²] above
 * which the vegetation is destroyed, and optionally to a Manning
 * roughness n used by the next hydraulic run.
 */
class ResistanceTable {
public:
    ResistanceTable() = default;

    /// Table from code → threshold pairs (no roughness)
    explicit ResistanceTable(const std::map<int, Real>& thresholds);

    /**
     * @brief Add or replace an entry
     */
    void set(int code, Real threshold, std::optional<Real> roughness = std::nullopt);

    bool contains(int code) const { return thresholds_.count(code) > 0; }
    bool has_roughness(int code) const { return roughness_.count(code) > 0; }

    /**
     * @brief Shear resistance threshold of a class
     *
     * @throws std::out_of_range if the code is unknown
     */
    Real threshold(int code) const;

    /**
     * @brief Manning n of a class
     *
     * @throws std::out_of_range if the code has no roughness
     */
    Real roughness(int code) const;

    /// Sorted vegetation codes
    std::vector<int> codes() const;

    Index size() const { return static_cast<Index>(thresholds_.size()); }
    bool empty() const { return thresholds_.empty(); }

    const std::map<int, Real>& thresholds() const { return thresholds_; }

    /**
     * @brief Parse a delimited table with a header row
     *
     * Comma, semicolon or tab separated. Duplicate column names are
     * renamed in order of appearance ("Code", "Code" → "Code", "Code.1").
     *
     * @throws FormatError on missing columns or unparsable numbers
     */
    static ResistanceTable parse_csv(std::istream& in, const TableConfig& config);

    /// Read a delimited table from disk
    static ResistanceTable from_csv(const std::filesystem::path& filepath,
                                    const TableConfig& config);

private:
    std::map<int, Real> thresholds_;
    std::map<int, Real> roughness_;
};

namespace table_io {

/// Split one delimited line, honoring double quotes
std::vector<std::string> split_row(const std::string& line, char delimiter);

/// Rename duplicate names to name.1, name.2, ...
std::vector<std::string> disambiguate_columns(const std::vector<std::string>& names);

} // namespace table_io

} // namespace ripsim
