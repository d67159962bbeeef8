/**
 * @file config.hpp
 * @brief Run configuration for ripsim
 *
 * Defines the runtime configuration including:
 * - Default input rasters and resistance table
 * - Variable names in the hydraulic mesh output
 * - Column names in the resistance table
 * - Output and execution options
 */

#pragma once

#include "types.hpp"
#include <string>
#include <filesystem>
#include <iosfwd>

namespace ripsim {

/**
 * @brief Input locations used when the caller does not pass them
 */
struct InputConfig {
    std::filesystem::path vegetation_map = "data/vegclass_2z.asc";
    std::filesystem::path zone_map = "data/zonemap_2z.asc";
    std::filesystem::path resistance_table = "data/casimir-data-requirements.csv";
};

/**
 * @brief Variable names in the hydraulic model's mesh output
 *
 * Defaults follow D-Flow FM map files.
 */
struct MeshConfig {
    std::string x_variable = "FlowElem_xcc";    ///< Element center x
    std::string y_variable = "FlowElem_ycc";    ///< Element center y
    std::string field_variable = "taus";        ///< Bed shear stress [N/m²], (time, element)
};

/**
 * @brief Column names in the resistance table
 *
 * The landscape tables carry two "Code" columns; the second one
 * (disambiguated to "Code.1") holds the vegetation class codes.
 */
struct TableConfig {
    std::string code_column = "Code.1";
    std::string resistance_column = "shear_resis";
    std::string roughness_column = "n_val";     ///< Optional in the table
};

/**
 * @brief Output configuration
 */
struct OutputConfig {
    std::filesystem::path roughness_file;       ///< Empty = no roughness map
};

/**
 * @brief Execution options
 */
struct RunConfig {
    bool verbose = false;           ///< Stage progress on stderr
    int num_threads = 0;            ///< 0 = OpenMP default
};

/**
 * @brief Complete configuration
 */
class Config {
public:
    Config() = default;

    // Load from key/value file
    static Config from_file(const std::filesystem::path& filepath);

    // Load from stream
    static Config parse(std::istream& in);

    // Validate configuration
    bool validate() const;

    // Sub-configurations
    InputConfig inputs;
    MeshConfig mesh;
    TableConfig table;
    OutputConfig output;
    RunConfig run;

    // Print summary
    void print_summary(std::ostream& os) const;
};

namespace config_io {

/// Parse "true"/"false"/"yes"/"no"/"1"/"0"
bool bool_from_string(const std::string& s);

} // namespace config_io

} // namespace ripsim
