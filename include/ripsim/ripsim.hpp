/**
 * @file ripsim.hpp
 * @brief Main ripsim model class
 *
 * Couples hydraulic shear stress output with vegetation succession:
 * - Resolves raster, table and mesh inputs (in memory or on disk)
 * - Regrids scattered mesh shear stress onto the vegetation raster
 * - Runs one succession step
 * - Converts the result to a roughness map for the next hydraulic run
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/grid.hpp"
#include "core/config.hpp"

// Coupling includes
#include "coupling/mesh_sample.hpp"
#include "coupling/triangulation.hpp"
#include "coupling/regridder.hpp"

// Succession includes
#include "succession/resistance_table.hpp"
#include "succession/succession.hpp"

#include <filesystem>
#include <variant>

namespace ripsim {

// ============================================================================
// Input Sources
// ============================================================================

/// A raster given either in memory or as a path to an ESRI ASCII file
using GridSource = std::variant<Grid, std::filesystem::path>;

/// A resistance table given either in memory or as a path to a delimited file
using TableSource = std::variant<ResistanceTable, std::filesystem::path>;

/// Mesh samples given either in memory or as a path to NetCDF / column text
using MeshSource = std::variant<MeshSample, std::filesystem::path>;

/**
 * @brief One-step vegetation succession driven by hydraulic model output
 *
 * Example usage:
 * @code
 * SuccessionModel model(Config::from_file("ripsim.cfg"));
 * Grid veg = model.run(std::filesystem::path("vegclass.asc"),
 *                      std::filesystem::path("zonemap.asc"),
 *                      std::filesystem::path("dflow_map.nc"),
 *                      std::filesystem::path("landscape.csv"));
 * grid_io::write_asc(veg, "veg-out.asc");
 * @endcode
 */
class SuccessionModel {
public:
    SuccessionModel() = default;
    explicit SuccessionModel(const Config& config);

    // ========================================================================
    // Source Resolution
    // ========================================================================

    /**
     * @brief Materialize a raster source
     *
     * @throws InputTypeError if the path is empty
     */
    Grid resolve(const GridSource& source) const;

    /// Materialize a table source using the configured column names
    ResistanceTable resolve(const TableSource& source) const;

    /// Materialize a mesh source using the configured variable names
    MeshSample resolve(const MeshSource& source) const;

    // ========================================================================
    // Pipeline
    // ========================================================================

    /**
     * @brief Regrid mesh shear stress onto a target grid
     *
     * An all-NODATA grid is returned (and logged) when the mesh does not
     * triangulate.
     */
    Grid shear_grid(const MeshSample& mesh, const GridHeader& target) const;

    /**
     * @brief Succession step with shear stress already on the grid
     */
    Grid run_with_shear(const GridSource& vegetation, const GridSource& zone,
                        const GridSource& shear, const TableSource& table) const;

    /**
     * @brief Full coupling step from hydraulic mesh output
     *
     * The vegetation grid's header defines the interpolation target.
     */
    Grid run(const GridSource& vegetation, const GridSource& zone,
             const MeshSource& shear_mesh, const TableSource& table) const;

    /// Roughness map of a vegetation grid
    Grid roughness(const GridSource& vegetation, const TableSource& table) const;

    const Config& config() const { return config_; }
    void set_config(const Config& config);

private:
    Config config_;
    SuccessionEngine engine_;

    void log(const std::string& message) const;
};

} // namespace ripsim
