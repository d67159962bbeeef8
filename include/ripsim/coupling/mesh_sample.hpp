/**
 * @file mesh_sample.hpp
 * @brief Scattered hydraulic mesh samples and their readers
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include <filesystem>
#include <iosfwd>

namespace ripsim {

/**
 * @brief Scalar field sampled at unstructured mesh element centers
 *
 * Holds the most recent time slice only. Transient: built by a reader,
 * consumed by the Regridder.
 */
struct MeshSample {
    Vector x;                       ///< Element center x
    Vector y;                       ///< Element center y
    Vector values;                  ///< Field value at each center

    /// Number of sample points
    Index size() const { return x.size(); }

    /// Point i as a 2D coordinate
    Vec2 point(Index i) const { return Vec2(x(i), y(i)); }

    /// All points as 2D coordinates
    std::vector<Vec2> points() const;

    /**
     * @brief Check that x, y and values have equal length
     *
     * @throws FormatError on mismatch
     */
    void validate() const;

    /**
     * @brief Build a sample from a time series, keeping the last time step
     *
     * @param x Element center x
     * @param y Element center y
     * @param series Field values, one row per time step, one column per element
     */
    static MeshSample from_time_series(const Vector& x, const Vector& y,
                                       const Matrix& series);
};

// ============================================================================
// Mesh I/O
// ============================================================================

namespace mesh_io {

/// True if this build can read NetCDF mesh output
bool has_netcdf();

/**
 * @brief Load mesh samples from a NetCDF map file
 *
 * Reads the element center coordinates and the last time index of the
 * (time, element) field named in the config.
 *
 * @throws std::runtime_error if built without NetCDF or on NetCDF errors
 */
MeshSample load_netcdf(const std::filesystem::path& filepath, const MeshConfig& config);

/**
 * @brief Parse whitespace/comma separated columns "x y v0 [v1 ...]"
 *
 * Each extra value column is a later time step; the last one is kept.
 * Lines starting with '#' and a non-numeric first line are skipped.
 */
MeshSample parse_columns(std::istream& in);

/// Load column text mesh samples from disk
MeshSample load_columns(const std::filesystem::path& filepath);

/// Dispatch on extension: .nc → NetCDF, anything else → columns
MeshSample load(const std::filesystem::path& filepath, const MeshConfig& config);

} // namespace mesh_io

} // namespace ripsim
