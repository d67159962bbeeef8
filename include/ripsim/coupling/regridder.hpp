/**
 * @file regridder.hpp
 * @brief Scattered mesh samples to regular grid interpolation
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"
#include "mesh_sample.hpp"
#include "triangulation.hpp"

namespace ripsim {

/**
 * @brief Linear interpolation from hydraulic mesh centers onto a raster
 *
 * The target grid samples x_j = xllcorner + j*cellsize and
 * y_k = yllcorner + k*cellsize. Interpolation is linear over the
 * Delaunay triangulation of the mesh points; targets outside the convex
 * hull have no value and end up as NODATA_value.
 *
 * The weights are assembled once as a sparse matrix [n_cells x n_points]
 * in target order (row k*ncols + j for sample (x_j, y_k), bottom row
 * first), so the same Regridder can be applied to any field sampled on
 * the same mesh.
 */
class Regridder {
public:
    /**
     * @brief Build interpolation weights
     *
     * @param target Header of the output grid
     * @param mesh_points Mesh element centers
     */
    Regridder(const GridHeader& target, const std::vector<Vec2>& mesh_points);

    /**
     * @brief Weights for the points of a mesh sample
     *
     * @throws FormatError if x, y and values differ in length
     */
    Regridder(const GridHeader& target, const MeshSample& sample);

    /**
     * @brief Interpolate a field onto the target grid
     *
     * @param values Field value at each mesh point
     * @return Grid with the target header; uncovered cells hold NODATA_value
     * @throws std::invalid_argument if values has the wrong length
     */
    Grid regrid(const Vector& values) const;

    /// Interpolate the values of a mesh sample
    Grid regrid(const MeshSample& sample) const { return regrid(sample.values); }

    /**
     * @brief Interpolated values before NODATA substitution
     *
     * Row-major, top row first; NaN where the target is outside the hull.
     */
    Vector interpolate(const Vector& values) const;

    /// Target grid header
    const GridHeader& target() const { return target_; }

    /// Interpolation weights [n_cells x n_points], target order
    const SparseMatrix& weights() const { return weights_; }

    /// Per target sample (target order): inside the mesh convex hull
    const std::vector<bool>& covered() const { return covered_; }

    /// Number of target samples inside the hull
    Index n_covered() const { return n_covered_; }

    /// Triangulation is empty; every output cell will be NODATA
    bool is_degenerate() const { return triangulation_.is_degenerate(); }

    const DelaunayTriangulation& triangulation() const { return triangulation_; }

    /**
     * @brief Sample coordinates of the target grid
     *
     * @return x_j for j < ncols
     */
    static Vector target_x(const GridHeader& header);

    /// y_k for k < nrows, bottom (yllcorner) first
    static Vector target_y(const GridHeader& header);

    /**
     * @brief Reverse row order of a target-ordered matrix
     *
     * Rows of the interpolated matrix run from y_0 (yllcorner) upwards;
     * reversing them matches the orientation of the vegetation and zone
     * rasters (row 0 = top).
     */
    static Matrix flip_rows(const Matrix& m) { return m.colwise().reverse(); }

private:
    GridHeader target_;
    Index n_points_ = 0;
    DelaunayTriangulation triangulation_;
    SparseMatrix weights_;
    std::vector<bool> covered_;
    Index n_covered_ = 0;
};

} // namespace ripsim
