/**
 * @file triangulation.hpp
 * @brief 2D Delaunay triangulation with point location
 *
 * Incremental Bowyer-Watson construction over the scattered mesh
 * element centers. Linear interpolation in the Regridder uses the
 * barycentric weights returned by locate().
 */

#pragma once

#include "../core/types.hpp"

namespace ripsim {

/**
 * @brief Delaunay triangulation of a planar point set
 *
 * Duplicate points are inserted once (first occurrence wins). With fewer
 * than three non-collinear points the triangulation is empty and
 * is_degenerate() returns true.
 */
class DelaunayTriangulation {
public:
    using TriangleVertices = std::array<Index, 3>;

    /**
     * @brief Result of point location
     */
    struct Location {
        Index triangle = -1;                ///< Containing triangle (-1 if outside hull)
        std::array<Real, 3> weights{};      ///< Barycentric weights of its vertices

        bool found() const { return triangle >= 0; }
    };

    DelaunayTriangulation() = default;

    /**
     * @brief Triangulate the given points
     *
     * Vertex indices in the result refer to positions in @p points.
     */
    explicit DelaunayTriangulation(const std::vector<Vec2>& points);

    Index n_points() const { return static_cast<Index>(points_.size()); }
    Index n_triangles() const { return static_cast<Index>(triangles_.size()); }
    Index n_duplicates() const { return n_duplicates_; }

    /// Counter-clockwise vertex indices of triangle t
    const TriangleVertices& triangle(Index t) const { return triangles_[t]; }

    /// No triangles (fewer than three non-collinear points)
    bool is_degenerate() const { return triangles_.empty(); }

    /**
     * @brief Find the triangle containing p
     *
     * Points on an edge or vertex (within a relative tolerance) count as
     * inside. Points outside the convex hull return a Location with
     * triangle == -1.
     */
    Location locate(const Vec2& p) const;

private:
    std::vector<Vec2> points_;
    std::vector<TriangleVertices> triangles_;
    Index n_duplicates_ = 0;

    // Coordinates are normalized to [-0.5, 0.5] about the bounding box
    // center before any predicate is evaluated
    Vec2 center_ = Vec2::Zero();
    Real scale_ = 1.0;
    std::vector<Vec2> normalized_;

    // Uniform bins over triangle bounding boxes (CSR layout)
    Vec2 bin_min_ = Vec2::Zero();
    Vec2 bin_max_ = Vec2::Zero();
    Index n_bins_x_ = 0;
    Index n_bins_y_ = 0;
    Real bin_dx_ = 1.0;
    Real bin_dy_ = 1.0;
    std::vector<Index> bin_start_;
    std::vector<Index> bin_items_;

    void build();
    void build_index();
    Vec2 normalize(const Vec2& p) const { return (p - center_) / scale_; }
    Index bin_x(Real x) const;
    Index bin_y(Real y) const;
};

} // namespace ripsim
