/**
 * @file regridder.cpp
 * @brief Mesh-to-grid linear interpolation
 */

#include "ripsim/coupling/regridder.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ripsim {

namespace {

std::vector<Vec2> validated_points(const MeshSample& sample) {
    sample.validate();
    return sample.points();
}

} // namespace

Vector Regridder::target_x(const GridHeader& header) {
    Vector x(header.ncols);
    for (Index j = 0; j < header.ncols; ++j) {
        x(j) = header.xllcorner + j * header.cellsize;
    }
    return x;
}

Vector Regridder::target_y(const GridHeader& header) {
    Vector y(header.nrows);
    for (Index k = 0; k < header.nrows; ++k) {
        y(k) = header.yllcorner + k * header.cellsize;
    }
    return y;
}

Regridder::Regridder(const GridHeader& target, const std::vector<Vec2>& mesh_points)
    : target_(target),
      n_points_(static_cast<Index>(mesh_points.size())),
      triangulation_(mesh_points) {
    if (target_.ncols <= 0 || target_.nrows <= 0 ||
        target_.ncols > constants::MAX_GRID_DIMENSION ||
        target_.nrows > constants::MAX_GRID_DIMENSION) {
        throw std::invalid_argument("Regridder target must have positive ncols and nrows "
                                    "no larger than " +
                                    std::to_string(constants::MAX_GRID_DIMENSION));
    }

    const Index ncols = target_.ncols;
    const Index n = target_.size();
    const Vector xs = target_x(target_);
    const Vector ys = target_y(target_);

    // Locate every target sample; each iteration writes its own slot
    std::vector<DelaunayTriangulation::Location> locations(static_cast<Size>(n));
    #pragma omp parallel for
    for (Index i = 0; i < n; ++i) {
        const Index k = i / ncols;
        const Index j = i % ncols;
        locations[i] = triangulation_.locate(Vec2(xs(j), ys(k)));
    }

    std::vector<SparseTriplet> triplets;
    triplets.reserve(static_cast<Size>(3 * n));
    covered_.assign(static_cast<Size>(n), false);
    n_covered_ = 0;
    for (Index i = 0; i < n; ++i) {
        const auto& loc = locations[i];
        if (!loc.found()) continue;
        covered_[i] = true;
        ++n_covered_;
        const auto& tri = triangulation_.triangle(loc.triangle);
        for (int v = 0; v < 3; ++v) {
            // Zero weights are dropped so a NaN at an unused vertex cannot leak in
            if (loc.weights[v] != 0.0) {
                triplets.emplace_back(i, tri[v], loc.weights[v]);
            }
        }
    }

    weights_.resize(n, n_points_);
    weights_.setFromTriplets(triplets.begin(), triplets.end());
}

Regridder::Regridder(const GridHeader& target, const MeshSample& sample)
    : Regridder(target, validated_points(sample)) {}

Vector Regridder::interpolate(const Vector& values) const {
    if (values.size() != n_points_) {
        throw std::invalid_argument("Regridder expects " + std::to_string(n_points_) +
                                    " values, got " + std::to_string(values.size()));
    }

    // Target order: row k holds samples at y_k, k = 0 at yllcorner
    Vector raw = weights_ * values;
    for (Index i = 0; i < raw.size(); ++i) {
        if (!covered_[i]) raw(i) = std::numeric_limits<Real>::quiet_NaN();
    }

    Matrix south_up = Eigen::Map<const RowMatrix>(raw.data(), target_.nrows, target_.ncols);
    const RowMatrix north_up = flip_rows(south_up);
    return Eigen::Map<const Vector>(north_up.data(), north_up.size());
}

Grid Regridder::regrid(const Vector& values) const {
    Vector data = interpolate(values);
    for (Index i = 0; i < data.size(); ++i) {
        if (std::isnan(data(i))) data(i) = target_.nodata_value;
    }
    return Grid(target_, std::move(data));
}

} // namespace ripsim
