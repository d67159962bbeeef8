/**
 * @file triangulation.cpp
 * @brief Bowyer-Watson Delaunay triangulation
 */

#include "ripsim/coupling/triangulation.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace ripsim {

namespace {

using Wide = long double;

/// Twice the signed area of (a, b, c); positive if counter-clockwise
Wide orient(const Vec2& a, const Vec2& b, const Vec2& c) {
    const Wide abx = Wide(b.x()) - a.x(), aby = Wide(b.y()) - a.y();
    const Wide acx = Wide(c.x()) - a.x(), acy = Wide(c.y()) - a.y();
    return abx * acy - aby * acx;
}

/// Positive if d lies inside the circumcircle of counter-clockwise (a, b, c)
Wide in_circle(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d) {
    const Wide adx = Wide(a.x()) - d.x(), ady = Wide(a.y()) - d.y();
    const Wide bdx = Wide(b.x()) - d.x(), bdy = Wide(b.y()) - d.y();
    const Wide cdx = Wide(c.x()) - d.x(), cdy = Wide(c.y()) - d.y();
    const Wide ad = adx * adx + ady * ady;
    const Wide bd = bdx * bdx + bdy * bdy;
    const Wide cd = cdx * cdx + cdy * cdy;
    return adx * (bdy * cd - bd * cdy)
         - ady * (bdx * cd - bd * cdx)
         + ad * (bdx * cdy - bdy * cdx);
}

/// Working triangle during construction
struct Tri {
    std::array<Index, 3> v;     ///< Counter-clockwise vertices
    std::array<Index, 3> nbr;   ///< nbr[k] is across the edge opposite v[k]
    bool alive;
};

/// Super triangle half-size relative to the normalized point extent
constexpr Real SUPER_SIZE = 1000.0;

/// Squared distance under which two normalized points are the same point
constexpr Real DUPLICATE_TOL2 = 1e-24;

} // namespace

// ============================================================================
// Construction
// ============================================================================

DelaunayTriangulation::DelaunayTriangulation(const std::vector<Vec2>& points)
    : points_(points) {
    build();
    build_index();
}

void DelaunayTriangulation::build() {
    const Index n = n_points();
    if (n < 3) return;

    // Normalize to the bounding box
    Vec2 lo(std::numeric_limits<Real>::max(), std::numeric_limits<Real>::max());
    Vec2 hi(std::numeric_limits<Real>::lowest(), std::numeric_limits<Real>::lowest());
    for (const auto& p : points_) {
        lo = lo.cwiseMin(p);
        hi = hi.cwiseMax(p);
    }
    center_ = 0.5 * (lo + hi);
    scale_ = std::max(hi.x() - lo.x(), hi.y() - lo.y());
    if (!(scale_ > 0.0) || !std::isfinite(scale_)) scale_ = 1.0;

    normalized_.resize(static_cast<Size>(n) + 3);
    for (Index i = 0; i < n; ++i) {
        normalized_[i] = normalize(points_[i]);
    }
    normalized_[n]     = Vec2(-3.0 * SUPER_SIZE, -SUPER_SIZE);
    normalized_[n + 1] = Vec2( 3.0 * SUPER_SIZE, -SUPER_SIZE);
    normalized_[n + 2] = Vec2( 0.0,               3.0 * SUPER_SIZE);
    const auto& q = normalized_;

    // Insert in spatially coherent order so each walk starts nearby
    const Index side = std::max<Index>(1, static_cast<Index>(std::sqrt(Real(n) / 4.0)));
    std::vector<Index> order(static_cast<Size>(n));
    std::iota(order.begin(), order.end(), Index(0));
    auto cell_of = [&](Index i) {
        Index cx = std::min(side - 1, static_cast<Index>((q[i].x() + 0.5) * side));
        Index cy = std::min(side - 1, static_cast<Index>((q[i].y() + 0.5) * side));
        cx = std::max<Index>(0, cx);
        cy = std::max<Index>(0, cy);
        // Snake through rows
        return cy * side + ((cy % 2 == 0) ? cx : side - 1 - cx);
    };
    std::stable_sort(order.begin(), order.end(),
                     [&](Index a, Index b) { return cell_of(a) < cell_of(b); });

    std::vector<Tri> tris;
    tris.reserve(static_cast<Size>(6 * n + 16));
    tris.push_back({{n, n + 1, n + 2}, {-1, -1, -1}, true});

    std::vector<Index> mark(1, -1);
    std::vector<Index> stack;
    std::vector<Index> cavity;
    std::vector<Index> created;
    Index last = 0;

    for (Index step = 0; step < n; ++step) {
        const Index pi = order[step];
        const Vec2& p = q[pi];

        // Visibility walk to the triangle containing p
        Index t = last;
        const Index max_steps = static_cast<Index>(tris.size()) + 16;
        Index walked = 0;
        for (; walked < max_steps; ++walked) {
            const Tri& T = tris[t];
            Index next = -1;
            for (int j = 0; j < 3; ++j) {
                const int k = static_cast<int>((j + walked) % 3);
                const Index a = T.v[(k + 1) % 3];
                const Index b = T.v[(k + 2) % 3];
                if (orient(q[a], q[b], p) < 0) {
                    next = T.nbr[k];
                    break;
                }
            }
            if (next < 0) break;
            t = next;
        }
        if (walked == max_steps) {
            // Numerical trouble; fall back to a scan
            t = -1;
            for (Index u = 0; u < static_cast<Index>(tris.size()); ++u) {
                if (!tris[u].alive) continue;
                const auto& v = tris[u].v;
                if (orient(q[v[0]], q[v[1]], p) >= 0 &&
                    orient(q[v[1]], q[v[2]], p) >= 0 &&
                    orient(q[v[2]], q[v[0]], p) >= 0) {
                    t = u;
                    break;
                }
            }
            if (t < 0) continue;
        }

        // Skip duplicates of an existing vertex
        bool duplicate = false;
        for (Index v : tris[t].v) {
            if ((q[v] - p).squaredNorm() <= DUPLICATE_TOL2) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            ++n_duplicates_;
            continue;
        }

        // Cavity: every triangle whose circumcircle contains p
        cavity.clear();
        stack.clear();
        stack.push_back(t);
        mark[t] = step;
        while (!stack.empty()) {
            const Index u = stack.back();
            stack.pop_back();
            cavity.push_back(u);
            for (Index nb : tris[u].nbr) {
                if (nb < 0 || mark[nb] == step) continue;
                const auto& v = tris[nb].v;
                if (in_circle(q[v[0]], q[v[1]], q[v[2]], p) > 0) {
                    mark[nb] = step;
                    stack.push_back(nb);
                }
            }
        }

        // Fan the cavity boundary to p
        created.clear();
        for (Index u : cavity) {
            for (int k = 0; k < 3; ++k) {
                const Index outside = tris[u].nbr[k];
                if (outside >= 0 && mark[outside] == step) continue;

                const Index a = tris[u].v[(k + 1) % 3];
                const Index b = tris[u].v[(k + 2) % 3];
                const Index id = static_cast<Index>(tris.size());
                tris.push_back({{a, b, pi}, {-1, -1, outside}, true});
                mark.push_back(-1);
                created.push_back(id);

                if (outside >= 0) {
                    for (auto& back : tris[outside].nbr) {
                        if (back == u) {
                            back = id;
                            break;
                        }
                    }
                }
            }
        }
        for (Index u : cavity) {
            tris[u].alive = false;
        }

        // Link the fan: edges (b, p) and (p, a)
        for (Index id : created) {
            Tri& T = tris[id];
            for (Index other : created) {
                if (other == id) continue;
                const Tri& O = tris[other];
                if (O.v[0] == T.v[1]) T.nbr[0] = other;
                if (O.v[1] == T.v[0]) T.nbr[1] = other;
            }
        }
        last = created.empty() ? last : created.back();
    }

    // Keep triangles made only of input points
    for (const auto& T : tris) {
        if (!T.alive) continue;
        if (T.v[0] >= n || T.v[1] >= n || T.v[2] >= n) continue;
        if (orient(q[T.v[0]], q[T.v[1]], q[T.v[2]]) <= 0) continue;
        triangles_.push_back({T.v[0], T.v[1], T.v[2]});
    }
}

// ============================================================================
// Point location
// ============================================================================

Index DelaunayTriangulation::bin_x(Real x) const {
    Index b = static_cast<Index>(std::floor((x - bin_min_.x()) / bin_dx_));
    return std::clamp<Index>(b, 0, n_bins_x_ - 1);
}

Index DelaunayTriangulation::bin_y(Real y) const {
    Index b = static_cast<Index>(std::floor((y - bin_min_.y()) / bin_dy_));
    return std::clamp<Index>(b, 0, n_bins_y_ - 1);
}

void DelaunayTriangulation::build_index() {
    if (triangles_.empty()) return;

    const auto& q = normalized_;
    bin_min_ = Vec2(std::numeric_limits<Real>::max(), std::numeric_limits<Real>::max());
    bin_max_ = Vec2(std::numeric_limits<Real>::lowest(), std::numeric_limits<Real>::lowest());
    for (const auto& T : triangles_) {
        for (Index v : T) {
            bin_min_ = bin_min_.cwiseMin(q[v]);
            bin_max_ = bin_max_.cwiseMax(q[v]);
        }
    }

    const Index side = std::max<Index>(1, static_cast<Index>(std::sqrt(Real(n_triangles()) / 2.0)));
    n_bins_x_ = side;
    n_bins_y_ = side;
    bin_dx_ = std::max((bin_max_.x() - bin_min_.x()) / side, constants::EPSILON);
    bin_dy_ = std::max((bin_max_.y() - bin_min_.y()) / side, constants::EPSILON);

    const Size n_bins = static_cast<Size>(n_bins_x_ * n_bins_y_);
    std::vector<Index> counts(n_bins, 0);
    auto for_each_bin = [&](const TriangleVertices& T, auto&& fn) {
        Vec2 lo = q[T[0]].cwiseMin(q[T[1]]).cwiseMin(q[T[2]]);
        Vec2 hi = q[T[0]].cwiseMax(q[T[1]]).cwiseMax(q[T[2]]);
        const Real pad = constants::EPSILON;
        for (Index by = bin_y(lo.y() - pad); by <= bin_y(hi.y() + pad); ++by) {
            for (Index bx = bin_x(lo.x() - pad); bx <= bin_x(hi.x() + pad); ++bx) {
                fn(static_cast<Size>(by * n_bins_x_ + bx));
            }
        }
    };

    for (const auto& T : triangles_) {
        for_each_bin(T, [&](Size b) { ++counts[b]; });
    }
    bin_start_.assign(n_bins + 1, 0);
    for (Size b = 0; b < n_bins; ++b) {
        bin_start_[b + 1] = bin_start_[b] + counts[b];
    }
    bin_items_.assign(static_cast<Size>(bin_start_[n_bins]), 0);
    std::vector<Index> fill(bin_start_.begin(), bin_start_.end() - 1);
    for (Index t = 0; t < n_triangles(); ++t) {
        for_each_bin(triangles_[t], [&](Size b) { bin_items_[fill[b]++] = t; });
    }
}

DelaunayTriangulation::Location DelaunayTriangulation::locate(const Vec2& point) const {
    Location loc;
    if (triangles_.empty()) return loc;

    const Vec2 p = normalize(point);
    const Real tol = constants::EPSILON;
    if (p.x() < bin_min_.x() - tol || p.x() > bin_max_.x() + tol ||
        p.y() < bin_min_.y() - tol || p.y() > bin_max_.y() + tol) {
        return loc;
    }

    const auto& q = normalized_;
    const Size b = static_cast<Size>(bin_y(p.y()) * n_bins_x_ + bin_x(p.x()));
    for (Index k = bin_start_[b]; k < bin_start_[b + 1]; ++k) {
        const Index t = bin_items_[static_cast<Size>(k)];
        const auto& T = triangles_[t];
        const Wide area = orient(q[T[0]], q[T[1]], q[T[2]]);
        const Real w0 = static_cast<Real>(orient(q[T[1]], q[T[2]], p) / area);
        const Real w1 = static_cast<Real>(orient(q[T[2]], q[T[0]], p) / area);
        const Real w2 = 1.0 - w0 - w1;
        if (w0 >= -tol && w1 >= -tol && w2 >= -tol) {
            loc.triangle = t;
            loc.weights = {w0, w1, w2};
            return loc;
        }
    }
    return loc;
}

} // namespace ripsim
