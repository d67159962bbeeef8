#include <catch2/catch.hpp>
#include "ripsim/coupling/triangulation.hpp"

#include <cmath>
#include <random>

using namespace ripsim;
using Catch::Detail::Approx;

namespace {

Real signed_area(const Vec2& a, const Vec2& b, const Vec2& c) {
    return 0.5 * ((b.x() - a.x()) * (c.y() - a.y()) - (b.y() - a.y()) * (c.x() - a.x()));
}

std::vector<Vec2> lattice(int n) {
    std::vector<Vec2> pts;
    for (int j = 0; j < n; ++j) {
        for (int i = 0; i < n; ++i) {
            pts.emplace_back(Real(i), Real(j));
        }
    }
    return pts;
}

} // namespace

TEST_CASE("Triangulation of a square", "[triangulation]") {
    std::vector<Vec2> pts = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    DelaunayTriangulation tri(pts);

    REQUIRE_FALSE(tri.is_degenerate());
    REQUIRE(tri.n_points() == 4);
    REQUIRE(tri.n_triangles() == 2);

    for (Index t = 0; t < tri.n_triangles(); ++t) {
        const auto& T = tri.triangle(t);
        REQUIRE(signed_area(pts[T[0]], pts[T[1]], pts[T[2]]) > 0.0);
    }
}

TEST_CASE("Triangulation covers the convex hull of a lattice", "[triangulation]") {
    auto pts = lattice(5);
    DelaunayTriangulation tri(pts);

    // 2n - 2 - h triangles for n points with h on the hull
    REQUIRE(tri.n_triangles() == 32);

    Real area = 0.0;
    for (Index t = 0; t < tri.n_triangles(); ++t) {
        const auto& T = tri.triangle(t);
        area += signed_area(pts[T[0]], pts[T[1]], pts[T[2]]);
    }
    REQUIRE(area == Approx(16.0));
}

TEST_CASE("Triangulation is Delaunay", "[triangulation]") {
    std::mt19937 rng(42);
    std::uniform_real_distribution<Real> dist(0.0, 100.0);
    std::vector<Vec2> pts;
    for (int i = 0; i < 300; ++i) {
        pts.emplace_back(dist(rng), dist(rng));
    }
    DelaunayTriangulation tri(pts);
    REQUIRE(tri.n_triangles() > 0);

    for (Index t = 0; t < tri.n_triangles(); ++t) {
        const auto& T = tri.triangle(t);
        const Vec2& a = pts[T[0]];
        const Vec2& b = pts[T[1]];
        const Vec2& c = pts[T[2]];

        // Circumcenter
        const Real d = 2.0 * (a.x() * (b.y() - c.y()) + b.x() * (c.y() - a.y()) +
                              c.x() * (a.y() - b.y()));
        const Real ux = (a.squaredNorm() * (b.y() - c.y()) + b.squaredNorm() * (c.y() - a.y()) +
                         c.squaredNorm() * (a.y() - b.y())) / d;
        const Real uy = (a.squaredNorm() * (c.x() - b.x()) + b.squaredNorm() * (a.x() - c.x()) +
                         c.squaredNorm() * (b.x() - a.x())) / d;
        const Vec2 center(ux, uy);
        const Real r2 = (a - center).squaredNorm();

        for (Index k = 0; k < static_cast<Index>(pts.size()); ++k) {
            if (k == T[0] || k == T[1] || k == T[2]) continue;
            REQUIRE((pts[k] - center).squaredNorm() >= r2 * (1.0 - 1e-9));
        }
    }
}

TEST_CASE("Triangulation point location", "[triangulation]") {
    auto pts = lattice(4);
    DelaunayTriangulation tri(pts);

    SECTION("interior point") {
        const Vec2 p(1.3, 2.6);
        auto loc = tri.locate(p);
        REQUIRE(loc.found());

        const auto& T = tri.triangle(loc.triangle);
        Vec2 back = Vec2::Zero();
        Real sum = 0.0;
        for (int k = 0; k < 3; ++k) {
            REQUIRE(loc.weights[k] >= -1e-12);
            back += loc.weights[k] * pts[T[k]];
            sum += loc.weights[k];
        }
        REQUIRE(sum == Approx(1.0));
        REQUIRE(back.x() == Approx(1.3));
        REQUIRE(back.y() == Approx(2.6));
    }

    SECTION("vertex and hull edge count as inside") {
        REQUIRE(tri.locate(Vec2(2.0, 1.0)).found());
        REQUIRE(tri.locate(Vec2(0.0, 0.0)).found());
        REQUIRE(tri.locate(Vec2(3.0, 1.5)).found());
    }

    SECTION("outside the hull") {
        REQUIRE_FALSE(tri.locate(Vec2(-0.5, 1.0)).found());
        REQUIRE_FALSE(tri.locate(Vec2(1.0, 3.5)).found());
    }
}

TEST_CASE("Triangulation degenerate input", "[triangulation]") {
    SECTION("fewer than three points") {
        DelaunayTriangulation tri({Vec2(0, 0), Vec2(1, 1)});
        REQUIRE(tri.is_degenerate());
        REQUIRE_FALSE(tri.locate(Vec2(0.5, 0.5)).found());
    }

    SECTION("collinear points") {
        DelaunayTriangulation tri({Vec2(0, 0), Vec2(1, 1), Vec2(2, 2), Vec2(3, 3)});
        REQUIRE(tri.is_degenerate());
    }

    SECTION("empty") {
        DelaunayTriangulation tri(std::vector<Vec2>{});
        REQUIRE(tri.is_degenerate());
        REQUIRE(tri.n_points() == 0);
    }
}

TEST_CASE("Triangulation skips duplicate points", "[triangulation]") {
    std::vector<Vec2> pts = {{0, 0}, {1, 0}, {0, 1}, {1, 0}, {1, 1}};
    DelaunayTriangulation tri(pts);

    REQUIRE(tri.n_duplicates() == 1);
    REQUIRE(tri.n_triangles() == 2);
}
