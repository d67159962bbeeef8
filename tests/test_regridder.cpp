#include <catch2/catch.hpp>
#include "ripsim/coupling/regridder.hpp"

#include <cmath>

using namespace ripsim;
using Catch::Detail::Approx;

namespace {

GridHeader make_header(Index ncols, Index nrows, Real xll, Real yll, Real cellsize) {
    GridHeader h;
    h.ncols = ncols;
    h.nrows = nrows;
    h.xllcorner = xll;
    h.yllcorner = yll;
    h.cellsize = cellsize;
    h.nodata_value = -9999.0;
    return h;
}

/// Mesh points on an n x n lattice with unit spacing, field f(x, y)
template <typename F>
MeshSample lattice_sample(int n, F f) {
    MeshSample s;
    s.x.resize(n * n);
    s.y.resize(n * n);
    s.values.resize(n * n);
    for (int j = 0; j < n; ++j) {
        for (int i = 0; i < n; ++i) {
            const int k = j * n + i;
            s.x(k) = i;
            s.y(k) = j;
            s.values(k) = f(Real(i), Real(j));
        }
    }
    return s;
}

} // namespace

TEST_CASE("Regridder target sample coordinates", "[regridder]") {
    auto h = make_header(3, 2, 100.0, 50.0, 10.0);
    Vector xs = Regridder::target_x(h);
    Vector ys = Regridder::target_y(h);

    REQUIRE(xs.size() == 3);
    REQUIRE(xs(0) == 100.0);
    REQUIRE(xs(2) == 120.0);
    REQUIRE(ys.size() == 2);
    REQUIRE(ys(0) == 50.0);
    REQUIRE(ys(1) == 60.0);
}

TEST_CASE("Regridder flips rows", "[regridder]") {
    Matrix m(3, 2);
    m << 1, 2,
         3, 4,
         5, 6;
    Matrix f = Regridder::flip_rows(m);

    REQUIRE(f(0, 0) == 5.0);
    REQUIRE(f(0, 1) == 6.0);
    REQUIRE(f(1, 0) == 3.0);
    REQUIRE(f(2, 1) == 2.0);
}

TEST_CASE("Regridder reproduces a linear field", "[regridder]") {
    auto field = [](Real x, Real y) { return 2.0 * x + 3.0 * y + 1.0; };
    MeshSample mesh = lattice_sample(11, field);
    auto h = make_header(4, 3, 1.0, 2.0, 2.0);

    Regridder regridder(h, mesh);
    REQUIRE(regridder.n_covered() == h.size());

    Grid g = regridder.regrid(mesh);
    REQUIRE(g.header() == h);
    REQUIRE(g.count_nodata() == 0);

    // Output row r holds samples at y index nrows - 1 - r
    for (Index r = 0; r < h.nrows; ++r) {
        const Real y = h.yllcorner + (h.nrows - 1 - r) * h.cellsize;
        for (Index c = 0; c < h.ncols; ++c) {
            const Real x = h.xllcorner + c * h.cellsize;
            REQUIRE(g.at(r, c) == Approx(field(x, y)));
        }
    }
}

TEST_CASE("Regridder coincident samples after flip", "[regridder]") {
    // Mesh points exactly at the samples of a 3 x 2 target
    MeshSample mesh;
    mesh.x.resize(6);
    mesh.y.resize(6);
    mesh.values.resize(6);
    mesh.x << 0, 1, 2, 0, 1, 2;
    mesh.y << 0, 0, 0, 1, 1, 1;
    mesh.values << 10, 11, 12, 20, 21, 22;

    auto h = make_header(3, 2, 0.0, 0.0, 1.0);
    Grid g = Regridder(h, mesh).regrid(mesh);

    // Top row is y = 1
    REQUIRE(g.at(0, 0) == Approx(20.0));
    REQUIRE(g.at(0, 1) == Approx(21.0));
    REQUIRE(g.at(0, 2) == Approx(22.0));
    REQUIRE(g.at(1, 0) == Approx(10.0));
    REQUIRE(g.at(1, 2) == Approx(12.0));
}

TEST_CASE("Regridder leaves samples outside the hull as NODATA", "[regridder]") {
    MeshSample mesh = lattice_sample(11, [](Real x, Real) { return x; });

    // x samples 8, 10, 12; the last column is outside the hull
    auto h = make_header(3, 2, 8.0, 0.0, 2.0);
    Regridder regridder(h, mesh);
    Grid g = regridder.regrid(mesh);

    REQUIRE(regridder.n_covered() == 4);
    REQUIRE(g.count_nodata() == 2);
    REQUIRE(g.at(0, 2) == -9999.0);
    REQUIRE(g.at(1, 2) == -9999.0);
    REQUIRE(g.at(0, 1) == Approx(10.0));

    Vector raw = regridder.interpolate(mesh.values);
    REQUIRE(std::isnan(raw(2)));
    REQUIRE(std::isnan(raw(5)));
}

TEST_CASE("Regridder with degenerate mesh", "[regridder]") {
    auto h = make_header(3, 3, 0.0, 0.0, 1.0);

    SECTION("collinear points") {
        MeshSample mesh;
        mesh.x = Vector::LinSpaced(5, 0.0, 2.0);
        mesh.y = Vector::LinSpaced(5, 0.0, 2.0);
        mesh.values = Vector::Constant(5, 7.0);

        Regridder regridder(h, mesh);
        REQUIRE(regridder.is_degenerate());
        REQUIRE(regridder.regrid(mesh) == Grid::nodata(h));
    }

    SECTION("two points") {
        std::vector<Vec2> pts = {Vec2(0, 0), Vec2(2, 2)};
        Regridder regridder(h, pts);
        Vector values(2);
        values << 1.0, 2.0;
        REQUIRE(regridder.regrid(values).count_nodata() == h.size());
    }
}

TEST_CASE("Regridder rejects mismatched field length", "[regridder]") {
    MeshSample mesh = lattice_sample(3, [](Real, Real) { return 1.0; });
    Regridder regridder(make_header(2, 2, 0.0, 0.0, 1.0), mesh);

    REQUIRE_THROWS_AS(regridder.regrid(Vector::Zero(4)), std::invalid_argument);
}

TEST_CASE("Regridder rejects a mesh sample with mismatched lengths", "[regridder]") {
    MeshSample mesh;
    mesh.x = Vector::LinSpaced(4, 0.0, 3.0);
    mesh.y = Vector::Zero(2);
    mesh.values = Vector::Zero(4);

    REQUIRE_THROWS_AS(Regridder(make_header(2, 2, 0.0, 0.0, 1.0), mesh), FormatError);
}
