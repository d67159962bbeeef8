#include <catch2/catch.hpp>
#include "ripsim/succession/succession.hpp"

#include <cmath>
#include <limits>

using namespace ripsim;

namespace {

Grid row_grid(std::initializer_list<Real> values, Real nodata = -9999.0) {
    GridHeader h;
    h.ncols = static_cast<Index>(values.size());
    h.nrows = 1;
    h.cellsize = 1.0;
    h.nodata_value = nodata;
    Vector data(h.ncols);
    Index i = 0;
    for (Real v : values) data(i++) = v;
    return Grid(h, data);
}

} // namespace

TEST_CASE("Succession step", "[succession]") {
    SuccessionEngine engine;
    ResistanceTable table({{2, 5.0}, {3, 2.0}});

    Grid veg = row_grid({2, 0, 3});
    Grid zone = row_grid({5, 5, 5});
    Grid shear = row_grid({10, 0, 1});

    Grid out = engine.step(veg, zone, shear, table);
    REQUIRE(out == row_grid({6, 0, 4}));
    REQUIRE(out.header() == veg.header());
}

TEST_CASE("Succession cell rules", "[succession]") {
    SuccessionEngine engine;
    ResistanceTable table({{4, 3.0}});

    SECTION("shear above threshold resets to zone class then ages") {
        auto out = engine.step(row_grid({4}), row_grid({7}), row_grid({3.5}), table);
        REQUIRE(out(0) == 8.0);
    }

    SECTION("shear at threshold only ages") {
        auto out = engine.step(row_grid({4}), row_grid({7}), row_grid({3.0}), table);
        REQUIRE(out(0) == 5.0);
    }

    SECTION("bare ground stays bare") {
        auto out = engine.step(row_grid({0}), row_grid({7}), row_grid({100.0}), table);
        REQUIRE(out(0) == 0.0);
    }

    SECTION("NODATA shear leaves the cell unchanged") {
        auto out = engine.step(row_grid({4}), row_grid({7}), row_grid({-9999.0}), table);
        REQUIRE(out(0) == 4.0);
    }

    SECTION("NaN shear is not NODATA and only ages") {
        const Real nan = std::numeric_limits<Real>::quiet_NaN();
        auto out = engine.step(row_grid({4}), row_grid({7}), row_grid({nan}), table);
        REQUIRE(out(0) == 5.0);
    }

    SECTION("NODATA vegetation is not looked up") {
        auto out = engine.step(row_grid({-9999.0}), row_grid({7}), row_grid({10.0}), table);
        REQUIRE(out(0) == -9999.0);
    }
}

TEST_CASE("Succession run statistics", "[succession]") {
    SuccessionEngine engine;
    ResistanceTable table({{2, 5.0}, {3, 2.0}});

    auto result = engine.run(row_grid({2, 0, 3, 3}), row_grid({5, 5, 5, 5}),
                             row_grid({10, 0, 1, -9999}), table);
    REQUIRE(result.n_reset == 1);
    REQUIRE(result.n_aged == 2);
    REQUIRE(result.n_skipped == 1);
    REQUIRE(result.vegetation == row_grid({6, 0, 4, 3}));
}

TEST_CASE("Succession validates codes before processing", "[succession]") {
    SuccessionEngine engine;
    ResistanceTable table({{2, 5.0}});
    Grid veg = row_grid({2, 9, 7, 9, 0, -9999});

    REQUIRE(SuccessionEngine::lookup_codes(veg) == std::vector<int>{2, 7, 9});

    try {
        engine.step(veg, row_grid({1, 1, 1, 1, 1, 1}), row_grid({0, 0, 0, 0, 0, 0}), table);
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(e.missing_codes() == std::vector<int>{7, 9});
    }

    table.set(7, 1.0);
    table.set(9, 1.0);
    REQUIRE_NOTHROW(SuccessionEngine::validate_codes(veg, table));
}

TEST_CASE("Succession requires aligned grids", "[succession]") {
    SuccessionEngine engine;
    ResistanceTable table({{2, 5.0}});

    REQUIRE_THROWS_AS(engine.step(row_grid({2, 2}), row_grid({1}), row_grid({0, 0}), table),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(engine.step(row_grid({2, 2}), row_grid({1, 1}), row_grid({0}), table),
                      std::invalid_argument);
}

TEST_CASE("Roughness map", "[succession]") {
    SuccessionEngine engine;
    ResistanceTable table;
    table.set(2, 5.0, 0.05);
    table.set(3, 2.0, 0.1);

    SECTION("codes map to roughness, bare ground and NODATA to NODATA") {
        Grid n = engine.roughness_map(row_grid({2, 0, 3, -9999}), table);
        REQUIRE(n == row_grid({0.05, -9999, 0.1, -9999}));
    }

    SECTION("bare ground with its own roughness") {
        table.set(0, 0.0, 0.03);
        Grid n = engine.roughness_map(row_grid({0, 2}), table);
        REQUIRE(n == row_grid({0.03, 0.05}));
    }

    SECTION("codes without roughness") {
        table.set(4, 1.0);
        REQUIRE_THROWS_AS(engine.roughness_map(row_grid({2, 4}), table), ValidationError);
    }
}

TEST_CASE("Succession with a float32 NODATA sentinel", "[succession]") {
    // Common sentinel in single-precision rasters, far outside the int range
    const Real nodata = -3.4028234663852886e+38;
    SuccessionEngine engine;
    ResistanceTable table({{2, 5.0}, {3, 2.0}});

    Grid veg = row_grid({2, nodata, 3}, nodata);
    Grid zone = row_grid({5, 5, 5}, nodata);
    Grid shear = row_grid({10, 0, 1}, nodata);

    REQUIRE(SuccessionEngine::lookup_codes(veg) == std::vector<int>{2, 3});

    auto result = engine.run(veg, zone, shear, table);
    REQUIRE(result.vegetation == row_grid({6, nodata, 4}, nodata));
    REQUIRE(result.n_skipped == 1);

    Grid n = engine.roughness_map(row_grid({0, nodata}, nodata), table);
    REQUIRE(n(1) == nodata);
}

TEST_CASE("Succession rejects vegetation values outside the code range", "[succession]") {
    SuccessionEngine engine;
    ResistanceTable table({{2, 5.0}});
    Grid veg = row_grid({2, 1e12});

    REQUIRE_THROWS_AS(SuccessionEngine::lookup_codes(veg), ValidationError);
    REQUIRE_THROWS_AS(engine.step(veg, row_grid({1, 1}), row_grid({0, 0}), table),
                      ValidationError);
    REQUIRE_THROWS_AS(engine.roughness_map(veg, table), ValidationError);
}
