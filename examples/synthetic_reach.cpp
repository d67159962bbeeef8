/**
 * @file synthetic_reach.cpp
 * @brief Example: repeated floods over a synthetic river reach
 *
 * A straight channel runs north-south through a 200 m wide valley.
 * Each year a flood of different magnitude is applied: bed shear stress
 * is highest in the channel and decays toward the valley walls. The
 * vegetation map from one year is the input to the next.
 *
 * This demonstrates:
 * - Model setup from code (not config file)
 * - Scattered mesh samples on an unstructured layout
 * - Chaining succession steps
 * - Roughness map output for the hydraulic model
 */

#include <ripsim/ripsim.hpp>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <random>

using namespace ripsim;

/**
 * @brief Bed shear stress of a flood at distance d from the channel center
 *
 * tau(d) = tau_peak * exp(-(d / w)^2)
 *
 * @param d Distance from the channel centerline [m]
 * @param tau_peak Shear stress in the channel [N/m²]
 * @param w Flood half-width [m]
 */
double flood_shear(double d, double tau_peak, double w) {
    return tau_peak * std::exp(-(d / w) * (d / w));
}

int main() {
    std::cout << "=== ripsim Synthetic Reach ===" << std::endl;

    // Valley: 200 m x 400 m at 5 m resolution
    GridHeader header;
    header.ncols = 40;
    header.nrows = 80;
    header.xllcorner = 0.0;
    header.yllcorner = 0.0;
    header.cellsize = 5.0;
    header.nodata_value = -9999.0;
    const double x_channel = 100.0;

    // Zones: 2 near the channel (willow), 4 on the floodplain (cottonwood),
    // 0 on the terraces
    Vector zone_data(header.size());
    for (Index r = 0; r < header.nrows; ++r) {
        for (Index c = 0; c < header.ncols; ++c) {
            const double d = std::abs(header.xllcorner + c * header.cellsize - x_channel);
            zone_data(r * header.ncols + c) = d < 15.0 ? 2.0 : (d < 60.0 ? 4.0 : 0.0);
        }
    }
    Grid zone(header, zone_data);

    // Start with a mature landscape: every zone one class past its seed
    Vector veg_data = zone_data;
    for (Index i = 0; i < veg_data.size(); ++i) {
        if (veg_data(i) != 0.0) veg_data(i) += 1.0;
    }
    Grid vegetation(header, veg_data);

    // Critical shear per class; older stands resist more
    ResistanceTable table;
    for (int code = 2; code <= 20; ++code) {
        table.set(code, 10.0 + 5.0 * code, 0.04 + 0.01 * code);
    }

    // Mesh element centers scattered over a domain slightly larger than the valley
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> ux(-10.0, 210.0);
    std::uniform_real_distribution<double> uy(-10.0, 410.0);
    const Index n_elements = 4000;
    Vector mx(n_elements);
    Vector my(n_elements);
    for (Index i = 0; i < n_elements; ++i) {
        mx(i) = ux(rng);
        my(i) = uy(rng);
    }

    Config config;
    config.run.verbose = true;
    SuccessionModel model(config);

    // Weights depend only on the mesh and the grid, so build them once
    MeshSample sample;
    sample.x = mx;
    sample.y = my;
    sample.values = Vector::Zero(n_elements);
    Regridder regridder(header, sample);
    std::cout << "Mesh: " << n_elements << " elements, "
              << regridder.triangulation().n_triangles() << " triangles" << std::endl;

    std::ofstream outfile("synthetic_reach_classes.csv");
    outfile << "year,peak_shear,n_bare,n_young,n_mature\n";

    const std::vector<double> peak_shear = {5.0, 30.0, 12.0, 80.0, 20.0, 8.0, 45.0, 10.0};

    for (Size year = 0; year < peak_shear.size(); ++year) {
        for (Index i = 0; i < n_elements; ++i) {
            sample.values(i) = flood_shear(mx(i) - x_channel, peak_shear[year], 40.0);
        }
        Grid shear = regridder.regrid(sample);
        vegetation = model.run_with_shear(vegetation, zone, shear, table);

        Index n_bare = 0, n_young = 0, n_mature = 0;
        for (Index i = 0; i < vegetation.size(); ++i) {
            const double v = vegetation(i);
            if (v == 0.0) ++n_bare;
            else if (v <= 5.0) ++n_young;
            else ++n_mature;
        }
        outfile << year + 1 << "," << peak_shear[year] << ","
                << n_bare << "," << n_young << "," << n_mature << "\n";
        std::cout << "Year " << year + 1 << ": peak shear " << peak_shear[year]
                  << " N/m², " << n_young << " young and " << n_mature
                  << " mature cells" << std::endl;
    }

    grid_io::write_asc(vegetation, "synthetic_reach_veg.asc");
    grid_io::write_asc(model.roughness(vegetation, table), "synthetic_reach_n.asc");

    std::cout << "Output written to synthetic_reach_*.asc and synthetic_reach_classes.csv"
              << std::endl;
    return 0;
}
