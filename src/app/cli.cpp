/**
 * @file cli.cpp
 * @brief ripsim command line front end
 *
 * Runs one succession step from a hydraulic model's shear stress output
 * and writes the updated vegetation map.
 */

#include "ripsim/app/cli.hpp"
#include "ripsim/ripsim.hpp"
#include <cstring>
#include <iostream>

namespace ripsim {

const char* const CLI_HELP = R"(
ripsim v1.0  -  riparian vegetation succession from hydraulic shear stress

Usage:

    ripsim <path-to-shear-mesh> <path-to-save-output-vegmap> [config-file]

The shear mesh is a D-Flow FM map NetCDF file (.nc) or a text file with
columns "x y value [value ...]"; the last value column is used.

Vegetation map, zone map and resistance table default to
    data/vegclass_2z.asc
    data/zonemap_2z.asc
    data/casimir-data-requirements.csv
and can be changed in the [inputs] section of the config file.

Example:

    $ ripsim ~/dflow_outputs/jemez_r02_map.nc ~/casimir_out/veg-out-1.asc
)";

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    if (argc >= 2 && (std::strcmp(argv[1], "-h") == 0 ||
                      std::strcmp(argv[1], "--help") == 0)) {
        out << CLI_HELP << std::endl;
        return 0;
    }
    if (argc < 3 || argc > 4) {
        err << CLI_HELP << std::endl;
        return 1;
    }

    const std::filesystem::path shear_mesh = argv[1];
    const std::filesystem::path vegout_path = argv[2];

    try {
        Config config;
        if (argc == 4) {
            config = Config::from_file(argv[3]);
        }
        if (config.run.verbose) {
            config.print_summary(err);
        }

        SuccessionModel model(config);
        Grid vegout = model.run(config.inputs.vegetation_map,
                                config.inputs.zone_map,
                                shear_mesh,
                                config.inputs.resistance_table);
        grid_io::write_asc(vegout, vegout_path);

        if (!config.output.roughness_file.empty()) {
            Grid n_map = model.roughness(vegout, config.inputs.resistance_table);
            grid_io::write_asc(n_map, config.output.roughness_file);
        }
    } catch (const std::exception& e) {
        err << "ripsim: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

} // namespace ripsim
