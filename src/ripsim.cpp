/**
 * @file ripsim.cpp
 * @brief SuccessionModel implementation
 */

#include "ripsim/ripsim.hpp"
#include <chrono>
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ripsim {

namespace {

/// Shared empty-path check for every source kind
const std::filesystem::path& checked_path(const std::filesystem::path& path,
                                          const char* what) {
    if (path.empty()) {
        throw InputTypeError(std::string(what) +
                             " must be an in-memory object or a non-empty path");
    }
    return path;
}

} // namespace

SuccessionModel::SuccessionModel(const Config& config) {
    set_config(config);
}

void SuccessionModel::set_config(const Config& config) {
    config.validate();
    config_ = config;
#ifdef _OPENMP
    if (config_.run.num_threads > 0) {
        omp_set_num_threads(config_.run.num_threads);
    }
#endif
}

void SuccessionModel::log(const std::string& message) const {
    if (config_.run.verbose) {
        std::cerr << "[ripsim] " << message << "\n";
    }
}

// ============================================================================
// Source Resolution
// ============================================================================

Grid SuccessionModel::resolve(const GridSource& source) const {
    if (const auto* grid = std::get_if<Grid>(&source)) {
        return *grid;
    }
    const auto& path = checked_path(std::get<std::filesystem::path>(source), "Grid");
    log("Reading raster " + path.string());
    return grid_io::read_asc(path);
}

ResistanceTable SuccessionModel::resolve(const TableSource& source) const {
    if (const auto* table = std::get_if<ResistanceTable>(&source)) {
        return *table;
    }
    const auto& path = checked_path(std::get<std::filesystem::path>(source),
                                    "Resistance table");
    log("Reading resistance table " + path.string() + " (code column '" +
        config_.table.code_column + "')");
    return ResistanceTable::from_csv(path, config_.table);
}

MeshSample SuccessionModel::resolve(const MeshSource& source) const {
    if (const auto* mesh = std::get_if<MeshSample>(&source)) {
        mesh->validate();
        return *mesh;
    }
    const auto& path = checked_path(std::get<std::filesystem::path>(source), "Mesh");
    log("Reading mesh samples " + path.string());
    return mesh_io::load(path, config_.mesh);
}

// ============================================================================
// Pipeline
// ============================================================================

Grid SuccessionModel::shear_grid(const MeshSample& mesh, const GridHeader& target) const {
    auto start = std::chrono::high_resolution_clock::now();

    Regridder regridder(target, mesh);
    if (regridder.is_degenerate()) {
        log("Mesh with " + std::to_string(mesh.size()) +
            " points does not triangulate; shear grid is all NODATA");
    }
    Grid shear = regridder.regrid(mesh);

    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();
    log("Regridded " + std::to_string(mesh.size()) + " mesh points onto " +
        std::to_string(target.ncols) + "x" + std::to_string(target.nrows) + " grid (" +
        std::to_string(regridder.triangulation().n_triangles()) + " triangles, " +
        std::to_string(target.size() - regridder.n_covered()) + " cells outside hull, " +
        std::to_string(ms) + " ms)");
    return shear;
}

Grid SuccessionModel::run_with_shear(const GridSource& vegetation, const GridSource& zone,
                                     const GridSource& shear,
                                     const TableSource& table) const {
    const Grid veg = resolve(vegetation);
    const Grid zon = resolve(zone);
    const Grid shr = resolve(shear);
    const ResistanceTable tab = resolve(table);

    SuccessionResult result = engine_.run(veg, zon, shr, tab);
    log("Succession: " + std::to_string(result.n_reset) + " cells reset, " +
        std::to_string(result.n_aged) + " aged, " +
        std::to_string(result.n_skipped) + " skipped as NODATA");
    return std::move(result.vegetation);
}

Grid SuccessionModel::run(const GridSource& vegetation, const GridSource& zone,
                          const MeshSource& shear_mesh, const TableSource& table) const {
    const Grid veg = resolve(vegetation);
    const Grid zon = resolve(zone);
    const ResistanceTable tab = resolve(table);
    const MeshSample mesh = resolve(shear_mesh);

    const Grid shear = shear_grid(mesh, veg.header());
    return run_with_shear(veg, zon, shear, tab);
}

Grid SuccessionModel::roughness(const GridSource& vegetation,
                                const TableSource& table) const {
    return engine_.roughness_map(resolve(vegetation), resolve(table));
}

} // namespace ripsim
