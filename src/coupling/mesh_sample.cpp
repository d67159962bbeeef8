/**
 * @file mesh_sample.cpp
 * @brief Mesh sample container and readers
 */

#include "ripsim/coupling/mesh_sample.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#ifdef RIPSIM_HAS_NETCDF
#include <netcdf.h>
#endif

namespace ripsim {

// ============================================================================
// MeshSample
// ============================================================================

std::vector<Vec2> MeshSample::points() const {
    std::vector<Vec2> pts;
    pts.reserve(static_cast<Size>(size()));
    for (Index i = 0; i < size(); ++i) {
        pts.push_back(point(i));
    }
    return pts;
}

void MeshSample::validate() const {
    if (x.size() != y.size() || x.size() != values.size()) {
        throw FormatError("Mesh sample length mismatch: x " + std::to_string(x.size()) +
                          ", y " + std::to_string(y.size()) +
                          ", values " + std::to_string(values.size()));
    }
}

MeshSample MeshSample::from_time_series(const Vector& x, const Vector& y,
                                        const Matrix& series) {
    if (series.rows() == 0) {
        throw FormatError("Mesh time series has no time steps");
    }
    MeshSample sample;
    sample.x = x;
    sample.y = y;
    // Only the most recent state is consumed
    sample.values = series.row(series.rows() - 1).transpose();
    sample.validate();
    return sample;
}

namespace mesh_io {

// ============================================================================
// NetCDF
// ============================================================================

#ifdef RIPSIM_HAS_NETCDF

namespace {

std::string nc_error(int status) {
    const char* msg = nc_strerror(status);
    return msg ? std::string(msg) : std::string("unknown netcdf error");
}

/// Closes the dataset on scope exit
struct NcFile {
    int ncid = -1;

    explicit NcFile(const std::filesystem::path& filepath) {
        int rc = nc_open(filepath.string().c_str(), NC_NOWRITE, &ncid);
        if (rc != NC_NOERR) {
            throw std::runtime_error("Cannot open NetCDF file " + filepath.string() +
                                     ": " + nc_error(rc));
        }
    }
    ~NcFile() {
        if (ncid >= 0) nc_close(ncid);
    }
    NcFile(const NcFile&) = delete;
    NcFile& operator=(const NcFile&) = delete;

    int varid(const std::string& name) const {
        int id = -1;
        int rc = nc_inq_varid(ncid, name.c_str(), &id);
        if (rc != NC_NOERR) {
            throw FormatError("NetCDF variable '" + name + "' not found: " + nc_error(rc));
        }
        return id;
    }

    std::vector<size_t> shape(int var, const std::string& name) const {
        int ndims = 0;
        int rc = nc_inq_varndims(ncid, var, &ndims);
        if (rc != NC_NOERR) {
            throw FormatError("nc_inq_varndims failed for '" + name + "': " + nc_error(rc));
        }
        std::vector<int> dimids(static_cast<Size>(ndims));
        rc = nc_inq_vardimid(ncid, var, dimids.data());
        if (rc != NC_NOERR) {
            throw FormatError("nc_inq_vardimid failed for '" + name + "': " + nc_error(rc));
        }
        std::vector<size_t> lens(static_cast<Size>(ndims));
        for (int d = 0; d < ndims; ++d) {
            rc = nc_inq_dimlen(ncid, dimids[d], &lens[d]);
            if (rc != NC_NOERR) {
                throw FormatError("nc_inq_dimlen failed for '" + name + "': " + nc_error(rc));
            }
        }
        return lens;
    }

    Vector read_1d(const std::string& name) const {
        int var = varid(name);
        auto lens = shape(var, name);
        if (lens.size() != 1) {
            throw FormatError("NetCDF variable '" + name + "' must be 1-D");
        }
        Vector out(static_cast<Index>(lens[0]));
        int rc = nc_get_var_double(ncid, var, out.data());
        if (rc != NC_NOERR) {
            throw FormatError("Cannot read '" + name + "': " + nc_error(rc));
        }
        return out;
    }

    /// Replace _FillValue entries with NaN so they fall out as NODATA
    void mask_fill(int var, Vector& values) const {
        double fill = 0.0;
        if (nc_get_att_double(ncid, var, "_FillValue", &fill) == NC_NOERR) {
            for (Index i = 0; i < values.size(); ++i) {
                if (values(i) == fill) {
                    values(i) = std::numeric_limits<Real>::quiet_NaN();
                }
            }
        }
    }
};

} // namespace

bool has_netcdf() { return true; }

MeshSample load_netcdf(const std::filesystem::path& filepath, const MeshConfig& config) {
    NcFile file(filepath);

    MeshSample sample;
    sample.x = file.read_1d(config.x_variable);
    sample.y = file.read_1d(config.y_variable);

    int var = file.varid(config.field_variable);
    auto lens = file.shape(var, config.field_variable);
    if (lens.empty() || lens.size() > 2) {
        throw FormatError("NetCDF variable '" + config.field_variable +
                          "' must be (time, element) or (element)");
    }

    const size_t n_elem = lens.back();
    std::vector<size_t> start(lens.size(), 0);
    std::vector<size_t> count(lens.size(), 1);
    count.back() = n_elem;
    if (lens.size() == 2) {
        if (lens[0] == 0) {
            throw FormatError("NetCDF variable '" + config.field_variable +
                              "' has no time steps");
        }
        start[0] = lens[0] - 1;  // last time step
    }

    sample.values.resize(static_cast<Index>(n_elem));
    int rc = nc_get_vara_double(file.ncid, var, start.data(), count.data(),
                                sample.values.data());
    if (rc != NC_NOERR) {
        throw FormatError("Cannot read '" + config.field_variable + "': " + nc_error(rc));
    }
    file.mask_fill(var, sample.values);

    sample.validate();
    return sample;
}

#else

bool has_netcdf() { return false; }

MeshSample load_netcdf(const std::filesystem::path& filepath, const MeshConfig&) {
    throw std::runtime_error("ripsim was built without NetCDF support, cannot read " +
                             filepath.string());
}

#endif // RIPSIM_HAS_NETCDF

// ============================================================================
// Column text
// ============================================================================

MeshSample parse_columns(std::istream& in) {
    std::vector<Real> xs, ys, vs;
    std::string line;
    Index line_no = 0;
    Index n_cols = -1;

    while (std::getline(in, line)) {
        ++line_no;
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }
        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream ss(line);
        std::vector<std::string> tokens;
        std::string tok;
        while (ss >> tok) tokens.push_back(tok);
        if (tokens.empty()) continue;

        std::vector<Real> row;
        row.reserve(tokens.size());
        bool numeric = true;
        for (const auto& t : tokens) {
            std::size_t consumed = 0;
            try {
                row.push_back(std::stod(t, &consumed));
            } catch (const std::exception&) {
                numeric = false;
                break;
            }
            if (consumed != t.size()) {
                numeric = false;
                break;
            }
        }

        if (!numeric) {
            // Column header row
            if (xs.empty() && n_cols < 0) continue;
            throw FormatError("Non-numeric mesh sample at line " + std::to_string(line_no));
        }
        if (row.size() < 3) {
            throw FormatError("Mesh sample line " + std::to_string(line_no) +
                              " needs at least x, y and one value");
        }
        if (n_cols < 0) {
            n_cols = static_cast<Index>(row.size());
        } else if (static_cast<Index>(row.size()) != n_cols) {
            throw FormatError("Mesh sample line " + std::to_string(line_no) + " has " +
                              std::to_string(row.size()) + " columns, expected " +
                              std::to_string(n_cols));
        }

        xs.push_back(row[0]);
        ys.push_back(row[1]);
        vs.push_back(row.back());   // last time step
    }

    MeshSample sample;
    const Index n = static_cast<Index>(xs.size());
    sample.x = Eigen::Map<const Vector>(xs.data(), n);
    sample.y = Eigen::Map<const Vector>(ys.data(), n);
    sample.values = Eigen::Map<const Vector>(vs.data(), n);
    return sample;
}

MeshSample load_columns(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open mesh sample file: " + filepath.string());
    }
    return parse_columns(file);
}

MeshSample load(const std::filesystem::path& filepath, const MeshConfig& config) {
    if (filepath.extension() == ".nc") {
        return load_netcdf(filepath, config);
    }
    return load_columns(filepath);
}

} // namespace mesh_io

} // namespace ripsim
