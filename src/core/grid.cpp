/**
 * @file grid.cpp
 * @brief Grid implementation and ESRI ASCII codec
 */

#include "ripsim/core/grid.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace ripsim {

// ============================================================================
// GridHeader
// ============================================================================

void GridHeader::print(std::ostream& os) const {
    os << "  ncols:        " << ncols << "\n";
    os << "  nrows:        " << nrows << "\n";
    os << "  xllcorner:    " << grid_io::format_real(xllcorner) << "\n";
    os << "  yllcorner:    " << grid_io::format_real(yllcorner) << "\n";
    os << "  cellsize:     " << grid_io::format_real(cellsize) << "\n";
    os << "  NODATA_value: " << grid_io::format_real(nodata_value) << "\n";
}

// ============================================================================
// Grid
// ============================================================================

Grid::Grid(const GridHeader& header, Vector data)
    : header_(header), data_(std::move(data)) {
    if (header_.ncols <= 0 || header_.nrows <= 0) {
        throw FormatError("ncols and nrows must be positive, got ncols: " +
                          std::to_string(header_.ncols) + ", nrows: " +
                          std::to_string(header_.nrows));
    }
    if (header_.ncols > constants::MAX_GRID_DIMENSION ||
        header_.nrows > constants::MAX_GRID_DIMENSION) {
        throw FormatError("ncols and nrows must not exceed " +
                          std::to_string(constants::MAX_GRID_DIMENSION) + ", got ncols: " +
                          std::to_string(header_.ncols) + ", nrows: " +
                          std::to_string(header_.nrows));
    }
    if (data_.size() != header_.size()) {
        throw FormatError(
            "length of data does not equal product of ncols * nrows"
            "\nncols: " + std::to_string(header_.ncols) +
            ", nrows: " + std::to_string(header_.nrows) +
            ", ncols*nrows: " + std::to_string(header_.size()) +
            " len(data): " + std::to_string(data_.size()));
    }
}

Grid Grid::filled(const GridHeader& header, Real value) {
    return Grid(header, Vector::Constant(header.size(), value));
}

Index Grid::count_nodata() const {
    return (data_.array() == header_.nodata_value).count();
}

RowMatrix Grid::as_matrix(Real replace_nodata_value) const {
    RowMatrix ret = as_matrix();
    ret = (ret.array() == header_.nodata_value)
              .select(replace_nodata_value, ret.array())
              .matrix();
    return ret;
}

bool Grid::operator==(const Grid& other) const {
    if (header_ != other.header_) return false;
    // Element-wise exact comparison; NaN never compares equal
    return (data_.array() == other.data_.array()).all();
}

// ============================================================================
// ESRI ASCII codec
// ============================================================================

namespace grid_io {

namespace {

const char* const HEADER_LABELS[6] = {
    "ncols", "nrows", "xllcorner", "yllcorner", "cellsize", "NODATA_value"
};

Real parse_real(const std::string& token, const std::string& what) {
    // std::stod stops at trailing garbage instead of failing
    std::size_t consumed = 0;
    Real value = 0.0;
    try {
        value = std::stod(token, &consumed);
    } catch (const std::exception&) {
        throw FormatError("Cannot parse " + what + " value: '" + token + "'");
    }
    if (consumed != token.size()) {
        throw FormatError("Cannot parse " + what + " value: '" + token + "'");
    }
    return value;
}

Index parse_count(const std::string& token, const std::string& what) {
    Real value = parse_real(token, what);
    if (value != std::floor(value) || value <= 0.0) {
        throw FormatError(what + " must be a positive integer, got '" + token + "'");
    }
    if (value > Real(constants::MAX_GRID_DIMENSION)) {
        throw FormatError(what + " exceeds " + std::to_string(constants::MAX_GRID_DIMENSION) +
                          ", got '" + token + "'");
    }
    return static_cast<Index>(value);
}

/// Value token of a "<label> <value>" header line
std::string header_value(std::istream& in, int field) {
    const std::string label = HEADER_LABELS[field];
    std::string line;
    if (!std::getline(in, line)) {
        throw FormatError("Unexpected end of input reading header field " + label);
    }
    std::istringstream ss(line);
    std::string key, value;
    if (!(ss >> key >> value)) {
        throw FormatError("Header line for " + label + " has no value: '" + line + "'");
    }
    return value;
}

} // namespace

std::string format_real(Real value) {
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, result.ptr);
}

Grid parse_asc(std::istream& in) {
    GridHeader header;
    header.ncols = parse_count(header_value(in, 0), HEADER_LABELS[0]);
    header.nrows = parse_count(header_value(in, 1), HEADER_LABELS[1]);
    header.xllcorner = parse_real(header_value(in, 2), HEADER_LABELS[2]);
    header.yllcorner = parse_real(header_value(in, 3), HEADER_LABELS[3]);
    header.cellsize = parse_real(header_value(in, 4), HEADER_LABELS[4]);
    header.nodata_value = parse_real(header_value(in, 5), HEADER_LABELS[5]);

    // Line breaks in the data block are irrelevant; some writers wrap rows
    std::vector<Real> values;
    // The header is untrusted; grow as tokens arrive beyond a modest block
    values.reserve(static_cast<Size>(std::min<Index>(header.size(), Index(1) << 20)));
    std::string token;
    while (in >> token) {
        values.push_back(parse_real(token, "data"));
    }

    Vector data = Eigen::Map<const Vector>(values.data(),
                                           static_cast<Index>(values.size()));
    return Grid(header, std::move(data));
}

Grid read_asc(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open raster file: " + filepath.string());
    }
    try {
        return parse_asc(file);
    } catch (const FormatError& e) {
        throw FormatError(filepath.string() + ": " + e.what());
    }
}

void format_asc(const Grid& grid, std::ostream& out) {
    const GridHeader h = grid.header();

    // NaN cells are written as the sentinel; the grid itself is untouched
    Vector data = grid.data();
    for (Index i = 0; i < data.size(); ++i) {
        if (std::isnan(data(i))) data(i) = h.nodata_value;
    }

    out << "ncols " << h.ncols << "\n";
    out << "nrows " << h.nrows << "\n";
    out << "xllcorner " << format_real(h.xllcorner) << "\n";
    out << "yllcorner " << format_real(h.yllcorner) << "\n";
    out << "cellsize " << format_real(h.cellsize) << "\n";
    out << "NODATA_value " << format_real(h.nodata_value) << "\n";

    for (Index r = 0; r < h.nrows; ++r) {
        if (r > 0) out << "\n";
        for (Index c = 0; c < h.ncols; ++c) {
            if (c > 0) out << " ";
            out << format_real(data(r * h.ncols + c));
        }
    }
}

void write_asc(const Grid& grid, const std::filesystem::path& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open raster file for writing: " +
                                 filepath.string());
    }
    format_asc(grid, file);
    if (!file) {
        throw std::runtime_error("Failed writing raster file: " + filepath.string());
    }
}

} // namespace grid_io

} // namespace ripsim
