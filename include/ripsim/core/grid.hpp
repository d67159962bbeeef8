/**
 * @file grid.hpp
 * @brief Regular raster grid and ESRI ASCII codec
 *
 * A Grid is a regular raster with a uniform cell size and a NODATA
 * sentinel. Data is stored flat in row-major order, row 0 being the
 * topmost row as written on disk.
 */

#pragma once

#include "types.hpp"
#include <filesystem>
#include <iosfwd>

namespace ripsim {

// ============================================================================
// Grid Header
// ============================================================================

/**
 * @brief The six ESRI ASCII header fields
 *
 * Used both as the header of a Grid and as the target configuration of
 * the Regridder.
 */
struct GridHeader {
    Index ncols = 0;                ///< Number of columns
    Index nrows = 0;                ///< Number of rows
    Real xllcorner = 0.0;           ///< Lower-left corner x
    Real yllcorner = 0.0;           ///< Lower-left corner y
    Real cellsize = 1.0;            ///< Cell edge length (both axes)
    Real nodata_value = constants::DEFAULT_NODATA;  ///< NODATA_value sentinel

    /// Number of cells
    Index size() const { return ncols * nrows; }

    bool operator==(const GridHeader& other) const {
        return ncols == other.ncols && nrows == other.nrows &&
               xllcorner == other.xllcorner && yllcorner == other.yllcorner &&
               cellsize == other.cellsize && nodata_value == other.nodata_value;
    }
    bool operator!=(const GridHeader& other) const { return !(*this == other); }

    /// Print header fields to stream
    void print(std::ostream& os) const;
};

// ============================================================================
// Grid
// ============================================================================

/**
 * @brief Immutable regular raster
 *
 * Every transformation returns a new Grid. The length invariant
 * data.size() == ncols * nrows is checked on construction.
 */
class Grid {
public:
    using MatrixView = Eigen::Map<const RowMatrix>;

    /**
     * @brief Construct grid from header and flat row-major data
     *
     * @throws FormatError if data.size() != header.ncols * header.nrows
     * @throws FormatError if ncols or nrows is not positive
     */
    Grid(const GridHeader& header, Vector data);

    /// Grid filled with a constant value
    static Grid filled(const GridHeader& header, Real value);

    /// Grid filled with the header's NODATA value
    static Grid nodata(const GridHeader& header) {
        return filled(header, header.nodata_value);
    }

    // Header access
    GridHeader header() const { return header_; }
    Index ncols() const { return header_.ncols; }
    Index nrows() const { return header_.nrows; }
    Real xllcorner() const { return header_.xllcorner; }
    Real yllcorner() const { return header_.yllcorner; }
    Real cellsize() const { return header_.cellsize; }
    Real nodata_value() const { return header_.nodata_value; }
    Index size() const { return header_.size(); }

    // Data access
    const Vector& data() const { return data_; }
    Real operator()(Index i) const { return data_(i); }
    Real at(Index row, Index col) const { return data_(cell_index(row, col)); }

    /// Flat index of (row, col), row 0 at the top
    Index cell_index(Index row, Index col) const { return row * header_.ncols + col; }

    /// True if cell i holds the NODATA sentinel
    bool is_nodata(Index i) const { return data_(i) == header_.nodata_value; }

    /// Number of NODATA cells
    Index count_nodata() const;

    /**
     * @brief Read-only nrows x ncols view over the data
     */
    MatrixView as_matrix() const {
        return MatrixView(data_.data(), header_.nrows, header_.ncols);
    }

    /**
     * @brief Owned nrows x ncols copy with NODATA cells replaced
     *
     * @param replace_nodata_value Value written in place of NODATA_value
     */
    RowMatrix as_matrix(Real replace_nodata_value) const;

    /// New grid with the same header and different data
    Grid with_data(Vector data) const { return Grid(header_, std::move(data)); }

    /// Exact comparison of header fields and every data element
    bool operator==(const Grid& other) const;
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    GridHeader header_;
    Vector data_;
};

// ============================================================================
// ESRI ASCII I/O
// ============================================================================

namespace grid_io {

/**
 * @brief Parse an ESRI ASCII grid from a stream
 *
 * Reads the six header lines in fixed order, taking only the value
 * token of each, then every remaining whitespace-separated token as
 * data regardless of line breaks.
 *
 * @throws FormatError on malformed header, bad numbers or length mismatch
 */
Grid parse_asc(std::istream& in);

/// Read an ESRI ASCII grid from disk
Grid read_asc(const std::filesystem::path& filepath);

/**
 * @brief Write an ESRI ASCII grid to a stream
 *
 * NaN values are written as NODATA_value. One row per line.
 */
void format_asc(const Grid& grid, std::ostream& out);

/// Write an ESRI ASCII grid to disk
void write_asc(const Grid& grid, const std::filesystem::path& filepath);

/// Shortest text form of a real that parses back to the same value
std::string format_real(Real value);

} // namespace grid_io

} // namespace ripsim
