/**
 * @file types.hpp
 * @brief Core type definitions for ripsim
 *
 * This file defines the fundamental types used throughout ripsim,
 * including scalar types, array types and the error taxonomy.
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Sparse>
#include <cstdint>
#include <memory>
#include <vector>
#include <array>
#include <string>
#include <stdexcept>

namespace ripsim {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;
using Size = size_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

// Dense vectors
using Vector = Eigen::VectorXd;
using VectorI = Eigen::VectorXi;

// Dense matrices. Raster data is stored row-major (row 0 = top row),
// so matrix views over it use RowMatrix.
using Matrix = Eigen::MatrixXd;
using RowMatrix = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Sparse matrices (interpolation weights)
using SparseMatrix = Eigen::SparseMatrix<Real, Eigen::RowMajor>;
using SparseTriplet = Eigen::Triplet<Real>;

// Fixed-size vectors for coordinates
using Vec2 = Eigen::Vector2d;

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Malformed raster, table or mesh input
 *
 * Raised on decode, e.g. when a raster's data length does not equal
 * ncols * nrows.
 */
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Vegetation codes that have no entry in the resistance table
 *
 * Raised once, before any cell is processed, listing every missing code.
 */
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& what, std::vector<int> missing_codes)
        : std::runtime_error(what), missing_codes_(std::move(missing_codes)) {}

    /// Sorted list of offending codes
    const std::vector<int>& missing_codes() const { return missing_codes_; }

private:
    std::vector<int> missing_codes_;
};

/**
 * @brief Argument that is neither an in-memory structure nor a usable path
 */
class InputTypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ============================================================================
// Forward Declarations
// ============================================================================

struct GridHeader;
class Grid;
class Config;

struct MeshSample;
class DelaunayTriangulation;
class Regridder;

class ResistanceTable;
class SuccessionEngine;
class SuccessionModel;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template<typename T>
using Ptr = std::shared_ptr<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real DEFAULT_NODATA = -9999.0;    ///< ESRI ASCII default sentinel
    constexpr Real EPSILON = 1e-12;             ///< Relative geometric tolerance

    /// Largest ncols or nrows; keeps ncols * nrows within Index
    constexpr Index MAX_GRID_DIMENSION = 2147483647;
}

} // namespace ripsim
