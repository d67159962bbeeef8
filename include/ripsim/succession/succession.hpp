/**
 * @file succession.hpp
 * @brief Per-cell vegetation succession rule
 *
 * Simplified CASiMiR-style succession: vegetation whose shear resistance
 * is exceeded by the bed shear stress is reset to the zone's initial
 * class, and every valid vegetated cell ages by one step.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/grid.hpp"
#include "resistance_table.hpp"

namespace ripsim {

/**
 * @brief Outcome of one succession step
 */
struct SuccessionResult {
    Grid vegetation;                ///< Updated vegetation grid
    Index n_reset = 0;              ///< Cells reset to their zone class
    Index n_aged = 0;               ///< Cells aged (includes reset cells)
    Index n_skipped = 0;            ///< Vegetated cells left unchanged (NODATA)
};

/**
 * @brief Applies one succession step to a vegetation grid
 *
 * Vegetation codes combine class and age, so "aging" is an increment of
 * the code. Code 0 is bare ground and never changes.
 */
class SuccessionEngine {
public:
    SuccessionEngine() = default;

    /**
     * @brief Check that the table covers every vegetation code
     *
     * Collects each distinct nonzero code in the vegetation grid, skipping
     * NODATA and non-finite cells (those are never looked up), and
     * reports all codes missing from the table at once.
     *
     * @throws ValidationError listing the missing codes
     */
    static void validate_codes(const Grid& vegetation, const ResistanceTable& table);

    /// Distinct nonzero codes that the succession rule will look up
    static std::vector<int> lookup_codes(const Grid& vegetation);

    /**
     * @brief Run one succession step
     *
     * For each cell with code c = int(V[i]) != 0 whose shear and
     * vegetation values are both valid (not NODATA):
     * - if S[i] > R[c], the cell is reset to the zone class Z[i];
     * - the cell then ages by one (so a reset cell becomes Z[i] + 1).
     * Cells with NODATA shear, or NODATA or non-finite vegetation, are left
     * unchanged. A NaN shear is not NODATA: it never exceeds R[c], so the
     * cell only ages.
     *
     * @param vegetation Vegetation class grid V (not modified)
     * @param zone Zone grid Z, class each cell reverts to
     * @param shear Bed shear stress grid S, cell-aligned with V
     * @param table Shear resistance per vegetation code
     * @return Updated vegetation grid with V's header
     *
     * @throws ValidationError if a vegetation code is missing from the table
     *         or a vegetation value does not fit a class code
     * @throws std::invalid_argument if Z or S differ from V in cell count
     */
    Grid step(const Grid& vegetation, const Grid& zone, const Grid& shear,
              const ResistanceTable& table) const {
        return run(vegetation, zone, shear, table).vegetation;
    }

    /// step() with per-step cell counts
    SuccessionResult run(const Grid& vegetation, const Grid& zone, const Grid& shear,
                         const ResistanceTable& table) const;

    /**
     * @brief Manning roughness grid for the next hydraulic run
     *
     * NODATA cells stay NODATA; bare ground without a table entry becomes
     * NODATA.
     *
     * @throws ValidationError if any other code has no roughness
     */
    Grid roughness_map(const Grid& vegetation, const ResistanceTable& table) const;
};

} // namespace ripsim
