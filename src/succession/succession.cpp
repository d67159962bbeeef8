/**
 * @file succession.cpp
 * @brief Succession rule implementation
 */

#include "ripsim/succession/succession.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ripsim {

namespace {

/// Cell takes part in the rule: finite and not the grid's sentinel
bool is_valid(const Grid& grid, Index i) {
    const Real v = grid(i);
    return std::isfinite(v) && v != grid.nodata_value();
}

/// Truncate a valid vegetation value to its class code
int to_code(Real v) {
    if (v <= Real(std::numeric_limits<int>::min()) - 1.0 ||
        v >= Real(std::numeric_limits<int>::max()) + 1.0) {
        throw ValidationError("Vegetation value " + std::to_string(v) +
                              " is not a representable class code", {});
    }
    return static_cast<int>(v);
}

std::string join_codes(const std::vector<int>& codes) {
    std::ostringstream ss;
    for (Size k = 0; k < codes.size(); ++k) {
        if (k > 0) ss << ", ";
        ss << codes[k];
    }
    return ss.str();
}

void check_aligned(const Grid& vegetation, const Grid& other, const char* name) {
    if (other.size() != vegetation.size()) {
        throw std::invalid_argument(
            std::string(name) + " grid has " + std::to_string(other.size()) +
            " cells, vegetation grid has " + std::to_string(vegetation.size()));
    }
}

} // namespace

std::vector<int> SuccessionEngine::lookup_codes(const Grid& vegetation) {
    std::set<int> codes;
    for (Index i = 0; i < vegetation.size(); ++i) {
        if (!is_valid(vegetation, i)) continue;
        const int code = to_code(vegetation(i));
        if (code != 0) codes.insert(code);
    }
    return std::vector<int>(codes.begin(), codes.end());
}

void SuccessionEngine::validate_codes(const Grid& vegetation, const ResistanceTable& table) {
    std::vector<int> missing;
    for (int code : lookup_codes(vegetation)) {
        if (!table.contains(code)) missing.push_back(code);
    }
    if (!missing.empty()) {
        throw ValidationError(
            "Vegetation codes missing from resistance table: " + join_codes(missing),
            missing);
    }
}

SuccessionResult SuccessionEngine::run(const Grid& vegetation, const Grid& zone,
                                       const Grid& shear,
                                       const ResistanceTable& table) const {
    check_aligned(vegetation, zone, "zone");
    check_aligned(vegetation, shear, "shear");
    validate_codes(vegetation, table);

    const Index n = vegetation.size();
    const Vector& V = vegetation.data();
    const Vector& Z = zone.data();
    const Vector& S = shear.data();
    const Real v_nodata = vegetation.nodata_value();
    const Real s_nodata = shear.nodata_value();

    Vector updated = V;
    Index n_reset = 0;
    Index n_aged = 0;
    Index n_skipped = 0;

    #pragma omp parallel for reduction(+:n_reset, n_aged, n_skipped)
    for (Index i = 0; i < n; ++i) {
        // Codes are range-checked above, so only valid cells reach the cast
        if (!std::isfinite(V(i)) || V(i) == v_nodata) {
            ++n_skipped;
            continue;
        }
        const int veg = static_cast<int>(V(i));
        if (veg == 0) continue;  // bare ground

        // NaN shear is not the sentinel; it never exceeds a threshold
        if (S(i) == s_nodata) {
            ++n_skipped;
            continue;
        }

        if (S(i) > table.threshold(veg)) {
            // Destroyed: reseed with the zone's class
            updated(i) = Z(i);
            ++n_reset;
        }
        // Age by one, including cells reset above
        updated(i) += 1.0;
        ++n_aged;
    }

    return {vegetation.with_data(std::move(updated)), n_reset, n_aged, n_skipped};
}

Grid SuccessionEngine::roughness_map(const Grid& vegetation,
                                     const ResistanceTable& table) const {
    std::vector<int> missing;
    for (int code : lookup_codes(vegetation)) {
        if (!table.has_roughness(code)) missing.push_back(code);
    }
    if (!missing.empty()) {
        throw ValidationError(
            "Vegetation codes without roughness in resistance table: " + join_codes(missing),
            missing);
    }

    const Index n = vegetation.size();
    const Real nodata = vegetation.nodata_value();
    const bool bare_has_roughness = table.has_roughness(0);
    Vector n_values(n);

    for (Index i = 0; i < n; ++i) {
        if (!is_valid(vegetation, i)) {
            n_values(i) = nodata;
            continue;
        }
        const int code = to_code(vegetation(i));
        if (code == 0 && !bare_has_roughness) {
            n_values(i) = nodata;
        } else {
            n_values(i) = table.roughness(code);
        }
    }
    return vegetation.with_data(std::move(n_values));
}

} // namespace ripsim
