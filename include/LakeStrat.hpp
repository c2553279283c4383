#ifndef LAKESTRAT_HPP
#define LAKESTRAT_HPP

#include <cstdint>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace LakeStrat {

// Forward declarations
struct DepthProfile;
class Bathymetry;
class WaterDensityModel;
class ProfileInterpolator;
class TemperatureSeries;
class TimeSeriesAnalyzer;
class ConfigReader;

/**
 * @brief Seconds since the Unix epoch, UTC
 *
 * Timezone normalisation happens in the loaders before data reaches the
 * library, so timestamps compare exactly.
 */
using Timestamp = std::int64_t;

// =============================================================================
// Physical Constants
// =============================================================================

namespace Constants {
    constexpr double GRAVITY = 9.81;              // m/s²
    constexpr double VON_KARMAN = 0.4;            // -
    constexpr double AIR_DENSITY = 1.2;           // kg/m³ (near-surface air)
    constexpr double REFERENCE_HEIGHT = 10.0;     // m, standard wind height
    constexpr double DEFAULT_RESOLUTION = 0.1;    // m, fine grid spacing
}

/**
 * @brief Quiet NaN used as the "undefined" marker in result tables
 */
inline double undefinedValue() {
    return std::numeric_limits<double>::quiet_NaN();
}

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Equation of state for water density
 */
enum class DensityFormula {
    MARTIN_MCCUTCHEON,     // Freshwater, Martin & McCutcheon (1999)
    UNESCO                 // Millero & Poisson (1981), salinity aware
};

/**
 * @brief Wind drag coefficient parameterisation
 */
enum class DragCoefficientModel {
    HICKS_1972,            // 1.0e-3 below 5 m/s, 1.5e-3 above
    CONSTANT               // User supplied constant
};

/**
 * @brief How the characteristic fetch length is obtained
 */
enum class FetchModel {
    SQUARE_ROOT_AREA,      // L = sqrt(A0)
    CIRCLE_DIAMETER,       // L = 2 sqrt(A0 / pi)
    SUPPLIED               // L given directly
};

/**
 * @brief Join between temperature and wind timestamps
 */
enum class WindJoinPolicy {
    EXACT,                 // Identical timestamps required
    LINEAR_INTERPOLATION   // Wind interpolated in time
};

/**
 * @brief Handling of rows whose depth set differs from the first row
 */
enum class DepthPolicy {
    TOLERATE,              // Analyse each row on its own depths
    REQUIRE_FIXED          // Mark differing rows as DEPTH_MISMATCH
};

/**
 * @brief Outcome of one time-series row
 */
enum class RowStatus {
    OK = 0,
    MISSING_INPUT,
    NOT_STRATIFIED,
    OUT_OF_RANGE,
    DOMAIN_ERROR,
    EMPTY_LAYER,
    UNDEFINED_INDEX,
    ALIGNMENT,
    INVALID_INPUT,
    DEPTH_MISMATCH,
    FAILED
};

std::string rowStatusToString(RowStatus status);

/**
 * @brief Depth interval [top, bottom] in metres
 */
struct Layer {
    double top = 0.0;
    double bottom = 0.0;

    double thickness() const { return bottom - top; }
    bool contains(double depth) const { return depth >= top && depth <= bottom; }
};

} // namespace LakeStrat

#endif // LAKESTRAT_HPP
