#ifndef STABILITY_INDICES_HPP
#define STABILITY_INDICES_HPP

#include "LakeStrat.hpp"
#include "Bathymetry.hpp"
#include "DepthProfile.hpp"
#include "WaterDensity.hpp"
#include <vector>

namespace LakeStrat {

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Surface wind stress parameters
 *
 * Hicks (1972) drag: 1.0e-3 below 5 m/s, 1.5e-3 at and above. Wind is
 * corrected from sensor height to 10 m with a neutral logarithmic profile.
 */
struct WindConfig {
    double sensor_height = Constants::REFERENCE_HEIGHT;   // m
    double von_karman = Constants::VON_KARMAN;
    double air_density = Constants::AIR_DENSITY;          // kg/m³
    DragCoefficientModel drag_model = DragCoefficientModel::HICKS_1972;
    double drag_low = 1.0e-3;
    double drag_high = 1.5e-3;
    double drag_threshold = 5.0;                          // m/s
    double constant_drag = 1.3e-3;                        // CONSTANT model
};

/**
 * @brief Characteristic length for the Wedderburn Number
 */
struct FetchConfig {
    FetchModel model = FetchModel::SQUARE_ROOT_AREA;
    double fetch_length = 0.0;                            // m, SUPPLIED model
};

/**
 * @brief N² per measured interval, located at interval midpoints
 */
struct BuoyancyProfile {
    std::vector<double> depths;     // m
    std::vector<double> thickness;  // m, interval widths
    std::vector<double> n2;         // s⁻²

    size_t size() const { return n2.size(); }
    bool empty() const { return n2.empty(); }

    /// N (s⁻¹), zero where N² is not positive
    std::vector<double> frequency() const;
};

// =============================================================================
// Water Column Stability
// =============================================================================

/**
 * @brief Schmidt stability (J/m²)
 *
 * Work per unit surface area needed to mix the column to uniform density:
 * St = g / A0 * integral((ρ(z) - ρ_mean) (z - z_v) A(z) dz) from the surface
 * to the lake bottom, with z_v the center of volume. Densities are
 * interpolated between measured depths and held beyond them.
 *
 * @throws UndefinedIndexError when the surface area is zero
 */
double schmidtStability(const DepthProfile& temperature, const Bathymetry& bathymetry,
                        const WaterDensityModel& density_model = WaterDensityModel(),
                        double resolution = Constants::DEFAULT_RESOLUTION);

/**
 * @brief Buoyancy (Brunt-Väisälä) frequency squared between measurements
 *
 * N² = g / ρ_i * (ρ_{i+1} - ρ_i) / (z_{i+1} - z_i), depth positive downward.
 */
BuoyancyProfile buoyancyFrequency(const DepthProfile& temperature,
                                  const WaterDensityModel& density_model = WaterDensityModel());

/**
 * @brief Buoyancy profile restricted to the metalimnion
 */
BuoyancyProfile metalimnionBuoyancyFrequency(const BuoyancyProfile& n2, const Layer& metalimnion);

/**
 * @brief N² interpolated at a depth (typically the thermocline)
 */
double buoyancyFrequencyAt(const BuoyancyProfile& n2, double depth);

/**
 * @brief Centroid of the positive N² distribution (m)
 * @throws UndefinedIndexError when N² is nowhere positive
 */
double centerOfBuoyancy(const BuoyancyProfile& n2);

// =============================================================================
// Wind Forcing
// =============================================================================

/**
 * @brief Drag coefficient for a 10 m wind speed
 */
double dragCoefficient(double wind_speed, const WindConfig& config);

/**
 * @brief Wind speed corrected from sensor height to 10 m
 * @throws DomainError for invalid speed or height
 */
double windSpeedAt10m(double wind_speed, const WindConfig& config);

/**
 * @brief Water-side friction velocity u* (m/s)
 * @param wind_speed Wind speed at sensor height (m/s)
 * @param epilimnion_density Mean epilimnion density (kg/m³)
 * @throws DomainError for negative wind or non-positive density
 */
double frictionVelocity(double wind_speed, double epilimnion_density,
                        const WindConfig& config = WindConfig());

// =============================================================================
// Dimensionless Indices
// =============================================================================

/**
 * @brief Lake Number (Imberger & Patterson 1990, Read et al. 2011 form)
 *
 * Ln = St (z_top + z_bottom) / (2 ρ_h u*² sqrt(A0) z_v)
 *
 * @throws UndefinedIndexError for zero stability, degenerate metalimnion,
 *         or zero u*
 */
double lakeNumber(const Bathymetry& bathymetry, double u_star, double schmidt_stability,
                  double meta_top, double meta_bottom, double hypolimnion_density);

/**
 * @brief Wedderburn Number W = g Δρ h² / (ρ_h u*² L)
 * @throws UndefinedIndexError for zero u*, fetch length or density
 */
double wedderburnNumber(double delta_rho, double meta_top, double u_star,
                        double hypolimnion_density, double fetch_length);

/**
 * @brief Fetch length from surface area or configuration
 */
double fetchLength(double surface_area, const FetchConfig& config = FetchConfig());

} // namespace LakeStrat

#endif // STABILITY_INDICES_HPP
