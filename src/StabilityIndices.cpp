/**
 * @file StabilityIndices.cpp
 * @brief Water column stability and wind mixing indices
 */

#include "StabilityIndices.hpp"
#include "ProfileInterpolator.hpp"
#include "StratErrors.hpp"
#include <cmath>
#include <sstream>

namespace LakeStrat {

static const double G = Constants::GRAVITY;

// =============================================================================
// Water Column Stability
// =============================================================================

double schmidtStability(const DepthProfile& temperature, const Bathymetry& bathymetry,
                        const WaterDensityModel& density_model, double resolution) {
    temperature.validateComplete(1);

    double A0 = bathymetry.surfaceArea();
    if (!(A0 > 0.0)) {
        throw UndefinedIndexError("Schmidt stability: surface area is zero");
    }

    DepthProfile rho = density_model.densityProfile(temperature);
    ProfileInterpolator interp(resolution);
    std::vector<double> z = interp.grid(bathymetry.minDepth(), bathymetry.maxDepth());
    size_t n = z.size();

    std::vector<double> w(n, 0.0);
    for (size_t k = 1; k < n; ++k) {
        double h = z[k] - z[k-1];
        w[k-1] += 0.5 * h;
        w[k] += 0.5 * h;
    }

    std::vector<double> A(n), r(n);
    double sum_A = 0.0, sum_zA = 0.0, sum_rA = 0.0;
    for (size_t k = 0; k < n; ++k) {
        A[k] = bathymetry.areaAt(z[k]);
        r[k] = ProfileInterpolator::valueAtClamped(rho, z[k]);
        sum_A += w[k] * A[k];
        sum_zA += w[k] * z[k] * A[k];
        sum_rA += w[k] * r[k] * A[k];
    }
    if (!(sum_A > 0.0)) {
        throw UndefinedIndexError("Schmidt stability: lake volume is zero");
    }

    double z_v = sum_zA / sum_A;
    double rho_mean = sum_rA / sum_A;

    double St = 0.0;
    for (size_t k = 0; k < n; ++k) {
        St += w[k] * (r[k] - rho_mean) * (z[k] - z_v) * A[k];
    }
    return G / A0 * St;
}

std::vector<double> BuoyancyProfile::frequency() const {
    std::vector<double> N(n2.size());
    for (size_t i = 0; i < n2.size(); ++i) {
        N[i] = n2[i] > 0.0 ? std::sqrt(n2[i]) : 0.0;
    }
    return N;
}

BuoyancyProfile buoyancyFrequency(const DepthProfile& temperature,
                                  const WaterDensityModel& density_model) {
    temperature.validateComplete(2);

    std::vector<double> rho = density_model.density(temperature.values);
    const std::vector<double>& z = temperature.depths;

    BuoyancyProfile out;
    size_t n = z.size() - 1;
    out.depths.resize(n);
    out.thickness.resize(n);
    out.n2.resize(n);
    for (size_t i = 0; i < n; ++i) {
        double dz = z[i+1] - z[i];
        out.depths[i] = z[i] + 0.5 * dz;
        out.thickness[i] = dz;
        out.n2[i] = G / rho[i] * (rho[i+1] - rho[i]) / dz;
    }
    return out;
}

BuoyancyProfile metalimnionBuoyancyFrequency(const BuoyancyProfile& n2, const Layer& metalimnion) {
    BuoyancyProfile out;
    for (size_t i = 0; i < n2.size(); ++i) {
        if (metalimnion.contains(n2.depths[i])) {
            out.depths.push_back(n2.depths[i]);
            out.thickness.push_back(n2.thickness[i]);
            out.n2.push_back(n2.n2[i]);
        }
    }
    return out;
}

double buoyancyFrequencyAt(const BuoyancyProfile& n2, double depth) {
    if (n2.empty()) {
        throw InvalidInputError("buoyancyFrequencyAt: empty buoyancy profile");
    }
    return ProfileInterpolator::valueAtClamped(DepthProfile(n2.depths, n2.n2), depth);
}

double centerOfBuoyancy(const BuoyancyProfile& n2) {
    double weight = 0.0;
    double moment = 0.0;
    for (size_t i = 0; i < n2.size(); ++i) {
        if (n2.n2[i] <= 0.0) continue;
        double area = n2.n2[i] * n2.thickness[i];
        weight += area;
        moment += area * n2.depths[i];
    }
    if (!(weight > 0.0)) {
        throw UndefinedIndexError("center of buoyancy: N2 is nowhere positive");
    }
    return moment / weight;
}

// =============================================================================
// Wind Forcing
// =============================================================================

double dragCoefficient(double wind_speed, const WindConfig& config) {
    switch (config.drag_model) {
        case DragCoefficientModel::CONSTANT:
            return config.constant_drag;
        case DragCoefficientModel::HICKS_1972:
            return wind_speed < config.drag_threshold ? config.drag_low : config.drag_high;
    }
    return config.drag_low;
}

double windSpeedAt10m(double wind_speed, const WindConfig& config) {
    if (!std::isfinite(wind_speed) || wind_speed < 0.0) {
        throw DomainError("wind speed must be finite and non-negative");
    }
    if (!(config.sensor_height > 0.0)) {
        throw DomainError("wind sensor height must be positive");
    }
    if (config.sensor_height == Constants::REFERENCE_HEIGHT) {
        return wind_speed;
    }

    double cd = dragCoefficient(wind_speed, config);
    double denom = 1.0 - std::sqrt(cd) / config.von_karman *
                         std::log(Constants::REFERENCE_HEIGHT / config.sensor_height);
    if (!(denom > 0.0)) {
        std::ostringstream msg;
        msg << "wind profile correction undefined for sensor height "
            << config.sensor_height << " m";
        throw DomainError(msg.str());
    }
    return wind_speed / denom;
}

double frictionVelocity(double wind_speed, double epilimnion_density, const WindConfig& config) {
    if (!std::isfinite(epilimnion_density) || epilimnion_density <= 0.0) {
        throw DomainError("friction velocity: epilimnion density must be positive");
    }

    double u10 = windSpeedAt10m(wind_speed, config);
    double tau = config.air_density * dragCoefficient(u10, config) * u10 * u10;
    return std::sqrt(tau / epilimnion_density);
}

// =============================================================================
// Dimensionless Indices
// =============================================================================

double lakeNumber(const Bathymetry& bathymetry, double u_star, double schmidt_stability,
                  double meta_top, double meta_bottom, double hypolimnion_density) {
    if (!std::isfinite(schmidt_stability) || schmidt_stability == 0.0) {
        throw UndefinedIndexError("Lake Number: Schmidt stability is zero");
    }
    if (!std::isfinite(meta_top) || !std::isfinite(meta_bottom) || meta_top >= meta_bottom) {
        throw UndefinedIndexError("Lake Number: degenerate metalimnion");
    }
    if (!std::isfinite(u_star) || u_star <= 0.0) {
        throw UndefinedIndexError("Lake Number: friction velocity is zero");
    }
    if (!std::isfinite(hypolimnion_density) || hypolimnion_density <= 0.0) {
        throw UndefinedIndexError("Lake Number: hypolimnion density must be positive");
    }

    double A0 = bathymetry.surfaceArea();
    if (!(A0 > 0.0)) {
        throw UndefinedIndexError("Lake Number: surface area is zero");
    }
    double z_v = bathymetry.centerOfVolume();

    return schmidt_stability * (meta_top + meta_bottom) /
           (2.0 * hypolimnion_density * u_star * u_star * std::sqrt(A0) * z_v);
}

double wedderburnNumber(double delta_rho, double meta_top, double u_star,
                        double hypolimnion_density, double fetch_length) {
    if (!std::isfinite(delta_rho) || !std::isfinite(meta_top)) {
        throw UndefinedIndexError("Wedderburn Number: non-finite layer properties");
    }
    if (!std::isfinite(u_star) || u_star <= 0.0) {
        throw UndefinedIndexError("Wedderburn Number: friction velocity is zero");
    }
    if (!std::isfinite(fetch_length) || fetch_length <= 0.0) {
        throw UndefinedIndexError("Wedderburn Number: fetch length must be positive");
    }
    if (!std::isfinite(hypolimnion_density) || hypolimnion_density <= 0.0) {
        throw UndefinedIndexError("Wedderburn Number: hypolimnion density must be positive");
    }

    double g_prime = G * delta_rho / hypolimnion_density;
    return g_prime * meta_top * meta_top / (u_star * u_star * fetch_length);
}

double fetchLength(double surface_area, const FetchConfig& config) {
    if (config.model == FetchModel::SUPPLIED) {
        if (!(config.fetch_length > 0.0)) {
            throw DomainError("fetch length must be positive");
        }
        return config.fetch_length;
    }

    if (!(surface_area > 0.0)) {
        throw DomainError("fetch length: surface area must be positive");
    }
    if (config.model == FetchModel::CIRCLE_DIAMETER) {
        return 2.0 * std::sqrt(surface_area / M_PI);
    }
    return std::sqrt(surface_area);
}

} // namespace LakeStrat
