/**
 * @file StratificationDetector.cpp
 * @brief Thermocline and metalimnion detection
 */

#include "StratificationDetector.hpp"
#include "ProfileInterpolator.hpp"
#include "StratErrors.hpp"
#include <algorithm>
#include <cmath>

namespace LakeStrat {

// =============================================================================
// DensityGradient
// =============================================================================

size_t DensityGradient::maxIndex() const {
    if (gradient.empty()) {
        throw InvalidInputError("DensityGradient: empty gradient");
    }
    return std::max_element(gradient.begin(), gradient.end()) - gradient.begin();
}

double DensityGradient::maxGradient() const {
    return gradient[maxIndex()];
}

double DensityGradient::gradientAt(double depth) const {
    return ProfileInterpolator::valueAtClamped(DepthProfile(midpoints, gradient), depth);
}

// =============================================================================
// StratificationDetector
// =============================================================================

StratificationDetector::StratificationDetector() {}

StratificationDetector::StratificationDetector(const WaterDensityModel& density_model,
                                               const ThermoclineConfig& thermo_config,
                                               const MetalimnionConfig& meta_config)
    : density_model_(density_model),
      thermo_config_(thermo_config),
      meta_config_(meta_config) {}

DensityGradient StratificationDetector::densityGradient(const DepthProfile& temperature) const {
    temperature.validateComplete(2);

    ProfileInterpolator interp(thermo_config_.resolution);
    DepthProfile fine = interp.resample(density_model_.densityProfile(temperature));

    DensityGradient dg;
    dg.depths = fine.depths;
    size_t n = fine.size() - 1;
    dg.midpoints.resize(n);
    dg.gradient.resize(n);
    for (size_t i = 0; i < n; ++i) {
        double dz = fine.depths[i+1] - fine.depths[i];
        dg.midpoints[i] = 0.5 * (fine.depths[i] + fine.depths[i+1]);
        dg.gradient[i] = (fine.values[i+1] - fine.values[i]) / dz;
    }
    return dg;
}

StratificationDetector::Plateau
StratificationDetector::plateauAround(const std::vector<double>& g, size_t i, double tol) const {
    Plateau p{i, i};
    while (p.lo > 0 && std::abs(g[p.lo-1] - g[i]) <= tol) {
        --p.lo;
    }
    while (p.hi + 1 < g.size() && std::abs(g[p.hi+1] - g[i]) <= tol) {
        ++p.hi;
    }
    return p;
}

double StratificationDetector::refinePeak(const DensityGradient& dg, const Plateau& p) const {
    const auto& z = dg.depths;
    const auto& g = dg.gradient;

    double up = z[p.lo];
    double dn = z[p.hi + 1];
    double estimate = 0.5 * (up + dn);

    // Weight the plateau ends by how sharply the gradient falls off on
    // either side (zero crossing of the second derivative)
    if (p.lo > 0 && p.hi + 1 < g.size()) {
        double s_up = (z[p.lo] - z[p.lo-1]) / (g[p.lo] - g[p.lo-1]);
        double s_dn = -(z[p.hi+2] - z[p.hi+1]) / (g[p.hi+1] - g[p.hi]);
        if (std::isfinite(s_up) && std::isfinite(s_dn) && s_up > 0.0 && s_dn > 0.0) {
            estimate = dn * (s_dn / (s_dn + s_up)) + up * (s_up / (s_dn + s_up));
        }
    }
    return estimate;
}

ThermoclineResult StratificationDetector::findThermocline(const DepthProfile& temperature) const {
    ThermoclineResult result;
    result.gradient = densityGradient(temperature);

    if (temperature.maxValue() - temperature.minValue() < thermo_config_.mixed_cutoff) {
        return result;
    }

    const DensityGradient& dg = result.gradient;
    const std::vector<double>& g = dg.gradient;

    size_t i_max = dg.maxIndex();
    double g_max = g[i_max];
    if (!(g_max > thermo_config_.stratified_min_gradient)) {
        return result;
    }

    double tol = thermo_config_.plateau_tolerance * std::abs(g_max);
    Plateau main = plateauAround(g, i_max, tol);

    result.stratified = true;
    result.max_gradient = g_max;
    result.depth = refinePeak(dg, main);
    result.seasonal_depth = result.depth;

    // Seasonal thermocline: deepest significant local peak below the main one
    double cut = std::max(thermo_config_.seasonal_peak_fraction * g_max,
                          thermo_config_.seasonal_min_gradient);
    size_t deepest = 0;
    bool found = false;
    for (size_t i = 1; i + 1 < g.size(); ++i) {
        bool rises_into = g[i] - g[i-1] > tol;
        bool not_rising_after = g[i+1] - g[i] <= tol;
        if (rises_into && not_rising_after && g[i] > cut) {
            deepest = i;
            found = true;
        }
    }

    if (found) {
        Plateau seasonal = plateauAround(g, deepest, tol);
        if (seasonal.lo > main.hi + 1) {
            double depth = refinePeak(dg, seasonal);
            if (depth > result.depth) {
                result.seasonal_depth = depth;
            }
        }
    }

    return result;
}

std::optional<double> StratificationDetector::thermoclineDepth(const DepthProfile& temperature,
                                                               bool seasonal) const {
    ThermoclineResult result = findThermocline(temperature);
    if (!result.stratified) {
        return std::nullopt;
    }
    return result.depthFor(seasonal);
}

namespace {

double thresholdCrossing(double z1, double g1, double z2, double g2, double threshold) {
    if (g1 == g2) return z2;
    return z1 + (threshold - g1) * (z2 - z1) / (g2 - g1);
}

} // anonymous namespace

Layer StratificationDetector::metalimnionFromThermocline(const ThermoclineResult& result,
                                                         bool seasonal) const {
    if (!result.stratified) {
        throw NotStratifiedError("metalimnion undefined: water column is not stratified");
    }

    const DensityGradient& dg = result.gradient;
    const std::vector<double>& m = dg.midpoints;
    const std::vector<double>& g = dg.gradient;

    double zt = result.depthFor(seasonal);
    double gt = dg.gradientAt(zt);
    double threshold = meta_config_.use_absolute_slope
                     ? meta_config_.absolute_slope
                     : meta_config_.gradient_fraction * result.max_gradient;

    Layer meta{dg.depths.front(), dg.depths.back()};

    if (gt < threshold) {
        meta.top = zt;
        meta.bottom = zt;
        return meta;
    }

    // Downward from the thermocline
    double prev_z = zt, prev_g = gt;
    for (size_t i = 0; i < m.size(); ++i) {
        if (m[i] <= zt) continue;
        if (g[i] < threshold) {
            meta.bottom = thresholdCrossing(prev_z, prev_g, m[i], g[i], threshold);
            break;
        }
        prev_z = m[i];
        prev_g = g[i];
    }

    // Upward from the thermocline
    prev_z = zt;
    prev_g = gt;
    for (size_t k = m.size(); k-- > 0; ) {
        if (m[k] >= zt) continue;
        if (g[k] < threshold) {
            meta.top = thresholdCrossing(prev_z, prev_g, m[k], g[k], threshold);
            break;
        }
        prev_z = m[k];
        prev_g = g[k];
    }

    meta.top = std::min(meta.top, zt);
    meta.bottom = std::max(meta.bottom, zt);
    return meta;
}

std::optional<Layer> StratificationDetector::metalimnionDepths(const DepthProfile& temperature,
                                                               bool seasonal) const {
    ThermoclineResult result = findThermocline(temperature);
    if (!result.stratified) {
        return std::nullopt;
    }
    return metalimnionFromThermocline(result, seasonal);
}

} // namespace LakeStrat
