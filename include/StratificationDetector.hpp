#ifndef STRATIFICATION_DETECTOR_HPP
#define STRATIFICATION_DETECTOR_HPP

#include "LakeStrat.hpp"
#include "DepthProfile.hpp"
#include "WaterDensity.hpp"
#include <optional>
#include <vector>

namespace LakeStrat {

/**
 * @brief Thermocline search parameters
 *
 * Seasonal defaults follow Read et al. (2011): a seasonal peak must exceed
 * both 15 % of the strongest gradient and 0.1 kg/m³/m.
 */
struct ThermoclineConfig {
    double resolution = Constants::DEFAULT_RESOLUTION;  // m, fine grid
    double mixed_cutoff = 1.0;               // °C, smaller range = mixed
    double stratified_min_gradient = 0.0;    // kg/m³/m, max gradient must exceed
    double seasonal_min_gradient = 0.1;      // kg/m³/m (Smin)
    double seasonal_peak_fraction = 0.15;    // of the maximum gradient
    double plateau_tolerance = 1e-6;         // relative, equal-gradient run
};

/**
 * @brief Metalimnion boundary criterion
 */
struct MetalimnionConfig {
    double gradient_fraction = 0.1;          // of the maximum gradient
    bool use_absolute_slope = false;
    double absolute_slope = 0.1;             // kg/m³/m when use_absolute_slope
};

/**
 * @brief Density gradient on the fine grid
 *
 * gradient[i] is dρ/dz over [depths[i], depths[i+1]], located at
 * midpoints[i]. Positive values are stable stratification.
 */
struct DensityGradient {
    std::vector<double> depths;
    std::vector<double> midpoints;
    std::vector<double> gradient;

    size_t size() const { return gradient.size(); }
    double maxGradient() const;
    size_t maxIndex() const;

    /// Gradient interpolated between midpoints, held constant beyond them
    double gradientAt(double depth) const;
};

/**
 * @brief Outcome of a thermocline search
 */
struct ThermoclineResult {
    bool stratified = false;
    double depth = undefinedValue();          // steepest density gradient
    double seasonal_depth = undefinedValue(); // deepest significant gradient
    double max_gradient = undefinedValue();   // kg/m³/m
    DensityGradient gradient;

    double depthFor(bool seasonal) const { return seasonal ? seasonal_depth : depth; }
};

/**
 * @brief Thermocline and metalimnion detection from a temperature profile
 *
 * Densities at the measured depths are resampled onto a fine grid before
 * the gradient search, giving thermocline estimates finer than the sensor
 * spacing. The detector holds only its configuration.
 */
class StratificationDetector {
public:
    StratificationDetector();
    StratificationDetector(const WaterDensityModel& density_model,
                           const ThermoclineConfig& thermo_config,
                           const MetalimnionConfig& meta_config);

    /**
     * @brief Density gradient of a temperature profile on the fine grid
     * @throws InvalidInputError for malformed or incomplete profiles
     */
    DensityGradient densityGradient(const DepthProfile& temperature) const;

    /**
     * @brief Full thermocline search (plain and seasonal)
     *
     * Mixed or inversely stratified profiles return stratified = false.
     */
    ThermoclineResult findThermocline(const DepthProfile& temperature) const;

    /**
     * @brief Thermocline depth, std::nullopt when the column is not stratified
     */
    std::optional<double> thermoclineDepth(const DepthProfile& temperature,
                                           bool seasonal = true) const;

    /**
     * @brief Metalimnion top and bottom around the thermocline
     *
     * Bounds default to the shallowest/deepest measurement when the gradient
     * never drops below the threshold. top <= thermocline <= bottom.
     */
    std::optional<Layer> metalimnionDepths(const DepthProfile& temperature,
                                           bool seasonal = true) const;

    /// Metalimnion from an existing search, avoids repeating it
    Layer metalimnionFromThermocline(const ThermoclineResult& result, bool seasonal) const;

    const ThermoclineConfig& getThermoclineConfig() const { return thermo_config_; }
    const MetalimnionConfig& getMetalimnionConfig() const { return meta_config_; }
    const WaterDensityModel& getDensityModel() const { return density_model_; }

private:
    WaterDensityModel density_model_;
    ThermoclineConfig thermo_config_;
    MetalimnionConfig meta_config_;

    struct Plateau {
        size_t lo;
        size_t hi;
    };

    Plateau plateauAround(const std::vector<double>& g, size_t i, double tol) const;
    double refinePeak(const DensityGradient& dg, const Plateau& p) const;
};

} // namespace LakeStrat

#endif // STRATIFICATION_DETECTOR_HPP
