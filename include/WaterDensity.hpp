#ifndef WATER_DENSITY_HPP
#define WATER_DENSITY_HPP

#include "LakeStrat.hpp"
#include "DepthProfile.hpp"
#include <vector>

namespace LakeStrat {

/**
 * @brief Density model settings
 */
struct DensityConfig {
    DensityFormula formula = DensityFormula::MARTIN_MCCUTCHEON;
    double salinity = 0.0;             // PSU, applied when no salinity is passed
    bool check_range = true;           // Disable for brackish or extreme waters
    double min_temperature = 0.0;      // °C
    double max_temperature = 40.0;     // °C
};

/**
 * @brief Temperature to water density
 *
 * Freshwater default is the Martin & McCutcheon (1999) polynomial. The
 * UNESCO (Millero & Poisson 1981) equation of state is used when selected
 * or when a non-zero salinity is supplied.
 */
class WaterDensityModel {
public:
    WaterDensityModel();
    explicit WaterDensityModel(const DensityConfig& config);

    /**
     * @brief Density at the configured salinity
     * @param temperature Water temperature (°C)
     * @return Density (kg/m³)
     * @throws DomainError when the temperature is outside the valid range
     */
    double density(double temperature) const;
    double density(double temperature, double salinity) const;

    std::vector<double> density(const std::vector<double>& temperatures) const;

    /**
     * @brief Density profile on the same depths as a temperature profile
     */
    DepthProfile densityProfile(const DepthProfile& temperature) const;

    const DensityConfig& getConfig() const { return config_; }

    // Raw equations, no range checking
    static double martinMcCutcheon(double temperature);
    static double unesco(double temperature, double salinity);

private:
    DensityConfig config_;

    void checkTemperature(double temperature) const;
};

} // namespace LakeStrat

#endif // WATER_DENSITY_HPP
