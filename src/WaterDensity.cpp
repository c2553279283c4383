#include "WaterDensity.hpp"
#include "StratErrors.hpp"
#include <cmath>
#include <sstream>

namespace LakeStrat {

WaterDensityModel::WaterDensityModel() {}

WaterDensityModel::WaterDensityModel(const DensityConfig& config) : config_(config) {
    if (config_.check_range && config_.min_temperature >= config_.max_temperature) {
        throw DomainError("WaterDensityModel: empty valid temperature range");
    }
    if (config_.salinity < 0.0) {
        throw DomainError("WaterDensityModel: negative salinity");
    }
}

double WaterDensityModel::martinMcCutcheon(double T) {
    return 1000.0 * (1.0 - (T + 288.9414) * (T - 3.9863) * (T - 3.9863) /
                           (508929.2 * (T + 68.12963)));
}

double WaterDensityModel::unesco(double T, double S) {
    // Pure water at one atmosphere
    double rho0 = 999.842594 + 6.793952e-2 * T - 9.095290e-3 * T * T
                + 1.001685e-4 * T * T * T - 1.120083e-6 * T * T * T * T
                + 6.536335e-9 * T * T * T * T * T;

    double A = 8.24493e-1 - 4.0899e-3 * T + 7.6438e-5 * T * T
             - 8.2467e-7 * T * T * T + 5.3875e-9 * T * T * T * T;
    double B = -5.72466e-3 + 1.0227e-4 * T - 1.6546e-6 * T * T;
    double C = 4.8314e-4;

    return rho0 + A * S + B * std::pow(S, 1.5) + C * S * S;
}

void WaterDensityModel::checkTemperature(double temperature) const {
    if (!std::isfinite(temperature)) {
        throw DomainError("WaterDensityModel: non-finite temperature");
    }
    if (config_.check_range &&
        (temperature < config_.min_temperature || temperature > config_.max_temperature)) {
        std::ostringstream msg;
        msg << "WaterDensityModel: temperature " << temperature << " C outside ["
            << config_.min_temperature << ", " << config_.max_temperature << "]";
        throw DomainError(msg.str());
    }
}

double WaterDensityModel::density(double temperature) const {
    return density(temperature, config_.salinity);
}

double WaterDensityModel::density(double temperature, double salinity) const {
    checkTemperature(temperature);
    if (!std::isfinite(salinity) || salinity < 0.0) {
        throw DomainError("WaterDensityModel: invalid salinity");
    }

    if (config_.formula == DensityFormula::UNESCO || salinity != 0.0) {
        return unesco(temperature, salinity);
    }
    return martinMcCutcheon(temperature);
}

std::vector<double> WaterDensityModel::density(const std::vector<double>& temperatures) const {
    std::vector<double> rho(temperatures.size());
    for (size_t i = 0; i < temperatures.size(); ++i) {
        rho[i] = density(temperatures[i]);
    }
    return rho;
}

DepthProfile WaterDensityModel::densityProfile(const DepthProfile& temperature) const {
    return DepthProfile(temperature.depths, density(temperature.values));
}

} // namespace LakeStrat
