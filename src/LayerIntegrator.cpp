#include "LayerIntegrator.hpp"
#include "ProfileInterpolator.hpp"
#include "StratErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace LakeStrat {

LayerIntegrator::LayerIntegrator(const Bathymetry& bathymetry) : bathymetry_(bathymetry) {}

double LayerIntegrator::layerVolume(double top, double bottom) const {
    double b = std::min(bottom, bathymetry_.maxDepth());
    if (!(b > top)) return 0.0;
    return bathymetry_.volumeBetween(top, b);
}

double LayerIntegrator::layerAverage(const DepthProfile& field, double top, double bottom,
                                     const Transform& transform) const {
    field.validateComplete(1);

    if (!std::isfinite(top) || !std::isfinite(bottom) || bottom <= top) {
        std::ostringstream msg;
        msg << "LayerIntegrator: degenerate layer [" << top << ", " << bottom << "]";
        throw EmptyLayerError(msg.str());
    }
    if (top < bathymetry_.minDepth()) {
        throw OutOfRangeError("LayerIntegrator: layer top above the lake surface");
    }
    if (bottom < field.minDepth() || top > field.maxDepth() ||
        (field.size() > 1 && (bottom == field.minDepth() || top == field.maxDepth()))) {
        throw EmptyLayerError("LayerIntegrator: layer lies outside the measured range");
    }

    double b = std::min(bottom, bathymetry_.maxDepth());
    if (!(b > top)) {
        throw EmptyLayerError("LayerIntegrator: layer lies below the lake bottom");
    }

    // Nodes: layer bounds, bathymetry rows and measured depths
    std::vector<double> nodes = bathymetry_.nodesBetween(top, b);
    for (double z : field.depths) {
        if (z > top && z < b) nodes.push_back(z);
    }
    std::sort(nodes.begin(), nodes.end());
    nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());

    std::vector<double> f(nodes.size());
    std::vector<double> A(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        double v = ProfileInterpolator::valueAtClamped(field, nodes[i]);
        f[i] = transform ? transform(v) : v;
        A[i] = bathymetry_.areaAt(nodes[i]);
    }

    double weighted = 0.0;
    double volume = 0.0;
    for (size_t i = 1; i < nodes.size(); ++i) {
        double h = nodes[i] - nodes[i-1];
        volume += 0.5 * h * (A[i-1] + A[i]);
        weighted += h / 6.0 * (2.0 * f[i-1] * A[i-1] + f[i-1] * A[i]
                              + f[i] * A[i-1] + 2.0 * f[i] * A[i]);
    }

    if (!(volume > 0.0)) {
        throw EmptyLayerError("LayerIntegrator: layer has zero volume");
    }
    return weighted / volume;
}

double LayerIntegrator::layerTemperature(const DepthProfile& temperature,
                                         double top, double bottom) const {
    return layerAverage(temperature, top, bottom);
}

double LayerIntegrator::layerDensity(const DepthProfile& temperature, double top, double bottom,
                                     const WaterDensityModel& density_model) const {
    return layerAverage(temperature, top, bottom,
                        [&density_model](double t) { return density_model.density(t); });
}

} // namespace LakeStrat
