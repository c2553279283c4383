#ifndef LAYER_INTEGRATOR_HPP
#define LAYER_INTEGRATOR_HPP

#include "LakeStrat.hpp"
#include "Bathymetry.hpp"
#include "DepthProfile.hpp"
#include "WaterDensity.hpp"
#include <functional>

namespace LakeStrat {

/**
 * @brief Volume-weighted layer averages over the lake basin
 *
 * Between integration nodes (layer bounds, bathymetry rows and measured
 * depths) both the field and the area are linear, so the integral of
 * field * area is evaluated exactly. Field values beyond the measured range
 * are held at the nearest measurement.
 *
 * The integrator refers to the bathymetry, which must outlive it.
 */
class LayerIntegrator {
public:
    using Transform = std::function<double(double)>;

    explicit LayerIntegrator(const Bathymetry& bathymetry);

    /**
     * @brief Volume-weighted mean of a field over [top, bottom]
     * @param field Depth profile of the field
     * @param top Upper bound (m)
     * @param bottom Lower bound (m), clipped to the lake bottom
     * @param transform Optional pointwise transform applied to the field
     * @throws EmptyLayerError for degenerate or zero-volume layers, or a
     *         layer entirely outside the measured range
     * @throws OutOfRangeError when top is above the surface
     */
    double layerAverage(const DepthProfile& field, double top, double bottom,
                        const Transform& transform = Transform()) const;

    double layerAverage(const DepthProfile& field, const Layer& layer) const {
        return layerAverage(field, layer.top, layer.bottom);
    }

    /// Mean temperature of the layer (°C)
    double layerTemperature(const DepthProfile& temperature, double top, double bottom) const;

    /// Mean density of the layer (kg/m³), density evaluated node by node
    double layerDensity(const DepthProfile& temperature, double top, double bottom,
                        const WaterDensityModel& density_model) const;

    /// Volume of [top, bottom] after clipping to the basin
    double layerVolume(double top, double bottom) const;

    const Bathymetry& getBathymetry() const { return bathymetry_; }

private:
    const Bathymetry& bathymetry_;
};

} // namespace LakeStrat

#endif // LAYER_INTEGRATOR_HPP
