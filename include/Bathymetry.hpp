#ifndef BATHYMETRY_HPP
#define BATHYMETRY_HPP

#include "LakeStrat.hpp"
#include <vector>

namespace LakeStrat {

/**
 * @brief Lake hypsography: horizontal area as a function of depth
 *
 * Immutable depth/area table, first row at the surface (depth 0), depths
 * strictly increasing, areas non-negative and non-increasing with depth.
 * Area is linear between rows, so volumes and moments over the table are
 * integrated exactly.
 */
class Bathymetry {
public:
    /**
     * @brief Build from a depth/area table
     * @param depths Depths in m, starting at 0
     * @param areas Areas in m² at each depth
     * @throws InvalidInputError when the table violates its invariants
     */
    Bathymetry(std::vector<double> depths, std::vector<double> areas);

    /**
     * @brief Approximate hypsography of a cone-shaped basin
     *
     * Used when only maximum depth and surface area are known.
     * A(z) = A0 ((zmax - z) / zmax)^2, sampled every interval metres.
     */
    static Bathymetry cone(double max_depth, double surface_area, double interval = 1.0);

    const std::vector<double>& depths() const { return depths_; }
    const std::vector<double>& areas() const { return areas_; }
    size_t size() const { return depths_.size(); }

    double minDepth() const { return depths_.front(); }
    double maxDepth() const { return depths_.back(); }
    double surfaceArea() const { return areas_.front(); }

    /**
     * @brief Area at an arbitrary depth by linear interpolation
     * @throws OutOfRangeError outside [0, maxDepth]
     */
    double areaAt(double depth) const;

    /**
     * @brief Volume between two depths (m³)
     * @throws OutOfRangeError if top > bottom or either lies outside the table
     */
    double volumeBetween(double top, double bottom) const;

    double totalVolume() const;

    /**
     * @brief Depth of the center of volume, integral(z A dz) / integral(A dz)
     */
    double centerOfVolume() const;

    /// Total volume divided by surface area
    double meanDepth() const;

    /**
     * @brief top, every table depth strictly inside (top, bottom), bottom
     */
    std::vector<double> nodesBetween(double top, double bottom) const;

private:
    std::vector<double> depths_;
    std::vector<double> areas_;

    void checkRange(double depth, const char* what) const;
};

} // namespace LakeStrat

#endif // BATHYMETRY_HPP
