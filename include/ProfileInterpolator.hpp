#ifndef PROFILE_INTERPOLATOR_HPP
#define PROFILE_INTERPOLATOR_HPP

#include "LakeStrat.hpp"
#include "DepthProfile.hpp"
#include <vector>

namespace LakeStrat {

/**
 * @brief Linear resampling of sparse depth profiles
 *
 * Produces a fine grid min + k*resolution over the measured range (the
 * deepest measurement is always the last grid point) so that extremum
 * searches are not limited to the sensor spacing.
 */
class ProfileInterpolator {
public:
    explicit ProfileInterpolator(double resolution = Constants::DEFAULT_RESOLUTION);

    double resolution() const { return resolution_; }

    /**
     * @brief Resample onto the fine grid, no extrapolation
     * @throws InvalidInputError for profiles with fewer than 2 points
     */
    DepthProfile resample(const DepthProfile& profile) const;

    /**
     * @brief Fine grid depths spanning [top, bottom]
     */
    std::vector<double> grid(double top, double bottom) const;

    /**
     * @brief Linear interpolation inside the measured range
     * @throws OutOfRangeError outside [minDepth, maxDepth]
     */
    double valueAt(const DepthProfile& profile, double depth) const;

    std::vector<double> valuesAt(const DepthProfile& profile,
                                 const std::vector<double>& depths) const;

    /**
     * @brief Like valueAt, but holds the end values beyond the measured range
     */
    static double valueAtClamped(const DepthProfile& profile, double depth);

private:
    double resolution_;
};

} // namespace LakeStrat

#endif // PROFILE_INTERPOLATOR_HPP
