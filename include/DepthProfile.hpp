#ifndef DEPTH_PROFILE_HPP
#define DEPTH_PROFILE_HPP

#include "LakeStrat.hpp"
#include <cstddef>
#include <vector>

namespace LakeStrat {

/**
 * @brief Depth-indexed measurement (temperature, density, ...)
 *
 * Depths are in metres, positive downward from the surface and strictly
 * increasing. depths and values are paired one to one.
 */
struct DepthProfile {
    std::vector<double> depths;
    std::vector<double> values;

    DepthProfile() = default;
    DepthProfile(std::vector<double> depths_, std::vector<double> values_);

    std::size_t size() const { return depths.size(); }
    bool empty() const { return depths.empty(); }

    double minDepth() const;
    double maxDepth() const;
    double minValue() const;
    double maxValue() const;

    /**
     * @brief True when any value is NaN or infinite
     */
    bool hasMissingValues() const;

    /**
     * @brief True when both profiles are sampled at the same depths
     */
    bool sameDepths(const DepthProfile& other) const;

    /**
     * @brief Check structural invariants
     * @param min_points Minimum number of samples required
     * @throws InvalidInputError on size mismatch, too few points,
     *         negative, non-finite or non-increasing depths
     */
    void validate(std::size_t min_points = 2) const;

    /**
     * @brief validate() plus a check that all values are finite
     */
    void validateComplete(std::size_t min_points = 2) const;
};

} // namespace LakeStrat

#endif // DEPTH_PROFILE_HPP
