#include "ProfileInterpolator.hpp"
#include "StratErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace LakeStrat {

namespace {

double interpolateSegment(const DepthProfile& p, size_t i, double depth) {
    // i is the index of the upper bound, p.depths[i-1] < depth <= p.depths[i]
    double t = (depth - p.depths[i-1]) / (p.depths[i] - p.depths[i-1]);
    return p.values[i-1] + t * (p.values[i] - p.values[i-1]);
}

} // anonymous namespace

ProfileInterpolator::ProfileInterpolator(double resolution) : resolution_(resolution) {
    if (!(resolution_ > 0.0) || !std::isfinite(resolution_)) {
        throw DomainError("ProfileInterpolator: resolution must be positive");
    }
}

std::vector<double> ProfileInterpolator::grid(double top, double bottom) const {
    std::vector<double> z;
    if (!(bottom >= top)) {
        return z;
    }
    // Last regular point must stay clear of bottom to avoid a sliver interval
    double tol = 1e-6 * resolution_;
    for (long k = 0; top + k * resolution_ < bottom - tol; ++k) {
        z.push_back(top + k * resolution_);
    }
    z.push_back(bottom);
    return z;
}

DepthProfile ProfileInterpolator::resample(const DepthProfile& profile) const {
    profile.validate(2);

    DepthProfile fine;
    fine.depths = grid(profile.minDepth(), profile.maxDepth());
    fine.values.reserve(fine.depths.size());

    size_t seg = 1;
    for (double z : fine.depths) {
        while (seg < profile.size() - 1 && z > profile.depths[seg]) {
            ++seg;
        }
        if (z <= profile.depths.front()) {
            fine.values.push_back(profile.values.front());
        } else {
            fine.values.push_back(interpolateSegment(profile, seg, z));
        }
    }
    return fine;
}

double ProfileInterpolator::valueAt(const DepthProfile& profile, double depth) const {
    profile.validate(1);
    if (!(depth >= profile.minDepth() && depth <= profile.maxDepth())) {
        std::ostringstream msg;
        msg << "ProfileInterpolator: depth " << depth << " outside measured range ["
            << profile.minDepth() << ", " << profile.maxDepth() << "]";
        throw OutOfRangeError(msg.str());
    }
    return valueAtClamped(profile, depth);
}

std::vector<double> ProfileInterpolator::valuesAt(const DepthProfile& profile,
                                                  const std::vector<double>& depths) const {
    std::vector<double> out;
    out.reserve(depths.size());
    for (double z : depths) {
        out.push_back(valueAt(profile, z));
    }
    return out;
}

double ProfileInterpolator::valueAtClamped(const DepthProfile& profile, double depth) {
    if (profile.empty()) {
        throw InvalidInputError("ProfileInterpolator: empty profile");
    }
    if (!std::isfinite(depth)) {
        throw OutOfRangeError("ProfileInterpolator: non-finite depth");
    }
    if (depth <= profile.depths.front()) return profile.values.front();
    if (depth >= profile.depths.back()) return profile.values.back();

    auto it = std::lower_bound(profile.depths.begin(), profile.depths.end(), depth);
    size_t i = it - profile.depths.begin();
    if (profile.depths[i] == depth) return profile.values[i];
    return interpolateSegment(profile, i, depth);
}

} // namespace LakeStrat
