#include "DepthProfile.hpp"
#include "StratErrors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace LakeStrat {

DepthProfile::DepthProfile(std::vector<double> depths_, std::vector<double> values_)
    : depths(std::move(depths_)), values(std::move(values_)) {}

double DepthProfile::minDepth() const {
    if (depths.empty()) {
        throw InvalidInputError("DepthProfile: empty profile");
    }
    return depths.front();
}

double DepthProfile::maxDepth() const {
    if (depths.empty()) {
        throw InvalidInputError("DepthProfile: empty profile");
    }
    return depths.back();
}

double DepthProfile::minValue() const {
    if (values.empty()) {
        throw InvalidInputError("DepthProfile: empty profile");
    }
    return *std::min_element(values.begin(), values.end());
}

double DepthProfile::maxValue() const {
    if (values.empty()) {
        throw InvalidInputError("DepthProfile: empty profile");
    }
    return *std::max_element(values.begin(), values.end());
}

bool DepthProfile::hasMissingValues() const {
    return std::any_of(values.begin(), values.end(),
                       [](double v) { return !std::isfinite(v); });
}

bool DepthProfile::sameDepths(const DepthProfile& other) const {
    return depths == other.depths;
}

void DepthProfile::validate(std::size_t min_points) const {
    if (depths.size() != values.size()) {
        throw InvalidInputError("DepthProfile: " + std::to_string(depths.size()) +
                                " depths but " + std::to_string(values.size()) + " values");
    }
    if (depths.size() < min_points) {
        throw InvalidInputError("DepthProfile: at least " + std::to_string(min_points) +
                                " points required, got " + std::to_string(depths.size()));
    }
    for (size_t i = 0; i < depths.size(); ++i) {
        if (!std::isfinite(depths[i]) || depths[i] < 0.0) {
            throw InvalidInputError("DepthProfile: invalid depth " + std::to_string(depths[i]));
        }
        if (i > 0 && depths[i] <= depths[i-1]) {
            throw InvalidInputError("DepthProfile: depths must be strictly increasing");
        }
    }
}

void DepthProfile::validateComplete(std::size_t min_points) const {
    validate(min_points);
    if (hasMissingValues()) {
        throw InvalidInputError("DepthProfile: profile contains missing values");
    }
}

} // namespace LakeStrat
