#include "Bathymetry.hpp"
#include "StratErrors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace LakeStrat {

Bathymetry::Bathymetry(std::vector<double> depths, std::vector<double> areas)
    : depths_(std::move(depths)), areas_(std::move(areas)) {

    if (depths_.size() != areas_.size()) {
        throw InvalidInputError("Bathymetry: depth and area columns differ in length");
    }
    if (depths_.size() < 2) {
        throw InvalidInputError("Bathymetry: at least two rows required");
    }
    if (depths_.front() != 0.0) {
        throw InvalidInputError("Bathymetry: first row must be at the surface (depth 0)");
    }

    for (size_t i = 0; i < depths_.size(); ++i) {
        if (!std::isfinite(depths_[i]) || !std::isfinite(areas_[i])) {
            throw InvalidInputError("Bathymetry: non-finite entry in row " + std::to_string(i));
        }
        if (areas_[i] < 0.0) {
            throw InvalidInputError("Bathymetry: negative area in row " + std::to_string(i));
        }
        if (i > 0) {
            if (depths_[i] <= depths_[i-1]) {
                throw InvalidInputError("Bathymetry: depths must be strictly increasing");
            }
            if (areas_[i] > areas_[i-1]) {
                throw InvalidInputError("Bathymetry: area increases with depth at row " +
                                        std::to_string(i));
            }
        }
    }
}

Bathymetry Bathymetry::cone(double max_depth, double surface_area, double interval) {
    if (!(max_depth > 0.0) || !(surface_area > 0.0) || !(interval > 0.0)) {
        throw DomainError("Bathymetry::cone: depth, area and interval must be positive");
    }

    std::vector<double> depths;
    std::vector<double> areas;
    for (int k = 0; k * interval < max_depth - 1e-9 * interval; ++k) {
        double z = k * interval;
        double r = (max_depth - z) / max_depth;
        depths.push_back(z);
        areas.push_back(surface_area * r * r);
    }
    depths.push_back(max_depth);
    areas.push_back(0.0);

    return Bathymetry(std::move(depths), std::move(areas));
}

void Bathymetry::checkRange(double depth, const char* what) const {
    if (!(depth >= depths_.front() && depth <= depths_.back())) {
        std::ostringstream msg;
        msg << "Bathymetry: " << what << " depth " << depth
            << " outside [" << depths_.front() << ", " << depths_.back() << "]";
        throw OutOfRangeError(msg.str());
    }
}

double Bathymetry::areaAt(double depth) const {
    checkRange(depth, "query");

    auto it = std::lower_bound(depths_.begin(), depths_.end(), depth);
    size_t i = it - depths_.begin();
    if (i == 0) return areas_.front();
    if (depths_[i] == depth) return areas_[i];

    double t = (depth - depths_[i-1]) / (depths_[i] - depths_[i-1]);
    return areas_[i-1] + t * (areas_[i] - areas_[i-1]);
}

std::vector<double> Bathymetry::nodesBetween(double top, double bottom) const {
    std::vector<double> nodes;
    nodes.push_back(top);
    for (double z : depths_) {
        if (z > top && z < bottom) {
            nodes.push_back(z);
        }
    }
    if (bottom > top) {
        nodes.push_back(bottom);
    }
    return nodes;
}

double Bathymetry::volumeBetween(double top, double bottom) const {
    checkRange(top, "top");
    checkRange(bottom, "bottom");
    if (top > bottom) {
        throw OutOfRangeError("Bathymetry: top below bottom in volume query");
    }

    std::vector<double> nodes = nodesBetween(top, bottom);
    double volume = 0.0;
    double a_prev = areaAt(nodes.front());
    for (size_t i = 1; i < nodes.size(); ++i) {
        double a = areaAt(nodes[i]);
        volume += 0.5 * (a_prev + a) * (nodes[i] - nodes[i-1]);
        a_prev = a;
    }
    return volume;
}

double Bathymetry::totalVolume() const {
    return volumeBetween(depths_.front(), depths_.back());
}

double Bathymetry::centerOfVolume() const {
    // Exact moments for area linear in depth on each segment
    double moment = 0.0;
    double volume = 0.0;
    for (size_t i = 1; i < depths_.size(); ++i) {
        double a = depths_[i-1], b = depths_[i];
        double Aa = areas_[i-1], Ab = areas_[i];
        double h = b - a;
        volume += 0.5 * h * (Aa + Ab);
        moment += h / 6.0 * (a * (2.0 * Aa + Ab) + b * (Aa + 2.0 * Ab));
    }
    if (volume <= 0.0) {
        throw UndefinedIndexError("Bathymetry: zero lake volume");
    }
    return moment / volume;
}

double Bathymetry::meanDepth() const {
    if (surfaceArea() <= 0.0) {
        throw UndefinedIndexError("Bathymetry: zero surface area");
    }
    return totalVolume() / surfaceArea();
}

} // namespace LakeStrat
