#include "TimeSeries.hpp"
#include "StratErrors.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace LakeStrat {

std::string rowStatusToString(RowStatus status) {
    switch (status) {
        case RowStatus::OK:              return "OK";
        case RowStatus::MISSING_INPUT:   return "MISSING_INPUT";
        case RowStatus::NOT_STRATIFIED:  return "NOT_STRATIFIED";
        case RowStatus::OUT_OF_RANGE:    return "OUT_OF_RANGE";
        case RowStatus::DOMAIN_ERROR:    return "DOMAIN_ERROR";
        case RowStatus::EMPTY_LAYER:     return "EMPTY_LAYER";
        case RowStatus::UNDEFINED_INDEX: return "UNDEFINED_INDEX";
        case RowStatus::ALIGNMENT:       return "ALIGNMENT";
        case RowStatus::INVALID_INPUT:   return "INVALID_INPUT";
        case RowStatus::DEPTH_MISMATCH:  return "DEPTH_MISMATCH";
        case RowStatus::FAILED:          return "FAILED";
    }
    return "UNKNOWN";
}

// =============================================================================
// TemperatureSeries
// =============================================================================

TemperatureSeries TemperatureSeries::fromTable(const std::vector<double>& depths,
                                               const std::vector<Timestamp>& times,
                                               const std::vector<std::vector<double>>& table) {
    if (times.size() != table.size()) {
        throw InvalidInputError("TemperatureSeries: " + std::to_string(times.size()) +
                                " timestamps for " + std::to_string(table.size()) + " rows");
    }

    TemperatureSeries series;
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i].size() != depths.size()) {
            throw InvalidInputError("TemperatureSeries: row " + std::to_string(i) + " has " +
                                    std::to_string(table[i].size()) + " values for " +
                                    std::to_string(depths.size()) + " depths");
        }
        series.addRow(times[i], DepthProfile(depths, table[i]));
    }
    return series;
}

void TemperatureSeries::addRow(Timestamp time, DepthProfile profile) {
    if (!rows_.empty() && time <= rows_.back().time) {
        throw AlignmentError("TemperatureSeries: timestamp " + std::to_string(time) +
                             " does not follow " + std::to_string(rows_.back().time));
    }
    rows_.push_back(ProfileRow{time, std::move(profile)});
}

std::vector<Timestamp> TemperatureSeries::times() const {
    std::vector<Timestamp> t;
    t.reserve(rows_.size());
    for (const auto& r : rows_) {
        t.push_back(r.time);
    }
    return t;
}

bool TemperatureSeries::hasFixedDepths() const {
    for (const auto& r : rows_) {
        if (!r.profile.sameDepths(rows_.front().profile)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// ScalarSeries
// =============================================================================

ScalarSeries::ScalarSeries(std::vector<Timestamp> times_, std::vector<double> values_)
    : times(std::move(times_)), values(std::move(values_)) {}

void ScalarSeries::validate() const {
    if (times.size() != values.size()) {
        throw InvalidInputError("ScalarSeries: timestamps and values differ in length");
    }
    for (size_t i = 1; i < times.size(); ++i) {
        if (times[i] <= times[i-1]) {
            throw AlignmentError("ScalarSeries: timestamps must be strictly increasing");
        }
    }
}

std::vector<double> alignWind(const TemperatureSeries& temperature,
                              const ScalarSeries& wind,
                              WindJoinPolicy policy) {
    wind.validate();

    std::vector<double> aligned(temperature.size(), undefinedValue());
    for (size_t i = 0; i < temperature.size(); ++i) {
        Timestamp t = temperature.row(i).time;
        auto it = std::lower_bound(wind.times.begin(), wind.times.end(), t);
        size_t j = it - wind.times.begin();

        if (it != wind.times.end() && *it == t) {
            aligned[i] = wind.values[j];
            continue;
        }

        if (policy == WindJoinPolicy::EXACT) {
            throw AlignmentError("no wind observation at timestamp " + std::to_string(t));
        }

        // Interpolate between the bracketing observations
        if (j == 0 || j == wind.times.size()) {
            continue;
        }
        double t0 = static_cast<double>(wind.times[j-1]);
        double t1 = static_cast<double>(wind.times[j]);
        double w = (static_cast<double>(t) - t0) / (t1 - t0);
        aligned[i] = wind.values[j-1] + w * (wind.values[j] - wind.values[j-1]);
    }
    return aligned;
}

// =============================================================================
// ResultTable
// =============================================================================

size_t ResultTable::columnIndex(const std::string& name) const {
    auto it = std::find(columns.begin(), columns.end(), name);
    if (it == columns.end()) {
        throw std::out_of_range("ResultTable: no column named " + name);
    }
    return it - columns.begin();
}

std::vector<double> ResultTable::column(const std::string& name) const {
    size_t c = columnIndex(name);
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        out.push_back(r.values[c]);
    }
    return out;
}

size_t ResultTable::countStatus(RowStatus status) const {
    return std::count_if(rows.begin(), rows.end(),
                         [status](const ResultRow& r) { return r.status == status; });
}

} // namespace LakeStrat
