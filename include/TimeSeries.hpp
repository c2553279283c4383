#ifndef TIME_SERIES_HPP
#define TIME_SERIES_HPP

#include "LakeStrat.hpp"
#include "DepthProfile.hpp"
#include <string>
#include <vector>

namespace LakeStrat {

/**
 * @brief One timestamped profile
 */
struct ProfileRow {
    Timestamp time;
    DepthProfile profile;
};

/**
 * @brief Ordered series of temperature profiles
 *
 * Timestamps are strictly increasing. Depth sets may differ between rows.
 */
class TemperatureSeries {
public:
    TemperatureSeries() = default;

    /**
     * @brief Build from a wide table with one column per depth
     * @param depths Column depths (m)
     * @param times Row timestamps
     * @param table table[row][column] temperatures, NaN for missing
     * @throws InvalidInputError when a row length differs from depths
     * @throws AlignmentError when timestamps are not strictly increasing
     */
    static TemperatureSeries fromTable(const std::vector<double>& depths,
                                       const std::vector<Timestamp>& times,
                                       const std::vector<std::vector<double>>& table);

    /**
     * @brief Append a row
     * @throws AlignmentError if time does not follow the last row
     */
    void addRow(Timestamp time, DepthProfile profile);

    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    const ProfileRow& row(size_t i) const { return rows_.at(i); }
    const std::vector<ProfileRow>& rows() const { return rows_; }

    std::vector<Timestamp> times() const;

    /// True when every row shares the depths of the first row
    bool hasFixedDepths() const;

private:
    std::vector<ProfileRow> rows_;
};

/**
 * @brief Ordered series of scalar observations (e.g. wind speed)
 */
struct ScalarSeries {
    std::vector<Timestamp> times;
    std::vector<double> values;

    ScalarSeries() = default;
    ScalarSeries(std::vector<Timestamp> times_, std::vector<double> values_);

    size_t size() const { return times.size(); }

    /**
     * @throws InvalidInputError on length mismatch
     * @throws AlignmentError when timestamps are not strictly increasing
     */
    void validate() const;
};

/**
 * @brief Wind value for every temperature row
 *
 * EXACT requires a wind observation at each temperature timestamp.
 * LINEAR_INTERPOLATION interpolates in time and returns NaN for rows
 * outside the wind record.
 *
 * @throws AlignmentError when EXACT matching fails
 */
std::vector<double> alignWind(const TemperatureSeries& temperature,
                              const ScalarSeries& wind,
                              WindJoinPolicy policy = WindJoinPolicy::EXACT);

// =============================================================================
// Results
// =============================================================================

/**
 * @brief One output row, NaN values when status is not OK
 */
struct ResultRow {
    Timestamp time;
    std::vector<double> values;
    RowStatus status = RowStatus::OK;

    bool defined() const { return status == RowStatus::OK; }
};

/**
 * @brief Output of a series computation, one row per input row
 */
struct ResultTable {
    std::vector<std::string> columns;
    std::vector<ResultRow> rows;
    size_t failed_rows = 0;

    size_t size() const { return rows.size(); }

    /// @throws std::out_of_range for unknown column names
    size_t columnIndex(const std::string& name) const;
    std::vector<double> column(const std::string& name) const;
    size_t countStatus(RowStatus status) const;
};

} // namespace LakeStrat

#endif // TIME_SERIES_HPP
