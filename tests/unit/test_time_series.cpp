/**
 * @file test_time_series.cpp
 * @brief Unit tests for series containers, wind alignment and result tables
 */

#include <gtest/gtest.h>
#include "TimeSeries.hpp"
#include "StratErrors.hpp"
#include <cmath>

using namespace LakeStrat;

class TimeSeriesTest : public ::testing::Test {
protected:
    void SetUp() override {
        depths = {0.0, 2.0, 4.0};
        times = {0, 3600, 7200};
        table = {{20.0, 18.0, 10.0},
                 {21.0, NAN, 10.5},
                 {22.0, 19.0, 11.0}};
    }

    std::vector<double> depths;
    std::vector<Timestamp> times;
    std::vector<std::vector<double>> table;
};

// ============================================================================
// TemperatureSeries
// ============================================================================

TEST_F(TimeSeriesTest, FromTableKeepsRowsAndMissingValues) {
    TemperatureSeries series = TemperatureSeries::fromTable(depths, times, table);

    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(series.row(1).time, 3600);
    EXPECT_TRUE(series.row(1).profile.hasMissingValues());
    EXPECT_FALSE(series.row(0).profile.hasMissingValues());
    EXPECT_TRUE(series.hasFixedDepths());
    EXPECT_EQ(series.times(), times);
}

TEST_F(TimeSeriesTest, FromTableRejectsRaggedRows) {
    table[2].pop_back();
    EXPECT_THROW(TemperatureSeries::fromTable(depths, times, table), InvalidInputError);

    std::vector<Timestamp> short_times = {0, 3600};
    EXPECT_THROW(TemperatureSeries::fromTable(depths, short_times, table), InvalidInputError);
}

TEST_F(TimeSeriesTest, TimestampsMustIncrease) {
    times[2] = 3600;
    EXPECT_THROW(TemperatureSeries::fromTable(depths, times, table), AlignmentError);

    TemperatureSeries series;
    series.addRow(100, DepthProfile({0.0, 1.0}, {10.0, 9.0}));
    EXPECT_THROW(series.addRow(50, DepthProfile({0.0, 1.0}, {10.0, 9.0})), AlignmentError);
    EXPECT_EQ(series.size(), 1u);
}

TEST_F(TimeSeriesTest, VariableDepthsAreDetected) {
    TemperatureSeries series;
    series.addRow(0, DepthProfile({0.0, 1.0, 2.0}, {10.0, 9.0, 8.0}));
    series.addRow(1, DepthProfile({0.0, 1.5, 2.0}, {10.0, 9.0, 8.0}));
    EXPECT_FALSE(series.hasFixedDepths());
    EXPECT_THROW(series.row(5), std::out_of_range);
}

// ============================================================================
// Wind Alignment
// ============================================================================

TEST_F(TimeSeriesTest, ExactAlignmentIgnoresExtraWindRows) {
    TemperatureSeries series = TemperatureSeries::fromTable(depths, times, table);
    ScalarSeries wind({0, 1800, 3600, 7200}, {2.0, 9.0, 3.0, 4.0});

    std::vector<double> aligned = alignWind(series, wind);
    ASSERT_EQ(aligned.size(), 3u);
    EXPECT_DOUBLE_EQ(aligned[0], 2.0);
    EXPECT_DOUBLE_EQ(aligned[1], 3.0);
    EXPECT_DOUBLE_EQ(aligned[2], 4.0);
}

TEST_F(TimeSeriesTest, ExactAlignmentFailsOnMissingTimestamp) {
    TemperatureSeries series = TemperatureSeries::fromTable(depths, times, table);
    ScalarSeries wind({0, 3600}, {2.0, 3.0});
    EXPECT_THROW(alignWind(series, wind, WindJoinPolicy::EXACT), AlignmentError);
}

TEST_F(TimeSeriesTest, InterpolatedAlignment) {
    TemperatureSeries series = TemperatureSeries::fromTable(depths, times, table);
    ScalarSeries wind({1800, 5400}, {2.0, 4.0});

    std::vector<double> aligned = alignWind(series, wind, WindJoinPolicy::LINEAR_INTERPOLATION);
    ASSERT_EQ(aligned.size(), 3u);
    EXPECT_TRUE(std::isnan(aligned[0]));
    EXPECT_DOUBLE_EQ(aligned[1], 3.0);
    EXPECT_TRUE(std::isnan(aligned[2]));
}

TEST_F(TimeSeriesTest, WindSeriesValidation) {
    TemperatureSeries series = TemperatureSeries::fromTable(depths, times, table);
    ScalarSeries mismatched({0, 3600, 7200}, {1.0, 2.0});
    EXPECT_THROW(alignWind(series, mismatched), InvalidInputError);

    ScalarSeries unordered({0, 7200, 3600}, {1.0, 2.0, 3.0});
    EXPECT_THROW(unordered.validate(), AlignmentError);
}

// ============================================================================
// ResultTable
// ============================================================================

TEST_F(TimeSeriesTest, ResultTableColumnsAndStatus) {
    ResultTable result;
    result.columns = {"top", "bottom"};
    result.rows.push_back(ResultRow{0, {1.0, 4.0}, RowStatus::OK});
    result.rows.push_back(ResultRow{1, {NAN, NAN}, RowStatus::MISSING_INPUT});
    result.rows.push_back(ResultRow{2, {NAN, NAN}, RowStatus::NOT_STRATIFIED});

    EXPECT_EQ(result.size(), 3u);
    EXPECT_EQ(result.columnIndex("bottom"), 1u);
    EXPECT_THROW(result.columnIndex("depth"), std::out_of_range);

    std::vector<double> bottom = result.column("bottom");
    EXPECT_DOUBLE_EQ(bottom[0], 4.0);
    EXPECT_TRUE(std::isnan(bottom[1]));

    EXPECT_TRUE(result.rows[0].defined());
    EXPECT_FALSE(result.rows[2].defined());
    EXPECT_EQ(result.countStatus(RowStatus::MISSING_INPUT), 1u);
    EXPECT_EQ(result.countStatus(RowStatus::FAILED), 0u);
}

TEST_F(TimeSeriesTest, StatusNames) {
    EXPECT_EQ(rowStatusToString(RowStatus::OK), "OK");
    EXPECT_EQ(rowStatusToString(RowStatus::NOT_STRATIFIED), "NOT_STRATIFIED");
    EXPECT_EQ(rowStatusToString(RowStatus::DEPTH_MISMATCH), "DEPTH_MISMATCH");
}
