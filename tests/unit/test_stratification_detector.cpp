/**
 * @file test_stratification_detector.cpp
 * @brief Unit tests for thermocline and metalimnion detection
 */

#include <gtest/gtest.h>
#include "StratificationDetector.hpp"
#include "StratErrors.hpp"
#include <cmath>

using namespace LakeStrat;

class StratificationDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        summer = DepthProfile({0.0, 2.0, 4.0, 6.0, 8.0, 10.0},
                              {25.0, 24.0, 20.0, 12.0, 8.0, 7.0});
        mixed_top = DepthProfile({0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 8.0},
                                 {22.0, 22.0, 21.8, 16.0, 10.0, 8.0, 7.5, 7.2});
        // Diurnal thermocline near 3-5 m above the seasonal one near 9 m
        two_peaks = DepthProfile({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12},
                                 {22.0, 22.0, 22.0, 21.9, 18.0, 14.0, 13.5,
                                  13.3, 13.2, 10.0, 7.0, 6.8, 6.7});
    }

    StratificationDetector detector;
    DepthProfile summer;
    DepthProfile mixed_top;
    DepthProfile two_peaks;
};

// ============================================================================
// Density Gradient
// ============================================================================

TEST_F(StratificationDetectorTest, GradientOnFineGrid) {
    DensityGradient dg = detector.densityGradient(summer);

    EXPECT_EQ(dg.size(), 100u);
    EXPECT_EQ(dg.depths.size(), 101u);
    EXPECT_NEAR(dg.midpoints.front(), 0.05, 1e-9);
    EXPECT_GT(dg.maxGradient(), 0.0);

    // Strongest density change between the 4 m and 6 m sensors
    double z_max = dg.midpoints[dg.maxIndex()];
    EXPECT_GT(z_max, 4.0);
    EXPECT_LT(z_max, 6.0);
}

TEST_F(StratificationDetectorTest, GradientRejectsIncompleteProfiles) {
    DepthProfile gap({0.0, 2.0, 4.0}, {20.0, NAN, 10.0});
    EXPECT_THROW(detector.densityGradient(gap), InvalidInputError);
    DepthProfile single({0.0}, {20.0});
    EXPECT_THROW(detector.densityGradient(single), InvalidInputError);
}

// ============================================================================
// Thermocline
// ============================================================================

TEST_F(StratificationDetectorTest, ThermoclineOfSummerProfile) {
    ThermoclineResult result = detector.findThermocline(summer);

    ASSERT_TRUE(result.stratified);
    EXPECT_NEAR(result.depth, 4.58, 0.02);
    EXPECT_GT(result.max_gradient, 0.6);
    EXPECT_LT(result.max_gradient, 0.7);
    EXPECT_DOUBLE_EQ(result.seasonal_depth, result.depth);
}

TEST_F(StratificationDetectorTest, ThermoclineBelowMixedLayer) {
    std::optional<double> zt = detector.thermoclineDepth(mixed_top);
    ASSERT_TRUE(zt.has_value());
    EXPECT_GT(*zt, 2.0);
    EXPECT_LT(*zt, 3.0);
}

TEST_F(StratificationDetectorTest, SeasonalThermoclineIsDeepestSignificantPeak) {
    ThermoclineResult result = detector.findThermocline(two_peaks);
    ASSERT_TRUE(result.stratified);

    EXPECT_GT(result.depth, 3.0);
    EXPECT_LT(result.depth, 5.0);
    EXPECT_GT(result.seasonal_depth, 8.0);
    EXPECT_LT(result.seasonal_depth, 10.0);

    EXPECT_DOUBLE_EQ(*detector.thermoclineDepth(two_peaks, false), result.depth);
    EXPECT_DOUBLE_EQ(*detector.thermoclineDepth(two_peaks, true), result.seasonal_depth);
}

TEST_F(StratificationDetectorTest, SeasonalPeakBelowThresholdIsIgnored) {
    ThermoclineConfig strict;
    strict.seasonal_min_gradient = 5.0;
    StratificationDetector det(WaterDensityModel(), strict, MetalimnionConfig());

    ThermoclineResult result = det.findThermocline(two_peaks);
    ASSERT_TRUE(result.stratified);
    EXPECT_DOUBLE_EQ(result.seasonal_depth, result.depth);
}

TEST_F(StratificationDetectorTest, IsothermalProfileIsNotStratified) {
    DepthProfile iso({0.0, 2.0, 4.0, 6.0}, {12.0, 12.0, 12.0, 12.0});
    ThermoclineResult result = detector.findThermocline(iso);

    EXPECT_FALSE(result.stratified);
    EXPECT_TRUE(std::isnan(result.depth));
    EXPECT_FALSE(detector.thermoclineDepth(iso).has_value());
}

TEST_F(StratificationDetectorTest, SmallTemperatureRangeIsMixed) {
    DepthProfile nearly_mixed({0.0, 5.0, 10.0}, {20.0, 19.6, 19.3});
    EXPECT_FALSE(detector.findThermocline(nearly_mixed).stratified);
}

TEST_F(StratificationDetectorTest, InverseStratificationIsNotStratified) {
    // Winter profile under ice: density decreases with depth below 4 C
    DepthProfile winter({0.0, 2.0, 4.0, 6.0}, {4.0, 2.0, 1.0, 0.5});
    EXPECT_FALSE(detector.findThermocline(winter).stratified);
}

// ============================================================================
// Metalimnion
// ============================================================================

TEST_F(StratificationDetectorTest, MetalimnionBracketsThermocline) {
    std::optional<double> zt = detector.thermoclineDepth(summer);
    std::optional<Layer> meta = detector.metalimnionDepths(summer);
    ASSERT_TRUE(zt.has_value());
    ASSERT_TRUE(meta.has_value());

    EXPECT_LT(meta->top, *zt);
    EXPECT_GT(meta->bottom, *zt);
    EXPECT_NEAR(meta->bottom, 8.02, 0.05);
    // Gradient stays above the threshold up to the surface
    EXPECT_DOUBLE_EQ(meta->top, 0.0);
}

TEST_F(StratificationDetectorTest, MetalimnionBelowMixedLayer) {
    std::optional<Layer> meta = detector.metalimnionDepths(mixed_top);
    ASSERT_TRUE(meta.has_value());
    EXPECT_NEAR(meta->top, 1.96, 0.05);
    EXPECT_NEAR(meta->bottom, 4.98, 0.05);
    EXPECT_GT(meta->thickness(), 0.0);
}

TEST_F(StratificationDetectorTest, MetalimnionFollowsSeasonalFlag) {
    std::optional<Layer> seasonal = detector.metalimnionDepths(two_peaks, true);
    std::optional<Layer> plain = detector.metalimnionDepths(two_peaks, false);
    ASSERT_TRUE(seasonal.has_value());
    ASSERT_TRUE(plain.has_value());

    EXPECT_GT(seasonal->top, plain->bottom);
    EXPECT_LT(plain->top, 4.0);
    EXPECT_GT(seasonal->bottom, 9.0);
}

TEST_F(StratificationDetectorTest, AbsoluteSlopeCriterion) {
    MetalimnionConfig slope;
    slope.use_absolute_slope = true;
    slope.absolute_slope = 0.5;
    StratificationDetector det(WaterDensityModel(), ThermoclineConfig(), slope);

    std::optional<Layer> narrow = det.metalimnionDepths(summer);
    std::optional<Layer> wide = detector.metalimnionDepths(summer);
    ASSERT_TRUE(narrow.has_value());
    EXPECT_GE(narrow->top, wide->top);
    EXPECT_LE(narrow->bottom, wide->bottom);
    EXPECT_LT(narrow->thickness(), wide->thickness());
}

TEST_F(StratificationDetectorTest, MetalimnionOfMixedColumnIsUndefined) {
    DepthProfile iso({0.0, 5.0, 10.0}, {15.0, 15.0, 15.0});
    EXPECT_FALSE(detector.metalimnionDepths(iso).has_value());

    ThermoclineResult result = detector.findThermocline(iso);
    EXPECT_THROW(detector.metalimnionFromThermocline(result, true), NotStratifiedError);
}
