/**
 * @file test_profile_interpolator.cpp
 * @brief Unit tests for ProfileInterpolator and DepthProfile checks
 */

#include <gtest/gtest.h>
#include "ProfileInterpolator.hpp"
#include "StratErrors.hpp"
#include <cmath>

using namespace LakeStrat;

class ProfileInterpolatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        profile = DepthProfile({0.0, 1.0, 3.0}, {20.0, 18.0, 10.0});
    }

    DepthProfile profile;
};

// ============================================================================
// DepthProfile Validation
// ============================================================================

TEST_F(ProfileInterpolatorTest, ProfileRangeAccessors) {
    EXPECT_DOUBLE_EQ(profile.minDepth(), 0.0);
    EXPECT_DOUBLE_EQ(profile.maxDepth(), 3.0);
    EXPECT_DOUBLE_EQ(profile.minValue(), 10.0);
    EXPECT_DOUBLE_EQ(profile.maxValue(), 20.0);
    EXPECT_FALSE(profile.hasMissingValues());
}

TEST_F(ProfileInterpolatorTest, ValidateRejectsMalformedProfiles) {
    EXPECT_THROW(DepthProfile({0.0, 1.0}, {1.0}).validate(), InvalidInputError);
    EXPECT_THROW(DepthProfile({0.0}, {1.0}).validate(2), InvalidInputError);
    EXPECT_THROW(DepthProfile({0.0, 2.0, 1.0}, {1.0, 2.0, 3.0}).validate(), InvalidInputError);
    EXPECT_THROW(DepthProfile({-1.0, 2.0}, {1.0, 2.0}).validate(), InvalidInputError);
    EXPECT_NO_THROW(DepthProfile({0.0, 2.0}, {1.0, NAN}).validate());
    EXPECT_THROW(DepthProfile({0.0, 2.0}, {1.0, NAN}).validateComplete(), InvalidInputError);
}

TEST_F(ProfileInterpolatorTest, EmptyProfileRangeThrows) {
    DepthProfile empty;
    EXPECT_THROW(empty.minDepth(), InvalidInputError);
    EXPECT_THROW(empty.maxValue(), InvalidInputError);
}

// ============================================================================
// Grid
// ============================================================================

TEST_F(ProfileInterpolatorTest, GridEndsExactlyAtBottom) {
    ProfileInterpolator interp(0.1);
    std::vector<double> z = interp.grid(0.0, 1.0);
    ASSERT_EQ(z.size(), 11u);
    EXPECT_DOUBLE_EQ(z.front(), 0.0);
    EXPECT_DOUBLE_EQ(z.back(), 1.0);
    for (size_t i = 1; i < z.size(); ++i) {
        EXPECT_GT(z[i], z[i-1]);
    }
}

TEST_F(ProfileInterpolatorTest, GridWithPartialLastStep) {
    ProfileInterpolator interp(0.4);
    std::vector<double> z = interp.grid(0.0, 1.0);
    ASSERT_EQ(z.size(), 4u);
    EXPECT_NEAR(z[2], 0.8, 1e-12);
    EXPECT_DOUBLE_EQ(z[3], 1.0);
}

TEST_F(ProfileInterpolatorTest, NonPositiveResolutionThrows) {
    EXPECT_THROW(ProfileInterpolator(0.0), DomainError);
    EXPECT_THROW(ProfileInterpolator(-0.1), DomainError);
}

// ============================================================================
// Interpolation
// ============================================================================

TEST_F(ProfileInterpolatorTest, ResampleReproducesMeasurements) {
    ProfileInterpolator interp(0.5);
    DepthProfile fine = interp.resample(profile);

    ASSERT_EQ(fine.size(), 7u);
    EXPECT_DOUBLE_EQ(fine.values[0], 20.0);
    EXPECT_NEAR(fine.values[1], 19.0, 1e-12);
    EXPECT_NEAR(fine.values[2], 18.0, 1e-12);
    EXPECT_NEAR(fine.values[4], 14.0, 1e-12);
    EXPECT_DOUBLE_EQ(fine.values.back(), 10.0);
}

TEST_F(ProfileInterpolatorTest, ValueAtInsideRange) {
    ProfileInterpolator interp;
    EXPECT_DOUBLE_EQ(interp.valueAt(profile, 1.0), 18.0);
    EXPECT_NEAR(interp.valueAt(profile, 2.0), 14.0, 1e-12);

    std::vector<double> v = interp.valuesAt(profile, {0.0, 0.5, 3.0});
    ASSERT_EQ(v.size(), 3u);
    EXPECT_NEAR(v[1], 19.0, 1e-12);
}

TEST_F(ProfileInterpolatorTest, ValueAtOutsideRangeThrows) {
    ProfileInterpolator interp;
    EXPECT_THROW(interp.valueAt(profile, 3.5), OutOfRangeError);
}

TEST_F(ProfileInterpolatorTest, ClampedValueHoldsEnds) {
    EXPECT_DOUBLE_EQ(ProfileInterpolator::valueAtClamped(profile, 5.0), 10.0);
    DepthProfile shifted({2.0, 4.0}, {15.0, 11.0});
    EXPECT_DOUBLE_EQ(ProfileInterpolator::valueAtClamped(shifted, 0.0), 15.0);
}

TEST_F(ProfileInterpolatorTest, NonFiniteDepthThrows) {
    ProfileInterpolator interp;
    EXPECT_THROW(ProfileInterpolator::valueAtClamped(profile, NAN), OutOfRangeError);
    EXPECT_THROW(ProfileInterpolator::valueAtClamped(profile, INFINITY), OutOfRangeError);
    EXPECT_THROW(interp.valueAt(profile, NAN), OutOfRangeError);
}
