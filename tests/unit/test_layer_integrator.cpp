/**
 * @file test_layer_integrator.cpp
 * @brief Unit tests for volume-weighted layer averages
 */

#include <gtest/gtest.h>
#include "LayerIntegrator.hpp"
#include "StratErrors.hpp"
#include <cmath>

using namespace LakeStrat;

class LayerIntegratorTest : public ::testing::Test {
protected:
    void SetUp() override {}

    Bathymetry wedge{{0.0, 10.0}, {100.0, 0.0}};
    LayerIntegrator integrator{wedge};

    // Field equal to depth, so layer averages are centers of volume
    DepthProfile depth_field{{0.0, 10.0}, {0.0, 10.0}};
};

// ============================================================================
// Exact Averages
// ============================================================================

TEST_F(LayerIntegratorTest, ConstantFieldAveragesToConstant) {
    DepthProfile constant({0.0, 3.0, 7.0}, {14.5, 14.5, 14.5});
    EXPECT_NEAR(integrator.layerAverage(constant, 0.0, 10.0), 14.5, 1e-12);
    EXPECT_NEAR(integrator.layerAverage(constant, 2.2, 4.9), 14.5, 1e-12);
}

TEST_F(LayerIntegratorTest, LinearFieldOverWholeBasin) {
    // integral(z A) / integral(A) for A linear in z: H / 3
    EXPECT_NEAR(integrator.layerAverage(depth_field, 0.0, 10.0), 10.0 / 3.0, 1e-12);
}

TEST_F(LayerIntegratorTest, LinearFieldOverUpperLayer) {
    // integral_0^5 z 100 (1 - z/10) dz = 833.33, volume 375
    EXPECT_NEAR(integrator.layerAverage(depth_field, 0.0, 5.0), 20.0 / 9.0, 1e-9);
}

TEST_F(LayerIntegratorTest, WeightsFollowArea) {
    // Uniform area gives the arithmetic layer mean
    Bathymetry column({0.0, 10.0}, {50.0, 50.0});
    LayerIntegrator flat(column);
    EXPECT_NEAR(flat.layerAverage(depth_field, 2.0, 6.0), 4.0, 1e-12);

    // Shrinking area shifts the mean upward
    EXPECT_LT(integrator.layerAverage(depth_field, 2.0, 6.0), 4.0);
}

TEST_F(LayerIntegratorTest, BottomClippedToLakeBottom) {
    EXPECT_NEAR(integrator.layerAverage(depth_field, 0.0, 25.0),
                integrator.layerAverage(depth_field, 0.0, 10.0), 1e-12);
}

TEST_F(LayerIntegratorTest, FieldHeldBeyondMeasurements) {
    DepthProfile shallow({0.0, 4.0}, {20.0, 16.0});
    // Below 4 m the field stays at 16
    double avg = integrator.layerAverage(shallow, 3.0, 10.0);
    EXPECT_GT(avg, 16.0);
    EXPECT_LT(avg, 16.5);
}

TEST_F(LayerIntegratorTest, TransformAppliedPointwise) {
    DepthProfile constant({0.0, 10.0}, {3.0, 3.0});
    double avg = integrator.layerAverage(constant, 0.0, 10.0,
                                         [](double v) { return v * v; });
    EXPECT_NEAR(avg, 9.0, 1e-12);
}

// ============================================================================
// Temperature and Density
// ============================================================================

TEST_F(LayerIntegratorTest, LayerTemperatureAndDensity) {
    DepthProfile temp({0.0, 5.0, 10.0}, {20.0, 20.0, 20.0});
    WaterDensityModel model;

    EXPECT_NEAR(integrator.layerTemperature(temp, 1.0, 4.0), 20.0, 1e-12);
    EXPECT_NEAR(integrator.layerDensity(temp, 1.0, 4.0, model), model.density(20.0), 1e-9);

    Layer layer{1.0, 4.0};
    EXPECT_NEAR(integrator.layerAverage(temp, layer), 20.0, 1e-12);
}

TEST_F(LayerIntegratorTest, LayerDensityBoundedByEndDensities) {
    DepthProfile temp({0.0, 10.0}, {24.0, 8.0});
    WaterDensityModel model;
    double rho = integrator.layerDensity(temp, 0.0, 10.0, model);
    EXPECT_GT(rho, model.density(24.0));
    EXPECT_LT(rho, model.density(8.0));
}

TEST_F(LayerIntegratorTest, LayerVolume) {
    EXPECT_NEAR(integrator.layerVolume(0.0, 5.0), 375.0, 1e-9);
    EXPECT_NEAR(integrator.layerVolume(5.0, 30.0), 125.0, 1e-9);
    EXPECT_DOUBLE_EQ(integrator.layerVolume(12.0, 15.0), 0.0);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LayerIntegratorTest, DegenerateLayerThrows) {
    EXPECT_THROW(integrator.layerAverage(depth_field, 5.0, 5.0), EmptyLayerError);
    EXPECT_THROW(integrator.layerAverage(depth_field, 6.0, 2.0), EmptyLayerError);
    EXPECT_THROW(integrator.layerAverage(depth_field, NAN, 2.0), EmptyLayerError);
}

TEST_F(LayerIntegratorTest, LayerAboveSurfaceThrows) {
    EXPECT_THROW(integrator.layerAverage(depth_field, -1.0, 2.0), OutOfRangeError);
}

TEST_F(LayerIntegratorTest, LayerOutsideMeasurementsThrows) {
    DepthProfile shallow({0.0, 4.0}, {20.0, 16.0});
    EXPECT_THROW(integrator.layerAverage(shallow, 6.0, 8.0), EmptyLayerError);
}

TEST_F(LayerIntegratorTest, LayerBelowLakeBottomThrows) {
    DepthProfile deep({0.0, 20.0}, {20.0, 6.0});
    EXPECT_THROW(integrator.layerAverage(deep, 12.0, 15.0), EmptyLayerError);
}

TEST_F(LayerIntegratorTest, ZeroVolumeLayerThrows) {
    Bathymetry pit({0.0, 5.0, 10.0}, {100.0, 0.0, 0.0});
    LayerIntegrator narrow(pit);
    EXPECT_THROW(narrow.layerAverage(depth_field, 6.0, 9.0), EmptyLayerError);
}

TEST_F(LayerIntegratorTest, MissingValuesThrow) {
    DepthProfile gap({0.0, 5.0, 10.0}, {20.0, NAN, 10.0});
    EXPECT_THROW(integrator.layerAverage(gap, 0.0, 10.0), InvalidInputError);
}
