/**
 * @file test_crater_shape.cpp
 * @brief Unit tests for the per-cell crater rules
 */

#include <gtest/gtest.h>
#include "crater/surface/crater_shape.h"
#include <stdexcept>
#include <vector>

namespace crater::test {

using namespace crater::surface;

constexpr Real EPS = 1e-12;

// ============================================================================
// Parameters
// ============================================================================

TEST(CraterParamsTest, DefaultsValidate) {
    CraterParams params;
    EXPECT_NO_THROW(params.validate());
    EXPECT_DOUBLE_EQ(params.inner_fraction, 0.67);
    EXPECT_EQ(params.segment_count, 16);
    EXPECT_DOUBLE_EQ(params.spike_strength, 0.4);
    EXPECT_DOUBLE_EQ(params.destroy_threshold, 0.5);
}

TEST(CraterParamsTest, RejectsOutOfRange) {
    CraterParams params;
    params.inner_fraction = 0.0;
    EXPECT_THROW(params.validate(), std::invalid_argument);

    params = {};
    params.segment_count = 0;
    EXPECT_THROW(params.validate(), std::invalid_argument);

    params = {};
    params.perturbation = 1.0;
    EXPECT_THROW(params.validate(), std::invalid_argument);
}

// ============================================================================
// Perturbation Smoothing
// ============================================================================

TEST(CraterShapeTest, SmoothingWeightsNeighbors) {
    auto smoothed = smooth_perturbation({0.0, 0.0, 0.4, 0.0});
    ASSERT_EQ(smoothed.size(), 4u);
    EXPECT_NEAR(smoothed[0], 0.0, EPS);
    EXPECT_NEAR(smoothed[1], 0.1, EPS);
    EXPECT_NEAR(smoothed[2], 0.2, EPS);
    EXPECT_NEAR(smoothed[3], 0.1, EPS);
}

TEST(CraterShapeTest, SmoothingWrapsAround) {
    auto smoothed = smooth_perturbation({0.4, 0.0, 0.0, 0.0});
    EXPECT_NEAR(smoothed[0], 0.2, EPS);
    EXPECT_NEAR(smoothed[1], 0.1, EPS);
    EXPECT_NEAR(smoothed[2], 0.0, EPS);
    EXPECT_NEAR(smoothed[3], 0.1, EPS);
}

TEST(CraterShapeTest, SmoothingKeepsConstantsAndSingleSegment) {
    for (Real v : smooth_perturbation(std::vector<Real>(16, -0.25))) {
        EXPECT_NEAR(v, -0.25, EPS);
    }
    auto single = smooth_perturbation({0.3});
    ASSERT_EQ(single.size(), 1u);
    EXPECT_NEAR(single[0], 0.3, EPS);
    EXPECT_TRUE(smooth_perturbation({}).empty());
}

// ============================================================================
// Geometry of a Cell
// ============================================================================

TEST(CraterShapeTest, SegmentFollowsAngle) {
    EXPECT_EQ(crater_segment({1.0, 0.0}, 16), 8u);
    EXPECT_EQ(crater_segment({0.0, 1.0}, 16), 12u);
    EXPECT_EQ(crater_segment({0.0, -1.0}, 16), 4u);
    // +pi maps back onto the first segment
    EXPECT_EQ(crater_segment({-1.0, 0.0}, 16), 0u);
    EXPECT_EQ(crater_segment({3.0, 4.0}, 1), 0u);
}

TEST(CraterShapeTest, EdgeProgressAcrossBand) {
    EXPECT_NEAR(edge_progress(15.0, 10.0, 20.0), 0.5, EPS);
    EXPECT_NEAR(edge_progress(5.0, 10.0, 20.0), 0.0, EPS);
    EXPECT_NEAR(edge_progress(25.0, 10.0, 20.0), 1.0, EPS);
    // Degenerate band
    EXPECT_NEAR(edge_progress(10.0, 10.0, 10.0), 1.0, EPS);
    EXPECT_NEAR(edge_progress(12.0, 10.0, 8.0), 1.0, EPS);
}

TEST(CraterShapeTest, PositionNoiseIsDeterministicUnitInterval) {
    EXPECT_DOUBLE_EQ(position_noise(0, 0), 0.0);
    for (Int32 row = -20; row < 20; ++row) {
        for (Int32 col = -20; col < 20; ++col) {
            Real n = position_noise(col, row);
            EXPECT_GE(n, 0.0);
            EXPECT_LT(n, 1.0);
            EXPECT_EQ(n, position_noise(col, row));
        }
    }
    EXPECT_NE(position_noise(3, 7), position_noise(7, 3));
}

// ============================================================================
// Cell Score
// ============================================================================

TEST(CraterShapeTest, ScoreFallsWithEdgeProgress) {
    CraterParams params;
    EXPECT_NEAR(crater_score(0.2, 0.5, 0.0, params), 0.8, EPS);
    EXPECT_NEAR(crater_score(0.5, 0.5, 0.0, params), 0.5, EPS);
    EXPECT_NEAR(crater_score(0.8, 0.5, 0.0, params), 0.2, EPS);
}

/**
 * @brief High noise near the inner edge grows a spike
 */
TEST(CraterShapeTest, SpikeNearInnerEdge) {
    CraterParams params;
    EXPECT_NEAR(crater_score(0.2, 0.8, 0.0, params), 1.2, EPS);
    // Thresholds are strict
    EXPECT_NEAR(crater_score(0.3, 0.8, 0.0, params), 0.7, EPS);
    EXPECT_NEAR(crater_score(0.2, 0.7, 0.0, params), 0.8, EPS);
}

/**
 * @brief Low noise near the outer edge cuts a notch
 */
TEST(CraterShapeTest, NotchNearOuterEdge) {
    CraterParams params;
    EXPECT_NEAR(crater_score(0.8, 0.2, 0.0, params), -0.2, EPS);
    EXPECT_NEAR(crater_score(0.7, 0.2, 0.0, params), 0.3, EPS);
    EXPECT_NEAR(crater_score(0.8, 0.3, 0.0, params), 0.2, EPS);

    params.spike_strength = 0.1;
    EXPECT_NEAR(crater_score(0.8, 0.2, 0.0, params), 0.1, EPS);
}

TEST(CraterShapeTest, RaggednessScalesNoise) {
    CraterParams params;
    EXPECT_NEAR(crater_score(0.5, 0.9, 0.0, params), 0.5, EPS);
    EXPECT_NEAR(crater_score(0.5, 0.9, 0.5, params), 0.9, EPS);
    EXPECT_NEAR(crater_score(0.5, 0.9, 1.0, params), 1.3, EPS);
    EXPECT_NEAR(crater_score(0.5, 0.1, 1.0, params), -0.3, EPS);

    // Mid-band cells with ragged noise flip across the threshold
    EXPECT_GT(crater_score(0.5, 0.6, 0.3, params), params.destroy_threshold);
    EXPECT_LT(crater_score(0.5, 0.4, 0.3, params), params.destroy_threshold);
}

} // namespace crater::test
