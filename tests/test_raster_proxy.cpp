// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>

#include "datadem/services/raster_proxy.hpp"

using namespace datadem;

class RasterProxyTest : public ::testing::Test {
 protected:
  Raster emptyMask(int cols, int rows) {
    Raster mask(GridSpec::fromRegion(Region(0, cols, 0, rows), 1.0));
    mask.data().setZero();
    return mask;
  }

  GridProxyService proxy;
};

// ─── Proximity ──────────────────────────────────────────────────────────────

TEST_F(RasterProxyTest, ProximityAlongRow) {
  auto mask = emptyMask(5, 1);
  mask(0, 0) = 1.0f;
  auto dist = proxy.proximity(mask);
  for (int c = 0; c < 5; ++c) EXPECT_FLOAT_EQ(dist(0, c), c);
}

TEST_F(RasterProxyTest, ProximityIsEuclidean) {
  auto mask = emptyMask(3, 3);
  mask(0, 0) = 1.0f;
  auto dist = proxy.proximity(mask);
  EXPECT_FLOAT_EQ(dist(0, 0), 0.0f);
  EXPECT_FLOAT_EQ(dist(1, 1), std::sqrt(2.0f));
  EXPECT_FLOAT_EQ(dist(2, 2), std::sqrt(8.0f));
  EXPECT_FLOAT_EQ(dist(2, 1), std::sqrt(5.0f));
}

TEST_F(RasterProxyTest, ProximityNearestOfSeveral) {
  auto mask = emptyMask(7, 1);
  mask(0, 0) = 1.0f;
  mask(0, 6) = 1.0f;
  auto dist = proxy.proximity(mask);
  EXPECT_FLOAT_EQ(dist(0, 3), 3.0f);
  EXPECT_FLOAT_EQ(dist(0, 5), 1.0f);
}

TEST_F(RasterProxyTest, ProximityWithoutTargetsIsNodata) {
  auto dist = proxy.proximity(emptyMask(4, 4));
  EXPECT_EQ(dist.validCount(), 0u);
}

// ─── Slope ──────────────────────────────────────────────────────────────────

TEST_F(RasterProxyTest, FlatSurfaceHasZeroSlope) {
  Raster dem(GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0));
  dem.data().setConstant(10.0f);
  auto slope = proxy.slope(dem);
  EXPECT_FLOAT_EQ(slope.data().maxCoeff(), 0.0f);
}

TEST_F(RasterProxyTest, PlaneSlopeInDegrees) {
  Raster dem(GridSpec::fromRegion(Region(0, 5, 0, 5), 1.0));
  for (int r = 0; r < 5; ++r) {
    for (int c = 0; c < 5; ++c) dem(r, c) = static_cast<float>(c);
  }
  auto slope = proxy.slope(dem);
  EXPECT_NEAR(slope(2, 2), 45.0f, 1e-4);

  // Unit gradient over 2-unit cells
  GridProxyService scaled(2.0);
  EXPECT_NEAR(scaled.slope(dem)(2, 2), std::atan(0.5) * 180.0 / M_PI, 1e-4);
}

TEST_F(RasterProxyTest, SlopeKeepsNodata) {
  Raster dem(GridSpec::fromRegion(Region(0, 3, 0, 3), 1.0));
  dem(1, 1) = 5.0f;
  auto slope = proxy.slope(dem);
  EXPECT_EQ(slope.validCount(), 1u);
  EXPECT_FLOAT_EQ(slope(1, 1), 0.0f);
}
