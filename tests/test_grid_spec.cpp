// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <limits>

#include "datadem/errors.hpp"
#include "datadem/grid/grid_spec.hpp"
#include "datadem/grid/raster.hpp"

using namespace datadem;

TEST(GridSpecTest, FromRegion) {
  auto spec = GridSpec::fromRegion(Region(-5, 5, -4, 4), 0.5);
  EXPECT_EQ(spec.width, 20);
  EXPECT_EQ(spec.height, 16);
  EXPECT_DOUBLE_EQ(spec.transform.origin_x, -5.0);
  EXPECT_DOUBLE_EQ(spec.transform.origin_y, 4.0);
  EXPECT_DOUBLE_EQ(spec.transform.cell_y, -0.5);
  EXPECT_EQ(spec.cellCount(), 320u);
  EXPECT_EQ(spec.extent(), Region(-5, 5, -4, 4));
}

TEST(GridSpecTest, TinyRegionGetsOneCell) {
  auto spec = GridSpec::fromRegion(Region(0, 0.1, 0, 0.1), 1.0);
  EXPECT_EQ(spec.width, 1);
  EXPECT_EQ(spec.height, 1);
}

TEST(GridSpecTest, RejectsBadInput) {
  EXPECT_THROW(GridSpec::fromRegion(Region(0, 0, 0, 1), 1.0), InvalidRegion);
  EXPECT_THROW(GridSpec::fromRegion(Region(0, 1, 0, 1), 0.0),
               std::invalid_argument);
}

TEST(GridSpecTest, CenterRoundTrip) {
  auto spec = GridSpec::fromRegion(Region(100, 110, 40, 47), 0.25);
  for (int row = 0; row < spec.height; row += 3) {
    for (int col = 0; col < spec.width; col += 5) {
      const auto [x, y] = spec.cellCenter(row, col);
      auto idx = spec.cellAt(x, y);
      ASSERT_TRUE(idx.has_value());
      EXPECT_EQ(*idx, (CellIndex{row, col}));
      const auto [x2, y2] = spec.cellCenter(idx->row, idx->col);
      EXPECT_DOUBLE_EQ(x2, x);
      EXPECT_DOUBLE_EQ(y2, y);
    }
  }
}

TEST(GridSpecTest, RowZeroIsNorth) {
  auto spec = GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0);
  EXPECT_EQ(spec.cellAt(0.5, 3.5), (CellIndex{0, 0}));
  EXPECT_EQ(spec.cellAt(3.5, 0.5), (CellIndex{3, 3}));
}

TEST(GridSpecTest, OutsideIsRejected) {
  auto spec = GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0);
  EXPECT_FALSE(spec.cellAt(-0.01, 1.0).has_value());
  EXPECT_FALSE(spec.cellAt(4.0, 1.0).has_value());
  EXPECT_FALSE(spec.cellAt(1.0, 0.0).has_value());
  EXPECT_TRUE(spec.cellAt(0.0, 4.0).has_value());

  auto idx = spec.toCell(-1.5, 5.5);
  EXPECT_EQ(idx.col, -2);
  EXPECT_EQ(idx.row, -2);
}

// ─── Raster ─────────────────────────────────────────────────────────────────

TEST(RasterTest, InitializedToNodata) {
  Raster r(GridSpec::fromRegion(Region(0, 3, 0, 2), 1.0, -1.0f));
  EXPECT_EQ(r.rows(), 2);
  EXPECT_EQ(r.cols(), 3);
  EXPECT_EQ(r.validCount(), 0u);
  EXPECT_FALSE(r.hasData());
  EXPECT_FLOAT_EQ(r(1, 2), -1.0f);
}

TEST(RasterTest, SampleAndValidity) {
  Raster r(GridSpec::fromRegion(Region(0, 2, 0, 2), 1.0));
  r(0, 1) = 7.0f;
  r(1, 0) = std::numeric_limits<float>::quiet_NaN();
  EXPECT_EQ(r.sample(1.5, 1.5), 7.0f);
  EXPECT_FALSE(r.sample(0.5, 0.5).has_value());
  EXPECT_FALSE(r.sample(5.0, 5.0).has_value());
  EXPECT_EQ(r.validCount(), 1u);
}

TEST(RasterTest, CropKeepsCellsWithCentersInside) {
  Raster r(GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0));
  for (int row = 0; row < 4; ++row) {
    for (int col = 0; col < 4; ++col) r(row, col) = row * 10.0f + col;
  }
  auto sub = crop(r, Region(1, 3, 0, 2));
  ASSERT_EQ(sub.rows(), 2);
  ASSERT_EQ(sub.cols(), 2);
  EXPECT_FLOAT_EQ(sub(0, 0), 21.0f);
  EXPECT_FLOAT_EQ(sub(1, 1), 32.0f);
  EXPECT_EQ(sub.spec().extent(), Region(1, 3, 0, 2));

  EXPECT_TRUE(crop(r, Region(10, 12, 10, 12)).empty());
}

TEST(RasterTest, MosaicCopiesValidCells) {
  Raster big(GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0));
  Raster small(GridSpec::fromRegion(Region(2, 4, 0, 2), 1.0));
  small(0, 0) = 5.0f;
  small(1, 1) = 6.0f;
  EXPECT_EQ(mosaic(big, small), 2u);
  EXPECT_FLOAT_EQ(big(2, 2), 5.0f);
  EXPECT_FLOAT_EQ(big(3, 3), 6.0f);
  EXPECT_EQ(big.validCount(), 2u);
}
