// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include "datadem/grid/binning.hpp"

using namespace datadem;

class BinningTest : public ::testing::Test {
 protected:
  GridSpec spec = GridSpec::fromRegion(Region(0, 4, 0, 4), 1.0);

  static VectorPointStream stream(std::vector<PointRecord> pts) {
    return VectorPointStream(std::move(pts));
  }
};

TEST_F(BinningTest, EmptyStreamGivesNodataMean) {
  auto s = stream({});
  auto mean = GridBinner(BinMode::Mean).bin(s, spec);
  EXPECT_EQ(mean.validCount(), 0u);
  EXPECT_FLOAT_EQ(mean(0, 0), spec.nodata);
}

TEST_F(BinningTest, CountTouchesOnlyItsCell) {
  auto s = stream({{1.5, 2.5, 9.0, 1.0}});
  auto count = GridBinner(BinMode::Count).bin(s, spec);
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 4; ++c) {
      EXPECT_FLOAT_EQ(count(r, c), (r == 1 && c == 1) ? 1.0f : 0.0f);
    }
  }
}

TEST_F(BinningTest, WeightedMean) {
  auto s = stream({{0.2, 0.2, 1.0, 1.0}, {0.8, 0.8, 4.0, 2.0}});
  auto mean = GridBinner(BinMode::Mean).bin(s, spec);
  EXPECT_FLOAT_EQ(mean(3, 0), 3.0f);
  EXPECT_EQ(mean.validCount(), 1u);
}

TEST_F(BinningTest, Presence) {
  auto s = stream({{0.5, 0.5, 1.0, 1.0}, {3.5, 3.5, -1.0, 1.0}});
  auto mask = GridBinner(BinMode::Presence).bin(s, spec);
  EXPECT_FLOAT_EQ(mask(3, 0), 1.0f);
  EXPECT_FLOAT_EQ(mask(0, 3), 1.0f);
  EXPECT_FLOAT_EQ(mask(1, 1), 0.0f);
  EXPECT_EQ(mask.validCount(), 16u);
}

TEST_F(BinningTest, OutsidePointsContributeNothing) {
  auto s = stream({{-1.0, 1.0, 5.0, 1.0}, {1.0, 10.0, 5.0, 1.0}});
  BinAccumulator acc(spec);
  EXPECT_EQ(acc.addAll(s), 0u);
  EXPECT_EQ(acc.finalize(BinMode::Count).data().sum(), 0.0f);
}

TEST_F(BinningTest, MergeByAdditionMatchesSinglePass) {
  std::vector<PointRecord> pts = {{0.5, 0.5, 1.0, 1.0},
                                  {0.6, 0.4, 3.0, 2.0},
                                  {2.5, 2.5, -2.0, 0.5},
                                  {0.7, 0.7, 10.0, 1.5}};

  auto all = stream(pts);
  auto single = GridBinner(BinMode::Mean).bin(all, spec);

  BinAccumulator first(spec);
  BinAccumulator second(spec);
  auto a = stream({pts[0], pts[1]});
  auto b = stream({pts[2], pts[3]});
  first.addAll(a);
  second.addAll(b);
  first.merge(second);

  auto merged = first.finalize(BinMode::Mean);
  EXPECT_TRUE(merged.data().isApprox(single.data()));
  EXPECT_EQ(first.pointsBinned(), 4u);
  EXPECT_FLOAT_EQ(first.finalize(BinMode::Count)(3, 0), 3.0f);
}

TEST_F(BinningTest, MergeRejectsOtherGeometry) {
  BinAccumulator a(spec);
  BinAccumulator b(GridSpec::fromRegion(Region(0, 4, 0, 4), 0.5));
  EXPECT_THROW(a.merge(b), std::invalid_argument);
}

TEST_F(BinningTest, BlockMeanOnePointPerCell) {
  auto s = stream({{0.2, 0.2, 1.0, 1.0},
                   {0.8, 0.8, 4.0, 2.0},
                   {2.5, 2.5, 7.0, 3.0}});
  auto blocks = blockMean(s, spec, true);

  std::vector<PointRecord> out;
  PointRecord pt;
  while (blocks->next(pt)) out.push_back(pt);
  ASSERT_EQ(out.size(), 2u);

  // Row-major from the north: (2.5, 2.5) is row 1, (0.5, 0.5) is row 3
  EXPECT_DOUBLE_EQ(out[0].x, 2.5);
  EXPECT_DOUBLE_EQ(out[0].z, 7.0);
  EXPECT_DOUBLE_EQ(out[1].x, 0.5);
  EXPECT_DOUBLE_EQ(out[1].y, 0.5);
  EXPECT_DOUBLE_EQ(out[1].z, 3.0);
  EXPECT_DOUBLE_EQ(out[1].weight, 1.5);
}

TEST_F(BinningTest, BlockMeanIgnoresWeightsWhenDisabled) {
  auto s = stream({{0.2, 0.2, 1.0, 1.0}, {0.8, 0.8, 4.0, 2.0}});
  auto blocks = blockMean(s, spec, false);
  PointRecord pt;
  ASSERT_TRUE(blocks->next(pt));
  EXPECT_DOUBLE_EQ(pt.z, 2.5);
  EXPECT_DOUBLE_EQ(pt.weight, 1.0);
  EXPECT_FALSE(blocks->next(pt));
}
