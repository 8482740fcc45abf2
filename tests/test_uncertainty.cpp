// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

#include "datadem/errors.hpp"
#include "datadem/uncertainty/estimator.hpp"

using namespace datadem;

namespace {

TileSummary makeTile(const Region& region, double density, Zone zone) {
  TileSummary t;
  t.region = region;
  t.density = density;
  t.zone = zone;
  return t;
}

/// Engine that always fails, as an unavailable external tool would.
class FailingGridEngine : public ExternalGridEngine {
 public:
  Raster interpolate(const GridRequest&, PointStream&) override {
    throw ExternalToolFailure("engine offline");
  }
};

/// Records what each trial hands to the engine, then grids normally.
class RecordingGridEngine : public ExternalGridEngine {
 public:
  struct Call {
    Region region;
    std::vector<PointRecord> points;
  };

  Raster interpolate(const GridRequest& req, PointStream& points) override {
    Call call{req.region, {}};
    PointRecord pt;
    while (points.next(pt)) call.points.push_back(pt);
    calls.push_back(call);

    VectorPointStream replay(std::move(call.points));
    return inner_.interpolate(req, replay);
  }

  std::vector<Call> calls;

 private:
  InpaintingGridEngine inner_;
};

}  // namespace

// ─── Tiling ─────────────────────────────────────────────────────────────────

TEST(TilingTest, ClassifyZone) {
  EXPECT_EQ(classifyZone(-10.0, -1.0), Zone::Negative);
  EXPECT_EQ(classifyZone(-1.0, 1.0), Zone::Mixed);
  EXPECT_EQ(classifyZone(0.0, 5.0), Zone::Mixed);
  EXPECT_EQ(classifyZone(0.5, 5.0), Zone::Positive);
  EXPECT_EQ(toString(Zone::Positive), "positive");
}

TEST(TilingTest, AnalyzeTiles) {
  const auto spec = GridSpec::fromRegion(Region(0, 4, 0, 2), 1.0);
  Raster dem(spec);
  Raster mask(spec);
  mask.data().setZero();

  // West tile: two data cells, all negative. East tile: no DEM data.
  dem(0, 0) = -5.0f;
  dem(1, 1) = -2.0f;
  mask(0, 0) = 1.0f;
  mask(1, 1) = 1.0f;

  auto tiles = analyzeTiles(dem, mask, tile(spec.extent(), 1.0, 2));
  ASSERT_EQ(tiles.size(), 1u);
  EXPECT_EQ(tiles[0].region, Region(0, 2, 0, 2));
  EXPECT_EQ(tiles[0].cells, 4u);
  EXPECT_EQ(tiles[0].data_cells, 2u);
  EXPECT_DOUBLE_EQ(tiles[0].density, 50.0);
  EXPECT_DOUBLE_EQ(tiles[0].z_min, -5.0);
  EXPECT_EQ(tiles[0].zone, Zone::Negative);
}

TEST(TilingTest, SelectTrainingAboveZoneMedian) {
  std::vector<TileSummary> tiles = {
      makeTile(Region(0, 1, 0, 1), 10.0, Zone::Negative),
      makeTile(Region(1, 2, 0, 1), 20.0, Zone::Negative),
      makeTile(Region(2, 3, 0, 1), 30.0, Zone::Negative),
      makeTile(Region(3, 4, 0, 1), 90.0, Zone::Positive),
  };
  auto trainers = selectTraining(tiles);
  ASSERT_EQ(trainers[0].size(), 1u);
  EXPECT_DOUBLE_EQ(trainers[0][0].density, 30.0);
  EXPECT_TRUE(trainers[1].empty());
  // A single tile is its own median
  EXPECT_TRUE(trainers[2].empty());
}

TEST(TilingTest, DeclusterKeepsEveryTile) {
  std::vector<TileSummary> tiles;
  for (int i = 0; i < 20; ++i) {
    tiles.push_back(makeTile(Region(i, i + 1, 0, 1), i, Zone::Mixed));
  }
  std::mt19937 rng(42);
  auto ordered = declusterTiles(tiles, rng);
  ASSERT_EQ(ordered.size(), tiles.size());

  std::set<double> seen;
  for (const auto& t : ordered) seen.insert(t.density);
  EXPECT_EQ(seen.size(), tiles.size());

  // Second pick is farther than the median distance from the first
  std::vector<double> dists;
  for (const auto& t : tiles) {
    if (t.region != ordered[0].region) {
      dists.push_back(centerDistance(ordered[0].region, t.region));
    }
  }
  std::sort(dists.begin(), dists.end());
  EXPECT_GT(centerDistance(ordered[0].region, ordered[1].region),
            dists[dists.size() / 2]);
}

TEST(TilingTest, DeclusterIsSeeded) {
  std::vector<TileSummary> tiles;
  for (int i = 0; i < 10; ++i) {
    tiles.push_back(makeTile(Region(0, 1, i, i + 1), i, Zone::Mixed));
  }
  std::mt19937 a(7), b(7);
  auto first = declusterTiles(tiles, a);
  auto second = declusterTiles(tiles, b);
  for (size_t i = 0; i < tiles.size(); ++i) {
    EXPECT_EQ(first[i].region, second[i].region);
  }
  EXPECT_TRUE(declusterTiles({}, a).empty());
}

// ─── Combination ────────────────────────────────────────────────────────────

TEST(CombineUncertaintyTest, Rules) {
  const auto spec = GridSpec::fromRegion(Region(0, 2, 0, 1), 1.0);
  Raster a(spec), b(spec);
  a(0, 0) = 3.0f;
  b(0, 0) = 4.0f;
  a(0, 1) = 1.0f;

  EXPECT_FALSE(combineUncertainty(a, b, CombineRule::None).has_value());

  auto max = combineUncertainty(a, b, CombineRule::Max);
  ASSERT_TRUE(max.has_value());
  EXPECT_FLOAT_EQ((*max)(0, 0), 4.0f);
  EXPECT_FALSE(max->isValid(0, 1));

  auto quad = combineUncertainty(a, b, CombineRule::Quadrature);
  EXPECT_FLOAT_EQ((*quad)(0, 0), 5.0f);

  Raster other(GridSpec::fromRegion(Region(0, 4, 0, 1), 1.0));
  EXPECT_THROW(combineUncertainty(a, other, CombineRule::Max),
               std::invalid_argument);
}

// ─── Estimator ──────────────────────────────────────────────────────────────

class UncertaintyEstimatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto spec = GridSpec::fromRegion(Region(0, 32, 0, 32), 1.0);
    dem = Raster(spec);
    mask = Raster(spec);
    mask.data().setZero();

    // Curved seafloor, all below zero: dense survey in the west, sparse
    // soundings every third cell in the east
    for (int r = 0; r < spec.height; ++r) {
      for (int c = 0; c < spec.width; ++c) {
        const auto [x, y] = spec.cellCenter(r, c);
        const bool has_data = x < 16.0 || (r % 3 == 0 && c % 3 == 0);
        if (!has_data) continue;
        dem(r, c) = static_cast<float>(-100.0 + 0.05 * x * x + 0.02 * x * y);
        mask(r, c) = 1.0f;
      }
    }
    fillGaps(dem, 0, 1);

    cfg.enabled = true;
    cfg.simulations = 2;
    cfg.seed = 1234;
    cfg.extract_buffer_cells = 4;
    cfg.combine = CombineRule::Quadrature;

    request.cell_size = 1.0;
  }

  Raster dem;
  Raster mask;
  config::Uncertainty cfg;
  GridRequest request;
};

TEST_F(UncertaintyEstimatorTest, RequiresCollaborators) {
  EXPECT_THROW(UncertaintyEstimator(cfg, nullptr, createProxyService()),
               std::invalid_argument);
  EXPECT_THROW(UncertaintyEstimator(cfg, createGridEngine(), nullptr),
               std::invalid_argument);
}

TEST_F(UncertaintyEstimatorTest, RejectsMismatchedMask) {
  UncertaintyEstimator estimator(cfg, createGridEngine(), createProxyService());
  Raster other(GridSpec::fromRegion(Region(0, 16, 0, 16), 1.0));
  EXPECT_THROW(estimator.estimate(dem, other, request), std::invalid_argument);
}

TEST_F(UncertaintyEstimatorTest, FullRun) {
  UncertaintyEstimator estimator(cfg, createGridEngine(), createProxyService());
  auto result = estimator.estimate(dem, mask, request);

  // Target proximity is clamped to 2 cells, times chunk_level 4
  EXPECT_EQ(result.tiles, 16u);
  EXPECT_EQ(result.training_tiles, 8u);
  EXPECT_EQ(result.trials, 16u);
  EXPECT_EQ(result.failed_trials, 0u);
  EXPECT_EQ(estimator.stage(), Stage::Apply);

  ASSERT_TRUE(result.fitted());
  ASSERT_FALSE(result.samples.empty());
  for (const auto& s : result.samples) {
    EXPECT_GE(s.distance, 1.0);
    EXPECT_LE(s.distance, std::sqrt(2.0) + 1e-6);
  }

  EXPECT_TRUE(result.proximity_uncertainty.spec().sameGeometry(dem.spec()));
  EXPECT_TRUE(result.slope_uncertainty.spec().sameGeometry(dem.spec()));
  ASSERT_TRUE(result.combined.has_value());
  EXPECT_EQ(result.combined->validCount(), dem.validCount());
}

TEST_F(UncertaintyEstimatorTest, TrialsGridWithSurroundingData) {
  auto engine = std::make_shared<RecordingGridEngine>();
  UncertaintyEstimator estimator(cfg, engine, createProxyService());
  auto result = estimator.estimate(dem, mask, request);
  ASSERT_EQ(engine->calls.size(), result.trials);

  // Tiles are 8 cells; each trial region adds up to 4 cells per side
  for (const auto& call : engine->calls) {
    EXPECT_GT(std::max(call.region.width(), call.region.height()), 8.0);

    ASSERT_FALSE(call.points.empty());
    double min_x = call.points[0].x, max_x = min_x;
    double min_y = call.points[0].y, max_y = min_y;
    for (const auto& p : call.points) {
      EXPECT_TRUE(contains(call.region, p.x, p.y));
      min_x = std::min(min_x, p.x);
      max_x = std::max(max_x, p.x);
      min_y = std::min(min_y, p.y);
      max_y = std::max(max_y, p.y);
    }
    // Points from neighbouring tiles reach the engine
    EXPECT_GT(std::max(max_x - min_x, max_y - min_y), 8.0);
  }
}

TEST_F(UncertaintyEstimatorTest, FailedTrialsAreCounted) {
  UncertaintyEstimator estimator(cfg, std::make_shared<FailingGridEngine>(),
                                 createProxyService());
  auto result = estimator.estimate(dem, mask, request);
  EXPECT_EQ(result.trials, 16u);
  EXPECT_EQ(result.failed_trials, 16u);
  EXPECT_TRUE(result.samples.empty());
  EXPECT_FALSE(result.fitted());
  EXPECT_TRUE(result.proximity_uncertainty.empty());
}

TEST_F(UncertaintyEstimatorTest, EmptyMaskSkips) {
  mask.data().setZero();
  UncertaintyEstimator estimator(cfg, createGridEngine(), createProxyService());
  auto result = estimator.estimate(dem, mask, request);
  EXPECT_EQ(result.tiles, 0u);
  EXPECT_FALSE(result.fitted());
}
