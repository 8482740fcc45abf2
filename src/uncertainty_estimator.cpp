// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * uncertainty_estimator.cpp
 *
 * Analyze -> Tile -> Classify -> SelectTraining -> Simulate -> Aggregate
 * -> Fit -> Apply.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/uncertainty/estimator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

#include "datadem/errors.hpp"
#include "datadem/grid/binning.hpp"
#include "datadem/grid/raster_stats.hpp"

namespace datadem {

std::string toString(Stage stage) {
  switch (stage) {
    case Stage::Analyze:
      return "analyze";
    case Stage::Tile:
      return "tile";
    case Stage::Classify:
      return "classify";
    case Stage::SelectTraining:
      return "select-training";
    case Stage::Simulate:
      return "simulate";
    case Stage::Aggregate:
      return "aggregate";
    case Stage::Fit:
      return "fit";
    case Stage::Apply:
      return "apply";
  }
  return "unknown";
}

UncertaintyEstimator::UncertaintyEstimator(
    const config::Uncertainty& cfg, std::shared_ptr<ExternalGridEngine> engine,
    std::shared_ptr<RasterProxyService> proxy)
    : cfg_(cfg),
      engine_(std::move(engine)),
      proxy_(std::move(proxy)),
      rng_(cfg.seed != 0 ? cfg.seed : std::random_device{}()) {
  if (!engine_ || !proxy_) {
    throw std::invalid_argument(
        "UncertaintyEstimator requires a grid engine and a proxy service");
  }
}

void UncertaintyEstimator::enter(Stage stage) {
  stage_ = stage;
  spdlog::debug("[Uncertainty] Stage: {}", toString(stage));
}

UncertaintyResult UncertaintyEstimator::estimate(const Raster& dem,
                                                 const Raster& mask,
                                                 const GridRequest& request) {
  if (!dem.spec().sameGeometry(mask.spec())) {
    throw std::invalid_argument("DEM and mask grids differ in geometry");
  }
  UncertaintyResult result;
  const double inc = dem.spec().cell_size;

  // ─── Analyze ──────────────────────────────────────────────────────────────
  enter(Stage::Analyze);
  result.proximity = proxy_->proximity(mask);
  result.slope = proxy_->slope(dem);

  const auto coverage = maskAnalysis(mask);
  const auto target = percentile(result.proximity, cfg_.percentile);
  const auto p90 = percentile(result.proximity, 90.0);
  const auto p95 = percentile(result.proximity, 95.0);
  if (coverage.sum == 0.0 || !target || !p95) {
    spdlog::warn("[Uncertainty] No data in mask, skipping estimate");
    return result;
  }
  const double prox_target = std::max(2.0, *target);
  spdlog::info(
      "[Uncertainty] Region: {} cells, {} with data ({:.2f}%), proximity "
      "p90 {:.2f} p95 {:.2f} p{} {:.2f}",
      coverage.max, coverage.sum, coverage.percent, p90.value_or(0.0), *p95,
      cfg_.percentile, prox_target);

  // ─── Tile ─────────────────────────────────────────────────────────────────
  enter(Stage::Tile);
  const int tile_cells =
      std::max(1, static_cast<int>(prox_target * cfg_.chunk_level));
  const auto regions = tile(dem.spec().extent(), inc, tile_cells);
  spdlog::info("[Uncertainty] Chunked region into {} tiles of {} cells",
               regions.size(), tile_cells);

  // ─── Classify ─────────────────────────────────────────────────────────────
  enter(Stage::Classify);
  const auto tiles = analyzeTiles(dem, mask, regions);
  result.tiles = tiles.size();
  if (tiles.empty()) {
    spdlog::warn("[Uncertainty] No tile holds DEM data, skipping estimate");
    return result;
  }
  std::vector<double> densities;
  densities.reserve(tiles.size());
  for (const auto& t : tiles) densities.push_back(t.density);
  const double sample_density =
      *percentile(densities, cfg_.density_percentile);
  spdlog::info("[Uncertainty] Sampling density for region is: {:.16f}",
               sample_density);

  // ─── SelectTraining ───────────────────────────────────────────────────────
  enter(Stage::SelectTraining);
  auto trainers = selectTraining(tiles);
  for (auto& zone_tiles : trainers) {
    zone_tiles = declusterTiles(std::move(zone_tiles), rng_);
    result.training_tiles += zone_tiles.size();
  }

  // ─── Simulate ─────────────────────────────────────────────────────────────
  enter(Stage::Simulate);
  std::vector<ErrorSample> pooled;
  for (int sim = 0; sim < cfg_.simulations; ++sim) {
    for (const auto& zone_tiles : trainers) {
      std::optional<double> density = sample_density;
      const size_t n = std::min(zone_tiles.size(),
                                static_cast<size_t>(cfg_.max_training_tiles));
      for (size_t i = 0; i < n; ++i) {
        const auto& t = zone_tiles[i];
        // Sparse tile: keep a single point for the rest of this zone
        if (density && t.density < *density) density.reset();
        ++result.trials;
        try {
          runTrial(dem, mask, t, density, request, pooled);
        } catch (const ExternalToolFailure& e) {
          ++result.failed_trials;
          spdlog::warn("[Uncertainty] Trial over {} failed: {}",
                       formatRegion(t.region), e.what());
        }
      }
    }
    spdlog::info("[Uncertainty] Simulation {}/{}: {} error samples", sim + 1,
                 cfg_.simulations, pooled.size());
  }

  // ─── Aggregate ────────────────────────────────────────────────────────────
  enter(Stage::Aggregate);
  const double d_max = *p95;
  std::copy_if(pooled.begin(), pooled.end(),
               std::back_inserter(result.samples),
               [&](const ErrorSample& s) { return s.distance <= d_max; });
  spdlog::info("[Uncertainty] Gathered {} error samples ({} beyond {:.2f})",
               result.samples.size(), pooled.size() - result.samples.size(),
               d_max);

  // ─── Fit ──────────────────────────────────────────────────────────────────
  enter(Stage::Fit);
  result.distance_model = fitErrorModel(result.samples, Predictor::Distance,
                                        cfg_.max_fit_samples);
  result.slope_model =
      fitErrorModel(result.samples, Predictor::Slope, cfg_.max_fit_samples);
  if (!result.fitted()) {
    spdlog::warn("[Uncertainty] Too few error samples to fit a model");
    return result;
  }

  // ─── Apply ────────────────────────────────────────────────────────────────
  enter(Stage::Apply);
  if (result.distance_model) {
    result.proximity_uncertainty =
        applyErrorModel(*result.distance_model, result.proximity);
  }
  if (result.slope_model) {
    result.slope_uncertainty =
        applyErrorModel(*result.slope_model, result.slope);
  }
  if (result.distance_model && result.slope_model) {
    result.combined = combineUncertainty(result.proximity_uncertainty,
                                         result.slope_uncertainty,
                                         cfg_.combine);
  }
  return result;
}

void UncertaintyEstimator::runTrial(const Raster& dem, const Raster& mask,
                                    const TileSummary& tile,
                                    std::optional<double> sample_density,
                                    const GridRequest& request,
                                    std::vector<ErrorSample>& samples) {
  const double inc = dem.spec().cell_size;
  const Region extract = buffer(tile.region, cfg_.extract_buffer_cells * inc);
  const Raster sub_dem = crop(dem, extract);
  const Raster sub_mask = crop(mask, extract);

  // Inner points are tested, outer points give the trial its context
  std::vector<PointRecord> inner, outer;
  for (int r = 0; r < sub_dem.rows(); ++r) {
    for (int c = 0; c < sub_dem.cols(); ++c) {
      if (!sub_mask.isValid(r, c) || sub_mask(r, c) == 0.0f) continue;
      if (!sub_dem.isValid(r, c)) continue;
      const auto [x, y] = sub_dem.spec().cellCenter(r, c);
      const PointRecord pt{x, y, sub_dem(r, c), 1.0};
      (contains(tile.region, x, y) ? inner : outer).push_back(pt);
    }
  }
  if (inner.empty()) {
    spdlog::debug("[Uncertainty] No data in {}", formatRegion(tile.region));
    return;
  }

  std::shuffle(inner.begin(), inner.end(), rng_);
  size_t keep = 1;
  if (sample_density) {
    keep = static_cast<size_t>(tile.cells * (*sample_density / 100.0)) + 1;
  }
  keep = std::min(keep, inner.size());

  std::vector<PointRecord> trial_points = outer;
  trial_points.insert(trial_points.end(), inner.begin(), inner.begin() + keep);

  // Grid over the extract so the tile edges see their neighbours, then
  // measure inside the tile only
  GridRequest req = request;
  req.region = sub_dem.spec().region;
  VectorPointStream trial_stream(trial_points);
  const Raster trial = engine_->interpolate(req, trial_stream);

  VectorPointStream mask_stream(std::move(trial_points));
  const Raster trial_mask =
      GridBinner(BinMode::Presence).bin(mask_stream, trial.spec());
  const Raster trial_dem = crop(trial, tile.region);
  const Raster trial_prox = crop(proxy_->proximity(trial_mask), tile.region);
  const Raster trial_slope = crop(proxy_->slope(trial), tile.region);

  size_t added = 0;
  for (auto it = inner.begin() + keep; it != inner.end(); ++it) {
    const auto predicted = trial_dem.sample(it->x, it->y);
    const auto distance = trial_prox.sample(it->x, it->y);
    const auto slope = trial_slope.sample(it->x, it->y);
    if (!predicted || !distance || !slope) continue;
    samples.push_back({it->z - *predicted, *distance, *slope});
    ++added;
  }
  spdlog::debug(
      "[Uncertainty] {}: kept {} of {} inner points with {} context points, "
      "{} samples",
      formatRegion(tile.region), keep, inner.size(), outer.size(), added);
}

std::optional<Raster> combineUncertainty(const Raster& distance,
                                         const Raster& slope,
                                         CombineRule rule) {
  if (rule == CombineRule::None) return std::nullopt;
  if (!distance.spec().sameGeometry(slope.spec())) {
    throw std::invalid_argument("uncertainty layers differ in geometry");
  }

  Raster out(distance.spec());
  for (int r = 0; r < out.rows(); ++r) {
    for (int c = 0; c < out.cols(); ++c) {
      if (!distance.isValid(r, c) || !slope.isValid(r, c)) continue;
      const float a = distance(r, c);
      const float b = slope(r, c);
      out(r, c) = rule == CombineRule::Max ? std::max(a, b)
                                           : std::sqrt(a * a + b * b);
    }
  }
  return out;
}

}  // namespace datadem
