// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * estimator.hpp
 *
 * Split-sample interpolation uncertainty.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_UNCERTAINTY_ESTIMATOR_HPP
#define DATADEM_UNCERTAINTY_ESTIMATOR_HPP

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "datadem/config/uncertainty.hpp"
#include "datadem/services/grid_engine.hpp"
#include "datadem/services/raster_proxy.hpp"
#include "datadem/uncertainty/error_model.hpp"
#include "datadem/uncertainty/tiling.hpp"

namespace datadem {

/// Run stages, in order.
enum class Stage {
  Analyze,
  Tile,
  Classify,
  SelectTraining,
  Simulate,
  Aggregate,
  Fit,
  Apply,
};

std::string toString(Stage stage);

struct UncertaintyResult {
  std::optional<ErrorModel> distance_model;
  std::optional<ErrorModel> slope_model;

  Raster proximity;              ///< Full-region distance to data (cells)
  Raster slope;                  ///< Full-region slope (degrees)
  Raster proximity_uncertainty;  ///< Empty when no distance model
  Raster slope_uncertainty;      ///< Empty when no slope model
  std::optional<Raster> combined;

  std::vector<ErrorSample> samples;  ///< After the distance guard
  size_t tiles = 0;
  size_t training_tiles = 0;
  size_t trials = 0;
  size_t failed_trials = 0;

  bool fitted() const { return distance_model || slope_model; }
};

/**
 * @brief Empirical interpolation error as a function of distance to data
 * and slope.
 *
 * The region is tiled by a multiple of the target proximity percentile.
 * In each simulation, dense training tiles of every zone are re-gridded
 * over the tile plus extract_buffer_cells on each side, from the
 * surrounding data plus a random subset of the tile's own data; the trial
 * surface is cropped back to the tile and compared with the withheld
 * points. The pooled errors
 * are fitted with a power law against proximity and against slope, and
 * the fits are evaluated over the full-region proximity and slope grids.
 *
 * @code
 *   UncertaintyEstimator estimator(cfg.uncertainty, engine, proxy);
 *   auto result = estimator.estimate(dem, mask, request);
 *   if (result.fitted()) io.write(result.proximity_uncertainty, "unc");
 * @endcode
 */
class UncertaintyEstimator {
 public:
  UncertaintyEstimator(const config::Uncertainty& cfg,
                       std::shared_ptr<ExternalGridEngine> engine,
                       std::shared_ptr<RasterProxyService> proxy);

  /**
   * @param dem Full-region surface
   * @param mask Data presence over the same grid (1 = data)
   * @param request Engine settings reused for each trial; its region is
   *   replaced by the buffered trial tile
   * @throws std::invalid_argument if dem and mask differ in geometry
   */
  UncertaintyResult estimate(const Raster& dem, const Raster& mask,
                             const GridRequest& request);

  Stage stage() const { return stage_; }

 private:
  /// One withhold-and-resample trial. Appends to samples.
  void runTrial(const Raster& dem, const Raster& mask, const TileSummary& tile,
                std::optional<double> sample_density,
                const GridRequest& request, std::vector<ErrorSample>& samples);

  void enter(Stage stage);

  config::Uncertainty cfg_;
  std::shared_ptr<ExternalGridEngine> engine_;
  std::shared_ptr<RasterProxyService> proxy_;
  std::mt19937 rng_;
  Stage stage_ = Stage::Analyze;
};

/// Per-cell combination of the two uncertainty layers.
std::optional<Raster> combineUncertainty(const Raster& distance,
                                         const Raster& slope,
                                         CombineRule rule);

}  // namespace datadem

#endif  // DATADEM_UNCERTAINTY_ESTIMATOR_HPP
