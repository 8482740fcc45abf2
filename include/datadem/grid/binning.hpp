// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * binning.hpp
 *
 * Point stream to grid binning under count / mean / presence policies.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_GRID_BINNING_HPP
#define DATADEM_GRID_BINNING_HPP

#include <Eigen/Core>
#include <memory>

#include "datadem/config/grid.hpp"
#include "datadem/grid/raster.hpp"
#include "datadem/point_types.hpp"

namespace datadem {

/**
 * @brief Per-cell partial sums for one grid.
 *
 * Keeps sum(weight * z), sum(weight) and the point count. Accumulators over
 * disjoint subsets of a stream merge by plain addition, so partial results
 * built independently (e.g. per thread) give the same final raster as a
 * single pass.
 */
class BinAccumulator {
 public:
  explicit BinAccumulator(const GridSpec& spec);

  /// Add one point. Returns false if it falls outside the grid.
  bool add(const PointRecord& pt);

  /// Add every point of a stream. Returns the number binned.
  size_t addAll(PointStream& stream);

  /// Per-cell addition. @throws std::invalid_argument on geometry mismatch
  void merge(const BinAccumulator& other);

  /**
   * @brief Final raster.
   *
   * Count:    number of points (0 where none)
   * Mean:     sum(w * z) / sum(w), nodata where none
   * Presence: 1 where >= 1 point, 0 elsewhere
   */
  Raster finalize(BinMode mode) const;

  const GridSpec& spec() const { return spec_; }
  const Eigen::MatrixXd& sumWeightedZ() const { return sum_wz_; }
  const Eigen::MatrixXd& sumWeight() const { return sum_w_; }
  const Eigen::MatrixXd& count() const { return count_; }
  size_t pointsBinned() const { return binned_; }

 private:
  GridSpec spec_;
  Eigen::MatrixXd sum_wz_;
  Eigen::MatrixXd sum_w_;
  Eigen::MatrixXd count_;
  size_t binned_ = 0;
};

/**
 * @brief Stream to raster binning.
 *
 * @code
 *   GridBinner binner(BinMode::Mean);
 *   Raster mean = binner.bin(stream, GridSpec::fromRegion(region, 0.5));
 * @endcode
 */
class GridBinner {
 public:
  explicit GridBinner(BinMode mode = BinMode::Mean) : mode_(mode) {}

  Raster bin(PointStream& points, const GridSpec& spec) const;

  BinMode mode() const { return mode_; }

 private:
  BinMode mode_;
};

/**
 * @brief Weighted block mean: one point per populated cell.
 *
 * Consumes the input fully and yields cell-center points carrying the
 * cell's weighted mean z (plain mean when use_weights is false) and the
 * cell's mean weight.
 */
PointStreamPtr blockMean(PointStream& input, const GridSpec& spec,
                         bool use_weights);

/// Factory function for consistent creation pattern
inline std::unique_ptr<GridBinner> createGridBinner(BinMode mode) {
  return std::make_unique<GridBinner>(mode);
}

}  // namespace datadem

#endif  // DATADEM_GRID_BINNING_HPP
