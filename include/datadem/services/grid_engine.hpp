// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_engine.hpp
 *
 * Interpolating surface engine seam and the built-in neighbour-fill engine.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_SERVICES_GRID_ENGINE_HPP
#define DATADEM_SERVICES_GRID_ENGINE_HPP

#include <map>
#include <memory>
#include <string>

#include "datadem/grid/raster.hpp"
#include "datadem/point_types.hpp"

namespace datadem {

/// One interpolation job.
struct GridRequest {
  Region region;
  double cell_size = 1.0;
  std::string method = "surface";
  std::map<std::string, std::string> params;
  float nodata = -9999.0f;
  bool use_weights = false;
};

/**
 * @brief Interpolation collaborator.
 *
 * Consumes the point stream and returns a raster over
 * GridSpec::fromRegion(req.region, req.cell_size). Points outside
 * req.region are dropped; callers that want edge context must widen the
 * region and crop the result afterwards.
 *
 * @throws ExternalToolFailure if no surface could be produced
 */
class ExternalGridEngine {
 public:
  virtual ~ExternalGridEngine() = default;
  virtual Raster interpolate(const GridRequest& req, PointStream& points) = 0;
};

/**
 * @brief Block mean followed by iterative 8-neighbour averaging.
 *
 * Each pass fills every empty cell that has at least min_neighbors valid
 * neighbours with their mean; passes stop when nothing changes or after
 * max_iterations (0 = until the grid stops changing).
 */
class InpaintingGridEngine : public ExternalGridEngine {
 public:
  InpaintingGridEngine(int max_iterations = 0, int min_neighbors = 1)
      : max_iterations_(max_iterations), min_neighbors_(min_neighbors) {}

  Raster interpolate(const GridRequest& req, PointStream& points) override;

 private:
  int max_iterations_;
  int min_neighbors_;
};

/// Fill empty cells in place. Returns the number of cells filled.
size_t fillGaps(Raster& raster, int max_iterations, int min_neighbors);

/// Factory function for consistent creation pattern
inline std::unique_ptr<ExternalGridEngine> createGridEngine(
    int max_iterations = 0, int min_neighbors = 1) {
  return std::make_unique<InpaintingGridEngine>(max_iterations, min_neighbors);
}

}  // namespace datadem

#endif  // DATADEM_SERVICES_GRID_ENGINE_HPP
