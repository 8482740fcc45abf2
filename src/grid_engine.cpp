// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_engine.cpp
 *
 * Iterative neighbour averaging over a block-mean grid.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/services/grid_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "datadem/errors.hpp"
#include "datadem/grid/binning.hpp"

namespace datadem {

namespace {

// 8-connected neighbor offsets
constexpr int dx[] = {-1, 0, 1, -1, 1, -1, 0, 1};
constexpr int dy[] = {-1, -1, -1, 0, 0, 1, 1, 1};

bool neighborMean(const Raster& grid, int r, int c, int min_valid,
                  float& mean) {
  float sum = 0.0f;
  int valid = 0;
  for (int i = 0; i < 8; ++i) {
    const int nr = r + dy[i];
    const int nc = c + dx[i];
    if (!grid.spec().contains(nr, nc) || !grid.isValid(nr, nc)) continue;
    sum += grid(nr, nc);
    ++valid;
  }
  if (valid == 0 || valid < min_valid) return false;
  mean = sum / static_cast<float>(valid);
  return true;
}

}  // namespace

size_t fillGaps(Raster& raster, int max_iterations, int min_neighbors) {
  const int passes = max_iterations > 0
                         ? max_iterations
                         : raster.rows() + raster.cols();
  size_t filled = 0;

  Raster buffer = raster;
  for (int iter = 0; iter < passes; ++iter) {
    size_t changed = 0;
    buffer.data() = raster.data();

    for (int r = 0; r < raster.rows(); ++r) {
      for (int c = 0; c < raster.cols(); ++c) {
        if (raster.isValid(r, c)) continue;
        float mean = 0.0f;
        if (neighborMean(raster, r, c, min_neighbors, mean)) {
          buffer(r, c) = mean;
          ++changed;
        }
      }
    }

    raster.data().swap(buffer.data());
    filled += changed;
    if (changed == 0) break;
  }
  return filled;
}

Raster InpaintingGridEngine::interpolate(const GridRequest& req,
                                         PointStream& points) {
  const auto spec = GridSpec::fromRegion(req.region, req.cell_size, req.nodata);

  auto blocks = blockMean(points, spec, req.use_weights);
  Raster surface = GridBinner(BinMode::Mean).bin(*blocks, spec);
  const size_t seeds = surface.validCount();
  if (seeds == 0) {
    throw ExternalToolFailure("no data to interpolate in " +
                              formatRegion(req.region));
  }

  const size_t filled = fillGaps(surface, max_iterations_, min_neighbors_);
  spdlog::debug("[GridEngine] {}: {} block means, {} cells filled",
                req.method, seeds, filled);
  return surface;
}

}  // namespace datadem
