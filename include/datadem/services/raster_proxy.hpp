// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster_proxy.hpp
 *
 * Proximity and slope rasters used as uncertainty proxies.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_SERVICES_RASTER_PROXY_HPP
#define DATADEM_SERVICES_RASTER_PROXY_HPP

#include <memory>

#include "datadem/grid/raster.hpp"

namespace datadem {

/**
 * @brief Proximity / slope collaborator.
 */
class RasterProxyService {
 public:
  virtual ~RasterProxyService() = default;

  /**
   * @brief Distance in cells from every cell to the nearest data cell.
   *
   * Data cells are the valid, non-zero cells of mask. The result is 0 on
   * data cells and nodata everywhere when the mask holds no data.
   */
  virtual Raster proximity(const Raster& mask) = 0;

  /// Slope in degrees. nodata where the DEM has no value.
  virtual Raster slope(const Raster& dem) = 0;
};

/**
 * @brief In-process implementation.
 *
 * Proximity is an exact Euclidean distance transform (separable lower
 * envelope of parabolas). Slope uses Horn's 3x3 gradient, with
 * horizontal units multiplied by scale before comparison with z
 * (e.g. 111120 for geographic grids in metres).
 */
class GridProxyService : public RasterProxyService {
 public:
  explicit GridProxyService(double scale = 1.0) : scale_(scale) {}

  Raster proximity(const Raster& mask) override;
  Raster slope(const Raster& dem) override;

 private:
  double scale_;
};

/// Factory function for consistent creation pattern
inline std::unique_ptr<RasterProxyService> createProxyService(
    double scale = 1.0) {
  return std::make_unique<GridProxyService>(scale);
}

}  // namespace datadem

#endif  // DATADEM_SERVICES_RASTER_PROXY_HPP
