// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_spec.hpp
 *
 * Raster geometry: north-up affine transform, dimensions and nodata.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_GRID_GRID_SPEC_HPP
#define DATADEM_GRID_GRID_SPEC_HPP

#include <array>
#include <optional>
#include <utility>

#include "datadem/region.hpp"

namespace datadem {

/**
 * @brief North-up affine geotransform.
 *
 * Pixel (col, row) has its center at
 *   x = origin_x + (col + 0.5) * cell_x
 *   y = origin_y + (row + 0.5) * cell_y   (cell_y < 0)
 */
struct GeoTransform {
  double origin_x = 0.0;  ///< West edge
  double cell_x = 1.0;
  double origin_y = 0.0;  ///< North edge
  double cell_y = -1.0;

  /// GDAL ordering: {origin_x, cell_x, 0, origin_y, 0, cell_y}
  std::array<double, 6> toArray() const {
    return {origin_x, cell_x, 0.0, origin_y, 0.0, cell_y};
  }
};

/// Cell index, (row, col) with row 0 at the north edge.
struct CellIndex {
  int row = 0;
  int col = 0;

  bool operator==(const CellIndex& o) const {
    return row == o.row && col == o.col;
  }
};

/**
 * @brief Geometry of a raster derived once from a region and a cell size.
 */
struct GridSpec {
  Region region;
  double cell_size = 1.0;
  int width = 0;
  int height = 0;
  GeoTransform transform;
  float nodata = -9999.0f;

  /**
   * @brief Build from region and cell size.
   *
   * Dimensions are the region extent in cells rounded to nearest (at
   * least 1). The transform's origin is the region's north-west corner.
   *
   * @throws InvalidRegion if the region is degenerate
   * @throws std::invalid_argument if cell_size <= 0
   */
  static GridSpec fromRegion(const Region& region, double cell_size,
                             float nodata = -9999.0f);

  /// Cell containing (x, y), or nullopt if outside the grid.
  std::optional<CellIndex> cellAt(double x, double y) const;

  /// Unbounded inverse transform: floor((x - x0) / dx), floor((y - y0) / dy).
  CellIndex toCell(double x, double y) const;

  /// Geographic center of a cell.
  std::pair<double, double> cellCenter(int row, int col) const;

  /// Region covered by the grid (may differ slightly from `region`).
  Region extent() const;

  size_t cellCount() const {
    return static_cast<size_t>(width) * static_cast<size_t>(height);
  }

  bool contains(int row, int col) const {
    return row >= 0 && row < height && col >= 0 && col < width;
  }

  bool sameGeometry(const GridSpec& other) const;
};

}  // namespace datadem

#endif  // DATADEM_GRID_GRID_SPEC_HPP
