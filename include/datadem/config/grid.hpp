// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DATADEM_CONFIG_GRID_HPP
#define DATADEM_CONFIG_GRID_HPP

#include <string>

namespace datadem {

/// Per-cell aggregation policy.
enum class BinMode {
  Count,     ///< Number of points per cell
  Mean,      ///< Weighted mean elevation
  Presence,  ///< 1 where data exists, 0 elsewhere
};

/// Grid registration of the output raster.
enum class NodeRegistration {
  Pixel,  ///< Cell-centered values, region is the outer edge
  Grid,   ///< Values on the region's grid lines (region buffered by inc/2)
};

/// DEM generation module.
enum class GridModule {
  Num,      ///< Uninterpolated binning (count / mean / mask)
  Surface,  ///< Interpolated surface through the grid engine
};

namespace config {

struct Grid {
  double increment = 0.0;  ///< Cell size; 0 = (east - west) / 500
  NodeRegistration node = NodeRegistration::Pixel;
  GridModule module = GridModule::Num;
  BinMode mode = BinMode::Mean;
  int extend = 0;        ///< Output padding in cells
  int extend_proc = 10;  ///< Extra processing padding in cells
  float nodata = -9999.0f;
  int chunk = 0;  ///< Number of chunks per row; 0 = unchunked
  bool mask = false;  ///< Also write a data mask grid
  std::string name = "datadem";
  std::string name_prefix;  ///< If set, name = prefix + inc + region + year

  // Built-in surface engine
  int fill_iterations = 0;  ///< Neighbour-averaging passes; 0 = until filled
  int fill_min_neighbors = 1;
};

}  // namespace config
}  // namespace datadem

#endif  // DATADEM_CONFIG_GRID_HPP
