// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * tiling.hpp
 *
 * Tile analysis, zone classification and training-tile selection for the
 * split-sample uncertainty estimate.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_UNCERTAINTY_TILING_HPP
#define DATADEM_UNCERTAINTY_TILING_HPP

#include <array>
#include <random>
#include <string>
#include <vector>

#include "datadem/grid/raster.hpp"

namespace datadem {

/// Elevation-sign profile of a tile.
enum class Zone {
  Negative,  ///< zmax < 0 (bathymetry)
  Mixed,     ///< spans 0
  Positive,  ///< zmin > 0 (topography)
};

constexpr std::array<Zone, 3> kZones = {Zone::Negative, Zone::Mixed,
                                        Zone::Positive};

std::string toString(Zone zone);

Zone classifyZone(double z_min, double z_max);

struct TileSummary {
  Region region;
  size_t cells = 0;       ///< Grid cells in the tile
  size_t data_cells = 0;  ///< Cells with data in the mask
  double density = 0.0;   ///< 100 * data_cells / cells
  double z_min = 0.0;
  double z_max = 0.0;
  Zone zone = Zone::Mixed;
};

/**
 * @brief Summarize each tile against the full-region DEM and data mask.
 *
 * Tiles without any valid DEM cell are dropped.
 */
std::vector<TileSummary> analyzeTiles(const Raster& dem, const Raster& mask,
                                      const std::vector<Region>& tiles);

/// Training candidates per zone (indexed like kZones): tiles whose density
/// is above the median density of their zone.
std::array<std::vector<TileSummary>, 3> selectTraining(
    const std::vector<TileSummary>& tiles);

/**
 * @brief Spatially decorrelated trial order.
 *
 * Shuffles, then repeatedly takes the first remaining tile and moves the
 * tiles farther than the median center distance from it to the front
 * (reshuffled), so consecutive picks tend to be far apart. No tile is
 * dropped.
 */
std::vector<TileSummary> declusterTiles(std::vector<TileSummary> tiles,
                                        std::mt19937& rng);

}  // namespace datadem

#endif  // DATADEM_UNCERTAINTY_TILING_HPP
