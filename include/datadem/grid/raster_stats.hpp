// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DATADEM_GRID_RASTER_STATS_HPP
#define DATADEM_GRID_RASTER_STATS_HPP

#include <optional>
#include <utility>
#include <vector>

#include "datadem/grid/raster.hpp"

namespace datadem {

/// Percentile p in [0, 100] with linear interpolation between ranks.
/// @return nullopt for an empty input
std::optional<double> percentile(std::vector<double> values, double p);

/// Percentile over the valid cells of a raster.
std::optional<double> percentile(const Raster& raster, double p);

/// Coverage of a 0/1 mask grid.
struct MaskStats {
  double sum = 0.0;      ///< Cells with data
  double max = 0.0;      ///< width * height
  double percent = 0.0;  ///< 100 * sum / max
};

MaskStats maskAnalysis(const Raster& mask);

/// (min, max) over valid cells; nullopt if none.
std::optional<std::pair<float, float>> zRange(const Raster& raster);

}  // namespace datadem

#endif  // DATADEM_GRID_RASTER_STATS_HPP
