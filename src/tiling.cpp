// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/uncertainty/tiling.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "datadem/grid/raster_stats.hpp"

namespace datadem {

std::string toString(Zone zone) {
  switch (zone) {
    case Zone::Negative:
      return "negative";
    case Zone::Mixed:
      return "mixed";
    case Zone::Positive:
      return "positive";
  }
  return "unknown";
}

Zone classifyZone(double z_min, double z_max) {
  if (z_max < 0.0) return Zone::Negative;
  if (z_min > 0.0) return Zone::Positive;
  return Zone::Mixed;
}

std::vector<TileSummary> analyzeTiles(const Raster& dem, const Raster& mask,
                                      const std::vector<Region>& tiles) {
  std::vector<TileSummary> out;
  out.reserve(tiles.size());
  for (const auto& region : tiles) {
    const Raster tile_dem = crop(dem, region);
    const Raster tile_mask = crop(mask, region);
    if (tile_dem.empty() || tile_mask.empty()) continue;

    const auto z = zRange(tile_dem);
    if (!z) continue;

    const auto stats = maskAnalysis(tile_mask);
    TileSummary t;
    t.region = region;
    t.cells = static_cast<size_t>(stats.max);
    t.data_cells = static_cast<size_t>(stats.sum);
    t.density = stats.percent;
    t.z_min = z->first;
    t.z_max = z->second;
    t.zone = classifyZone(t.z_min, t.z_max);
    out.push_back(t);
  }
  return out;
}

std::array<std::vector<TileSummary>, 3> selectTraining(
    const std::vector<TileSummary>& tiles) {
  std::array<std::vector<TileSummary>, 3> trainers;
  for (size_t z = 0; z < kZones.size(); ++z) {
    std::vector<double> densities;
    for (const auto& t : tiles) {
      if (t.zone == kZones[z]) densities.push_back(t.density);
    }
    const double median = percentile(densities, 50.0).value_or(0.0);
    for (const auto& t : tiles) {
      if (t.zone == kZones[z] && t.density > median) trainers[z].push_back(t);
    }
    spdlog::debug("[Uncertainty] {} tiles: median density {:.4f}, {} trainers",
                  toString(kZones[z]), median, trainers[z].size());
  }
  return trainers;
}

std::vector<TileSummary> declusterTiles(std::vector<TileSummary> tiles,
                                        std::mt19937& rng) {
  std::vector<TileSummary> ordered;
  ordered.reserve(tiles.size());
  std::shuffle(tiles.begin(), tiles.end(), rng);

  auto rest = tiles.begin();
  while (rest != tiles.end()) {
    const Region picked = rest->region;
    ordered.push_back(*rest);
    ++rest;
    if (rest == tiles.end()) break;

    std::vector<double> dists;
    for (auto it = rest; it != tiles.end(); ++it) {
      dists.push_back(centerDistance(picked, it->region));
    }
    const double median = *percentile(dists, 50.0);

    std::shuffle(rest, tiles.end(), rng);
    std::stable_partition(rest, tiles.end(), [&](const TileSummary& t) {
      return centerDistance(picked, t.region) > median;
    });
  }
  return ordered;
}

}  // namespace datadem
