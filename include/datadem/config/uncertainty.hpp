// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DATADEM_CONFIG_UNCERTAINTY_HPP
#define DATADEM_CONFIG_UNCERTAINTY_HPP

#include <cstddef>
#include <cstdint>

namespace datadem {

/// Rule for combining the distance- and slope-based uncertainty layers.
enum class CombineRule {
  None,        ///< Keep both layers separate
  Max,         ///< max(distance, slope)
  Quadrature,  ///< sqrt(distance^2 + slope^2)
};

namespace config {

struct Uncertainty {
  bool enabled = false;
  double percentile = 95.0;      ///< Proximity percentile driving tile size
  int simulations = 10;          ///< Split-sample repetitions
  int chunk_level = 4;           ///< Tile size multiplier
  int max_training_tiles = 25;   ///< Per zone and simulation
  int extract_buffer_cells = 20; ///< Context buffer around each tile
  double density_percentile = 5.0;
  uint32_t seed = 0;  ///< 0 = non-deterministic
  CombineRule combine = CombineRule::None;
  size_t max_fit_samples = 50000000;
  bool write_errors = false;  ///< Dump <name>_prox.err / <name>_slp.err
};

}  // namespace config
}  // namespace datadem

#endif  // DATADEM_CONFIG_UNCERTAINTY_HPP
