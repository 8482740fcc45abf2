// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DATADEM_CONFIG_CATALOG_HPP
#define DATADEM_CONFIG_CATALOG_HPP

#include <string>

namespace datadem {

/// How a weight override propagates through nested catalogs.
enum class WeightMode {
  Compound,  ///< Effective weight multiplies at every nesting level
  RootOnly,  ///< Override applied once: leaf weight = override * entry weight
};

namespace config {

/// Column layout of delimited point files.
struct Xyz {
  std::string delimiter;  ///< Empty = detect per file
  int x_column = 0;
  int y_column = 1;
  int z_column = 2;
  int skip_lines = 0;  ///< Header lines to skip
};

struct Catalog {
  bool use_weights = false;  ///< Apply a weight override of 1 at the root
  WeightMode weight_mode = WeightMode::Compound;
  bool overwrite_extents = false;      ///< Regenerate every .inf sidecar
  bool refresh_stale_extents = false;  ///< Regenerate when source is newer
  double remote_padding = 0.05;        ///< Fractional buffer for fetch queries
};

}  // namespace config
}  // namespace datadem

#endif  // DATADEM_CONFIG_CATALOG_HPP
