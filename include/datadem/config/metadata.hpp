// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DATADEM_CONFIG_METADATA_HPP
#define DATADEM_CONFIG_METADATA_HPP

namespace datadem {
namespace config {

/// Spatial metadata (per-catalog data footprints).
struct Metadata {
  bool enabled = false;
  int workers = 3;
  double min_increment = 0.3333333 / 3600.0;  ///< Footprint grid floor
};

}  // namespace config
}  // namespace datadem

#endif  // DATADEM_CONFIG_METADATA_HPP
