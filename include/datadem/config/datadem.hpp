// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DATADEM_CONFIG_DATADEM_HPP
#define DATADEM_CONFIG_DATADEM_HPP

#include <optional>
#include <string>

namespace YAML {
class Node;
}

#include "datadem/config/catalog.hpp"
#include "datadem/config/grid.hpp"
#include "datadem/config/metadata.hpp"
#include "datadem/config/uncertainty.hpp"

namespace datadem {

namespace config {

/// Elevation limits applied to records and to cached entry extents.
struct PointFilter {
  std::optional<double> z_min;  ///< Lower limit
  std::optional<double> z_max;  ///< Upper limit
};

}  // namespace config

/// Pipeline configuration for datadem.
struct Config {
  config::Xyz xyz;
  config::Catalog catalog;
  config::PointFilter point_filter;
  config::Grid grid;
  config::Uncertainty uncertainty;
  config::Metadata metadata;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace datadem

#endif  // DATADEM_CONFIG_DATADEM_HPP
