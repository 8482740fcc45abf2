// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_datadem.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include "datadem/config/datadem.hpp"
#include "datadem/region.hpp"

namespace datadem {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

void loadOptional(const YAML::Node& node, const std::string& key,
                  std::optional<double>& value) {
  if (node[key] && !node[key].IsNull()) {
    value = node[key].as<double>();
  }
}

void loadIncrement(const YAML::Node& node, const std::string& key,
                   double& value) {
  if (!node[key]) return;
  const auto text = node[key].as<std::string>();
  value = parseIncrement(text);
  if (value < 0.0) {
    throw std::invalid_argument(key + " must be >= 0, got '" + text + "'");
  }
}

WeightMode parseWeightMode(const std::string& mode) {
  if (mode == "compound") return WeightMode::Compound;
  if (mode == "root_only") return WeightMode::RootOnly;
  spdlog::warn("[Config] Unknown weight_mode '{}', defaulting to compound",
               mode);
  return WeightMode::Compound;
}

BinMode parseBinMode(const std::string& mode) {
  if (mode == "count" || mode == "n") return BinMode::Count;
  if (mode == "mean" || mode == "m") return BinMode::Mean;
  if (mode == "mask" || mode == "presence" || mode == "k") {
    return BinMode::Presence;
  }
  spdlog::warn("[Config] Unknown grid.mode '{}', defaulting to mean", mode);
  return BinMode::Mean;
}

NodeRegistration parseNode(const std::string& node) {
  if (node == "pixel") return NodeRegistration::Pixel;
  if (node == "grid") return NodeRegistration::Grid;
  spdlog::warn("[Config] Unknown grid.node '{}', defaulting to pixel", node);
  return NodeRegistration::Pixel;
}

GridModule parseModule(const std::string& module) {
  if (module == "num") return GridModule::Num;
  if (module == "surface") return GridModule::Surface;
  spdlog::warn("[Config] Unknown grid.module '{}', defaulting to num", module);
  return GridModule::Num;
}

CombineRule parseCombineRule(const std::string& rule) {
  if (rule == "none") return CombineRule::None;
  if (rule == "max") return CombineRule::Max;
  if (rule == "quadrature") return CombineRule::Quadrature;
  spdlog::warn("[Config] Unknown uncertainty.combine '{}', defaulting to none",
               rule);
  return CombineRule::None;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Point file layout
  if (auto n = root["xyz"]) {
    load(n, "delimiter", cfg.xyz.delimiter);
    load(n, "x_column", cfg.xyz.x_column);
    load(n, "y_column", cfg.xyz.y_column);
    load(n, "z_column", cfg.xyz.z_column);
    load(n, "skip_lines", cfg.xyz.skip_lines);
  }

  // Catalog traversal
  if (auto n = root["catalog"]) {
    load(n, "use_weights", cfg.catalog.use_weights);
    std::string mode_str;
    load(n, "weight_mode", mode_str);
    if (!mode_str.empty()) cfg.catalog.weight_mode = parseWeightMode(mode_str);
    load(n, "overwrite_extents", cfg.catalog.overwrite_extents);
    load(n, "refresh_stale_extents", cfg.catalog.refresh_stale_extents);
    load(n, "remote_padding", cfg.catalog.remote_padding);
  }

  // Point filter
  if (auto n = root["point_filter"]) {
    loadOptional(n, "z_min", cfg.point_filter.z_min);
    loadOptional(n, "z_max", cfg.point_filter.z_max);
  }

  // Grid
  if (auto n = root["grid"]) {
    auto& g = cfg.grid;
    loadIncrement(n, "increment", g.increment);
    std::string str;
    load(n, "node", str);
    if (!str.empty()) g.node = parseNode(str);
    str.clear();
    load(n, "module", str);
    if (!str.empty()) g.module = parseModule(str);
    str.clear();
    load(n, "mode", str);
    if (!str.empty()) g.mode = parseBinMode(str);
    load(n, "extend", g.extend);
    load(n, "extend_proc", g.extend_proc);
    load(n, "nodata", g.nodata);
    load(n, "chunk", g.chunk);
    load(n, "mask", g.mask);
    load(n, "weights", cfg.catalog.use_weights);
    load(n, "name", g.name);
    load(n, "name_prefix", g.name_prefix);
    load(n, "fill_iterations", g.fill_iterations);
    load(n, "fill_min_neighbors", g.fill_min_neighbors);
  }

  // Uncertainty
  if (auto n = root["uncertainty"]) {
    auto& u = cfg.uncertainty;
    load(n, "enabled", u.enabled);
    load(n, "percentile", u.percentile);
    load(n, "simulations", u.simulations);
    load(n, "chunk_level", u.chunk_level);
    load(n, "max_training_tiles", u.max_training_tiles);
    load(n, "extract_buffer_cells", u.extract_buffer_cells);
    load(n, "density_percentile", u.density_percentile);
    load(n, "seed", u.seed);
    std::string combine_str;
    load(n, "combine", combine_str);
    if (!combine_str.empty()) u.combine = parseCombineRule(combine_str);
    load(n, "max_fit_samples", u.max_fit_samples);
    load(n, "write_errors", u.write_errors);
  }

  // Spatial metadata
  if (auto n = root["metadata"]) {
    load(n, "enabled", cfg.metadata.enabled);
    load(n, "workers", cfg.metadata.workers);
    loadIncrement(n, "min_increment", cfg.metadata.min_increment);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: invalid ranges that break the pipeline ---
  const auto& pf = cfg.point_filter;
  if (pf.z_min && pf.z_max && *pf.z_min > *pf.z_max) {
    throw std::invalid_argument(
        "point_filter: z_min (" + std::to_string(*pf.z_min) + ") > z_max (" +
        std::to_string(*pf.z_max) + ")");
  }
  if (cfg.grid.increment < 0.0) {
    throw std::invalid_argument("grid.increment (" +
                                std::to_string(cfg.grid.increment) +
                                ") must be >= 0");
  }
  if (!(cfg.uncertainty.percentile > 0.0 &&
        cfg.uncertainty.percentile <= 100.0)) {
    throw std::invalid_argument("uncertainty.percentile (" +
                                std::to_string(cfg.uncertainty.percentile) +
                                ") must be in (0, 100]");
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp = [](const std::string& name, auto& val, auto lo, auto hi) {
    if (val < lo || val > hi) {
      spdlog::warn("[Config] {} ({}) out of range [{}, {}], clamping", name,
                   val, lo, hi);
      val = std::clamp(val, static_cast<std::decay_t<decltype(val)>>(lo),
                       static_cast<std::decay_t<decltype(val)>>(hi));
    }
  };

  auto& x = cfg.xyz;
  warn_clamp("xyz.x_column", x.x_column, 0, 255);
  warn_clamp("xyz.y_column", x.y_column, 0, 255);
  warn_clamp("xyz.z_column", x.z_column, 0, 255);
  warn_clamp("xyz.skip_lines", x.skip_lines, 0, 1 << 20);
  if (x.x_column == x.y_column || x.x_column == x.z_column ||
      x.y_column == x.z_column) {
    throw std::invalid_argument(
        "xyz: x/y/z columns must differ, got " + std::to_string(x.x_column) +
        "/" + std::to_string(x.y_column) + "/" + std::to_string(x.z_column));
  }
  if (x.delimiter.size() > 1) {
    spdlog::warn("[Config] xyz.delimiter '{}' is not a single character, "
                 "falling back to auto-detection",
                 x.delimiter);
    x.delimiter.clear();
  }

  warn_clamp("catalog.remote_padding", cfg.catalog.remote_padding, 0.0, 1.0);

  auto& g = cfg.grid;
  warn_clamp("grid.extend", g.extend, 0, 1 << 16);
  warn_clamp("grid.extend_proc", g.extend_proc, 0, 1 << 16);
  warn_clamp("grid.chunk", g.chunk, 0, 1 << 16);
  warn_clamp("grid.fill_iterations", g.fill_iterations, 0, 1 << 20);
  warn_clamp("grid.fill_min_neighbors", g.fill_min_neighbors, 1, 8);
  if (g.name.empty()) {
    spdlog::warn("[Config] grid.name is empty, using 'datadem'");
    g.name = "datadem";
  }

  auto& u = cfg.uncertainty;
  warn_clamp("uncertainty.simulations", u.simulations, 1, 1000);
  warn_clamp("uncertainty.chunk_level", u.chunk_level, 1, 1000);
  warn_clamp("uncertainty.max_training_tiles", u.max_training_tiles, 1,
             1 << 20);
  warn_clamp("uncertainty.extract_buffer_cells", u.extract_buffer_cells, 0,
             1 << 16);
  warn_clamp("uncertainty.density_percentile", u.density_percentile, 0.0,
             100.0);
  if (u.max_fit_samples == 0) {
    spdlog::warn("[Config] uncertainty.max_fit_samples must be > 0, "
                 "clamping to 50000000");
    u.max_fit_samples = 50000000;
  }

  warn_clamp("metadata.workers", cfg.metadata.workers, 1, 64);
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace datadem
