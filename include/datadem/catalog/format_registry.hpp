// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * format_registry.hpp
 *
 * Maps catalog format codes and file extensions / schemes to entry kinds.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_CATALOG_FORMAT_REGISTRY_HPP
#define DATADEM_CATALOG_FORMAT_REGISTRY_HPP

#include <optional>
#include <string>
#include <vector>

namespace datadem {

/// Kind of source an entry refers to.
enum class FormatKind {
  Catalog,  ///< Another catalog (recursive)
  Points,   ///< Delimited x/y/z text
  Raster,   ///< Gridded source, scanned through the raster collaborator
  Remote,   ///< Fetched through a registered plugin
};

/// One registered format.
struct FormatSpec {
  int code = 0;
  FormatKind kind = FormatKind::Points;
  std::vector<std::string> extensions;  ///< Also scheme keys for Remote
  std::string plugin;  ///< Fixed fetch plugin; empty = scheme prefix decides
};

/**
 * @brief Registry of known catalog formats.
 *
 * defaults() carries the stock table (-1 catalog, 168 points, 200 raster,
 * 400 remote by scheme, 401-408 remote with a fixed plugin). Formats can be
 * added at runtime for extension.
 */
class FormatRegistry {
 public:
  static FormatRegistry defaults();

  /// Register (or replace) a format by code.
  void add(FormatSpec spec);

  std::optional<FormatSpec> find(int code) const;

  /**
   * @brief Infer a format code from a path.
   *
   * Uses the file extension; when that is unknown, the text before the
   * first ':' is looked up as a scheme key.
   */
  std::optional<int> infer(const std::string& path) const;

  const std::vector<FormatSpec>& formats() const { return formats_; }

 private:
  std::optional<int> lookup(const std::string& key) const;

  std::vector<FormatSpec> formats_;
};

const char* toString(FormatKind kind);

}  // namespace datadem

#endif  // DATADEM_CATALOG_FORMAT_REGISTRY_HPP
