// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * extent_cache.hpp
 *
 * ".inf" sidecar files holding the x/y/z extent of a source.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_CATALOG_EXTENT_CACHE_HPP
#define DATADEM_CATALOG_EXTENT_CACHE_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "datadem/region.hpp"

namespace datadem {

/// "<source>.inf"
std::string infPath(const std::string& source);

/**
 * @brief Parse an extent sidecar.
 *
 * Accepts a line of 4-6 floats "xmin xmax ymin ymax [zmin zmax]" or
 * MB-System style "Minimum Longitude: ... Maximum Longitude: ..." blocks.
 *
 * @return Extent, or nullopt if unreadable or degenerate
 */
std::optional<Region> readInf(const std::string& inf_path);

/// Write a one-line sidecar. @throws std::runtime_error on I/O failure.
void writeInf(const std::string& inf_path, const Region& extent);

/**
 * @brief Lazily computed, persisted extents keyed by source path.
 *
 * get() returns the sidecar's extent when present, otherwise computes it,
 * writes the sidecar, and returns it. Sidecars are regenerated only when
 * overwrite is requested, or (optionally) when the source is newer than its
 * sidecar. Results are memoized per cache instance, so one run regenerates
 * each sidecar at most once.
 *
 * Thread-safe: concurrent callers may compute the same extent, but sidecar
 * writes are serialized.
 */
class ExtentCache {
 public:
  using Compute = std::function<std::optional<Region>()>;

  ExtentCache() = default;
  ExtentCache(bool overwrite, bool refresh_stale)
      : overwrite_(overwrite), refresh_stale_(refresh_stale) {}

  std::optional<Region> get(const std::string& source, const Compute& compute);

  /// Drop memoized extents (sidecars on disk are kept).
  void clear();

 private:
  bool needsRefresh(const std::string& source, const std::string& inf) const;

  bool overwrite_ = false;
  bool refresh_stale_ = false;

  std::mutex memo_mutex_;
  std::unordered_map<std::string, std::optional<Region>> memo_;
  std::mutex write_mutex_;
};

}  // namespace datadem

#endif  // DATADEM_CATALOG_EXTENT_CACHE_HPP
