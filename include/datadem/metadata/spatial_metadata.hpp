// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * spatial_metadata.hpp
 *
 * Data footprints of sub-catalogs, built by a worker pool into one shared
 * polygon layer.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_METADATA_SPATIAL_METADATA_HPP
#define DATADEM_METADATA_SPATIAL_METADATA_HPP

#include <array>
#include <mutex>
#include <string>
#include <vector>

#include "datadem/catalog/resolver.hpp"
#include "datadem/config/metadata.hpp"
#include "datadem/grid/raster.hpp"
#include "datadem/services/vector_io.hpp"

namespace datadem {

/// Attribute schema of footprint features.
constexpr std::array<const char*, 8> kMetadataFields = {
    "Name", "Agency", "Date", "Type", "Resolution", "HDatum", "VDatum", "URL"};

std::vector<std::string> metadataFieldNames();

/**
 * @brief Attribute values for a sub-catalog.
 *
 * The entry's metadata when it carries all eight fields, otherwise
 * [name, Unknown, 0, xyz_elevation, Unknown, WGS84, NAVD88, URL].
 */
std::vector<std::string> metadataValues(const EntryInfo& info,
                                        const std::string& name);

/**
 * @brief Footprint of the non-zero valid cells of a mask.
 *
 * Horizontal runs of covered cells are merged with identical runs in the
 * rows below, giving one rectangle per merged run.
 */
MultiPolygon polygonize(const Raster& mask);

/**
 * @brief Bulk footprint generation.
 *
 * Each direct sub-catalog of the root that passes pruning is queued; a
 * pool of workers resolves each one into a presence mask over the region
 * and appends its footprint to the layer. Appends are serialized.
 */
class SpatialMetadata {
 public:
  SpatialMetadata(const config::Metadata& cfg, const CatalogResolver& resolver)
      : cfg_(cfg), resolver_(resolver) {}

  /**
   * @return Number of features appended
   * @throws InvalidRegion if region is degenerate
   */
  size_t run(const std::string& root, const Region& region, double increment,
             VectorLayer& layer);

 private:
  bool footprint(const ResolvedEntry& entry, const GridSpec& spec,
                 Feature& feature) const;

  config::Metadata cfg_;
  const CatalogResolver& resolver_;
  std::mutex layer_mutex_;
};

}  // namespace datadem

#endif  // DATADEM_METADATA_SPATIAL_METADATA_HPP
