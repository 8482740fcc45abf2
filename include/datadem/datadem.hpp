// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * datadem.hpp
 *
 * DataDEM: catalogs in, gridded DEM (plus mask, uncertainty and
 * footprints) out.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_DATADEM_HPP
#define DATADEM_DATADEM_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Configs
#include "datadem/config/datadem.hpp"

// Core objects
#include "datadem/catalog/resolver.hpp"
#include "datadem/grid/binning.hpp"
#include "datadem/services/fetch.hpp"
#include "datadem/services/grid_engine.hpp"
#include "datadem/services/raster_io.hpp"
#include "datadem/services/raster_proxy.hpp"
#include "datadem/uncertainty/estimator.hpp"

namespace datadem {

/// Paths written by one run.
struct DemProducts {
  std::string dem;
  std::optional<std::string> mask;
  std::optional<std::string> proximity_uncertainty;
  std::optional<std::string> slope_uncertainty;
  std::optional<std::string> uncertainty;
  std::optional<std::string> spatial_metadata;

  size_t chunks = 0;          ///< 1 when unchunked
  size_t chunks_dropped = 0;  ///< Failed or empty chunks
};

/**
 * @brief DEM generation from one or more catalogs.
 *
 * Geometry of a run:
 *   - region: as set, else the merged extent of the catalogs
 *   - increment: as set, else (east - west) / 500
 *   - grid node registration buffers the region by half a cell
 *   - output (distribution) region: region + extend cells
 *   - processing region: output region + extend_proc cells
 *
 * With chunking, the output region is tiled and each chunk is gridded on
 * its own; failed or empty chunks are dropped and the rest mosaicked.
 * Without chunking a gridding failure is fatal.
 *
 * @code
 *   DataDEM dem(loadConfig("config/default.yaml"));
 *   dem.setRegion(parseRegion("-R-5/5/-5/5"))
 *       .setIncrement(parseIncrement("1s"))
 *       .setName("out/test");
 *   auto products = dem.run({"soundings.datalist"});
 * @endcode
 */
class DataDEM {
 public:
  DataDEM();
  explicit DataDEM(const Config& cfg);

  // ─── Builder ──────────────────────────────────────────────────────────────

  DataDEM& setRegion(const Region& region);
  DataDEM& setIncrement(double increment);
  DataDEM& setName(const std::string& name);
  DataDEM& setNamePrefix(const std::string& prefix);
  DataDEM& setModule(GridModule module);
  DataDEM& setBinMode(BinMode mode);
  DataDEM& setNodeRegistration(NodeRegistration node);
  DataDEM& setExtend(int extend, int extend_proc);
  DataDEM& setChunks(int chunk);
  DataDEM& setZLimits(std::optional<double> lower,
                      std::optional<double> upper);
  DataDEM& useWeights(bool enabled = true);
  DataDEM& enableMask(bool enabled = true);
  DataDEM& enableUncertainty(bool enabled = true);
  DataDEM& enableSpatialMetadata(bool enabled = true);

  // ─── Collaborators ────────────────────────────────────────────────────────

  DataDEM& setRasterIO(std::shared_ptr<RasterIO> io);
  DataDEM& setGridEngine(std::shared_ptr<ExternalGridEngine> engine);
  DataDEM& setProxyService(std::shared_ptr<RasterProxyService> proxy);
  DataDEM& setFetchRegistry(std::shared_ptr<FetchRegistry> fetch);

  const Config& config() const { return cfg_; }

  // ─── Run ──────────────────────────────────────────────────────────────────

  /**
   * @brief Grid the catalogs and write the products.
   *
   * @return nullopt when no chunk produced data (nothing is written)
   * @throws InvalidRegion if no usable region can be determined
   * @throws ExternalToolFailure if unchunked gridding fails
   */
  std::optional<DemProducts> run(const std::vector<std::string>& catalogs);

  /**
   * @brief Grid the catalogs over the output region without writing.
   * @return nullopt when no chunk produced data
   */
  std::optional<Raster> grid(const std::vector<std::string>& catalogs);

  /// Presence mask of the catalogs over the output region.
  Raster mask(const std::vector<std::string>& catalogs);

  // ─── Geometry of the current settings ─────────────────────────────────────

  /// Region after defaulting and node registration.
  Region region(const std::vector<std::string>& catalogs) const;
  double increment(const Region& region) const;
  Region distributionRegion(const Region& region, double inc) const;
  Region processingRegion(const Region& region, double inc) const;
  /// "<prefix><inc>_<region>_<year>" when a prefix is set, else the name.
  std::string outputName(const Region& region, double inc) const;

 private:
  CatalogResolver makeResolver() const;
  Raster gridChunk(const std::vector<std::string>& catalogs,
                   const Region& chunk, double inc) const;
  std::optional<Raster> gridAll(const std::vector<std::string>& catalogs,
                                const Region& region, double inc,
                                DemProducts& products) const;
  std::string layerPath(const std::string& name, const char* suffix) const;

  Config cfg_;
  std::optional<Region> region_;

  std::shared_ptr<RasterIO> io_;
  std::shared_ptr<ExternalGridEngine> engine_;
  std::shared_ptr<RasterProxyService> proxy_;
  std::shared_ptr<FetchRegistry> fetch_;
  std::shared_ptr<ExtentCache> extent_cache_;
};

}  // namespace datadem

#endif  // DATADEM_DATADEM_HPP
