// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * resolver.hpp
 *
 * Recursive catalog resolution into one lazy, filtered, weighted point
 * stream.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_CATALOG_RESOLVER_HPP
#define DATADEM_CATALOG_RESOLVER_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "datadem/catalog/entry.hpp"
#include "datadem/catalog/extent_cache.hpp"
#include "datadem/config/catalog.hpp"
#include "datadem/point_types.hpp"
#include "datadem/services/fetch.hpp"
#include "datadem/services/raster_io.hpp"

namespace datadem {

/// An entry reached during traversal, with the weight its records carry.
struct ResolvedEntry {
  Entry entry;
  double weight = 1.0;
  int depth = 0;  ///< 0 for root entries
};

/**
 * @brief Resolves a tree of catalogs into a point stream.
 *
 * Traversal is depth-first, in file order, with at most one leaf source
 * open at a time. Before an entry is opened its extent (from the extent
 * cache) is compared with the query region and z-limits; entries that
 * cannot contribute are skipped without being opened.
 *
 * Record weights:
 *   - no override: the weight of the entry that produced the record
 *   - override w, WeightMode::Compound: w times every entry weight on the
 *     path from the root to the record's entry
 *   - override w, WeightMode::RootOnly: w times the record's entry weight
 *
 * Missing sources, unknown formats and unparsable entries are logged and
 * skipped. A catalog that lists itself (directly or through descendants)
 * throws CatalogCycle.
 *
 * @code
 *   CatalogResolver resolver(cfg.xyz, cfg.catalog);
 *   resolver.setRegion(Region(0, 10, 0, 10));
 *   auto stream = resolver.resolve("soundings.datalist");
 *   PointRecord pt;
 *   while (stream->next(pt)) { ... }
 * @endcode
 */
class CatalogResolver {
 public:
  CatalogResolver(const config::Xyz& layout, const config::Catalog& catalog,
                  FormatRegistry registry = FormatRegistry::defaults());

  // ─── Collaborators ────────────────────────────────────────────────────────

  CatalogResolver& setExtentCache(std::shared_ptr<ExtentCache> cache) {
    cache_ = std::move(cache);
    return *this;
  }
  CatalogResolver& setRasterScanner(std::shared_ptr<RasterScanner> scanner) {
    scanner_ = std::move(scanner);
    return *this;
  }
  CatalogResolver& setFetchRegistry(std::shared_ptr<FetchRegistry> fetch) {
    fetch_ = std::move(fetch);
    return *this;
  }

  // ─── Query ────────────────────────────────────────────────────────────────

  CatalogResolver& setRegion(const Region& region) {
    region_ = region;
    return *this;
  }
  CatalogResolver& clearRegion() {
    region_.reset();
    return *this;
  }
  CatalogResolver& setZLimits(std::optional<double> lower,
                              std::optional<double> upper) {
    z_lower_ = lower;
    z_upper_ = upper;
    return *this;
  }
  CatalogResolver& setWeightOverride(std::optional<double> weight) {
    weight_override_ = weight;
    return *this;
  }
  CatalogResolver& setWeightMode(WeightMode mode) {
    weight_mode_ = mode;
    return *this;
  }

  const std::optional<Region>& region() const { return region_; }
  std::shared_ptr<ExtentCache> extentCache() const { return cache_; }

  // ─── Operations ───────────────────────────────────────────────────────────

  /**
   * @brief Lazy stream over every record reachable from root.
   *
   * root is a catalog line ("path [format] [weight] ...") read relative to
   * the working directory. The stream keeps its own copy of the query, so
   * later setter calls do not affect it.
   */
  PointStreamPtr resolve(const std::string& root) const;

  /// Several roots resolved back to back, as one combined catalog.
  PointStreamPtr resolve(const std::vector<std::string>& roots) const;

  /// Stream over already parsed entries (e.g. from entries()).
  PointStreamPtr resolveEntries(std::vector<Entry> roots) const;

  /// Entries reachable from root that pass pruning, without reading data.
  std::vector<ResolvedEntry> entries(const std::string& root,
                                     bool include_catalogs = false) const;

  /// Cached extent of an entry (catalogs: union of their children).
  std::optional<Region> extent(const Entry& entry) const;

  /// Extent of root, or of the union of several roots.
  std::optional<Region> extent(const std::vector<std::string>& roots) const;

  /// Write resolved records as "x y z [w]" lines. Returns the record count.
  size_t dump(const std::string& root, std::ostream& out,
              bool with_weight = false) const;

  /// Parse a root reference. @throws UnsupportedFormat, MalformedRecord
  Entry rootEntry(const std::string& ref) const;

 private:
  friend class CatalogWalker;
  friend class CatalogStream;

  double effectiveWeight(double entry_weight, double parent_weight) const;
  bool admit(const Entry& entry) const;
  std::optional<Region> catalogExtent(const std::string& path,
                                      std::vector<std::string>& visiting) const;
  std::optional<Region> extentOf(const Entry& entry,
                                 std::vector<std::string>& visiting) const;
  PointStreamPtr openLeaf(const Entry& entry) const;

  config::Xyz layout_;
  FormatRegistry registry_;
  double remote_padding_;

  std::shared_ptr<ExtentCache> cache_;
  std::shared_ptr<RasterScanner> scanner_;
  std::shared_ptr<FetchRegistry> fetch_;

  std::optional<Region> region_;
  std::optional<double> z_lower_;
  std::optional<double> z_upper_;
  std::optional<double> weight_override_;
  WeightMode weight_mode_;
};

/// Factory function for consistent creation pattern
inline std::unique_ptr<CatalogResolver> createCatalogResolver(
    const config::Xyz& layout, const config::Catalog& catalog) {
  return std::make_unique<CatalogResolver>(layout, catalog);
}

}  // namespace datadem

#endif  // DATADEM_CATALOG_RESOLVER_HPP
