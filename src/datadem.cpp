// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/datadem.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <stdexcept>

#include "datadem/errors.hpp"
#include "datadem/grid/raster_stats.hpp"
#include "datadem/metadata/spatial_metadata.hpp"

namespace datadem {

namespace {

int thisYear() {
  const std::time_t now = std::time(nullptr);
  const std::tm* local = std::localtime(&now);
  return local ? local->tm_year + 1900 : 1970;
}

}  // namespace

DataDEM::DataDEM() : DataDEM(Config{}) {}

DataDEM::DataDEM(const Config& cfg)
    : cfg_(cfg),
      io_(std::make_shared<AsciiGridIO>()),
      engine_(createGridEngine(cfg.grid.fill_iterations,
                               cfg.grid.fill_min_neighbors)),
      proxy_(createProxyService()),
      extent_cache_(std::make_shared<ExtentCache>(
          cfg.catalog.overwrite_extents, cfg.catalog.refresh_stale_extents)) {}

// ─── Builder ────────────────────────────────────────────────────────────────

DataDEM& DataDEM::setRegion(const Region& region) {
  region_ = region;
  return *this;
}

DataDEM& DataDEM::setIncrement(double increment) {
  cfg_.grid.increment = increment;
  return *this;
}

DataDEM& DataDEM::setName(const std::string& name) {
  cfg_.grid.name = name;
  return *this;
}

DataDEM& DataDEM::setNamePrefix(const std::string& prefix) {
  cfg_.grid.name_prefix = prefix;
  return *this;
}

DataDEM& DataDEM::setModule(GridModule module) {
  cfg_.grid.module = module;
  return *this;
}

DataDEM& DataDEM::setBinMode(BinMode mode) {
  cfg_.grid.mode = mode;
  return *this;
}

DataDEM& DataDEM::setNodeRegistration(NodeRegistration node) {
  cfg_.grid.node = node;
  return *this;
}

DataDEM& DataDEM::setExtend(int extend, int extend_proc) {
  cfg_.grid.extend = extend;
  cfg_.grid.extend_proc = extend_proc;
  return *this;
}

DataDEM& DataDEM::setChunks(int chunk) {
  cfg_.grid.chunk = chunk;
  return *this;
}

DataDEM& DataDEM::setZLimits(std::optional<double> lower,
                             std::optional<double> upper) {
  cfg_.point_filter.z_min = lower;
  cfg_.point_filter.z_max = upper;
  return *this;
}

DataDEM& DataDEM::useWeights(bool enabled) {
  cfg_.catalog.use_weights = enabled;
  return *this;
}

DataDEM& DataDEM::enableMask(bool enabled) {
  cfg_.grid.mask = enabled;
  return *this;
}

DataDEM& DataDEM::enableUncertainty(bool enabled) {
  cfg_.uncertainty.enabled = enabled;
  return *this;
}

DataDEM& DataDEM::enableSpatialMetadata(bool enabled) {
  cfg_.metadata.enabled = enabled;
  return *this;
}

DataDEM& DataDEM::setRasterIO(std::shared_ptr<RasterIO> io) {
  io_ = std::move(io);
  return *this;
}

DataDEM& DataDEM::setGridEngine(std::shared_ptr<ExternalGridEngine> engine) {
  engine_ = std::move(engine);
  return *this;
}

DataDEM& DataDEM::setProxyService(std::shared_ptr<RasterProxyService> proxy) {
  proxy_ = std::move(proxy);
  return *this;
}

DataDEM& DataDEM::setFetchRegistry(std::shared_ptr<FetchRegistry> fetch) {
  fetch_ = std::move(fetch);
  return *this;
}

// ─── Geometry ───────────────────────────────────────────────────────────────

CatalogResolver DataDEM::makeResolver() const {
  CatalogResolver resolver(cfg_.xyz, cfg_.catalog);
  resolver.setExtentCache(extent_cache_)
      .setRasterScanner(std::make_shared<GridRasterScanner>(io_))
      .setFetchRegistry(fetch_)
      .setZLimits(cfg_.point_filter.z_min, cfg_.point_filter.z_max);
  return resolver;
}

Region DataDEM::region(const std::vector<std::string>& catalogs) const {
  Region r;
  if (region_ && isValid(*region_)) {
    r = *region_;
  } else {
    auto ext = makeResolver().extent(catalogs);
    if (!ext || !isValid(*ext)) {
      throw InvalidRegion("no valid region given and none could be derived "
                          "from the catalogs");
    }
    spdlog::info("[DataDEM] Using catalog extent {}", formatRegion(*ext));
    r = ext->xy();
  }
  if (cfg_.grid.node == NodeRegistration::Grid) {
    r = buffer(r, increment(r) * 0.5);
  }
  return r;
}

double DataDEM::increment(const Region& region) const {
  return cfg_.grid.increment > 0.0 ? cfg_.grid.increment
                                   : region.width() / 500.0;
}

Region DataDEM::distributionRegion(const Region& region, double inc) const {
  return buffer(region, inc * cfg_.grid.extend);
}

Region DataDEM::processingRegion(const Region& region, double inc) const {
  return buffer(region, inc * (cfg_.grid.extend_proc + cfg_.grid.extend));
}

std::string DataDEM::outputName(const Region& region, double inc) const {
  if (cfg_.grid.name_prefix.empty()) return cfg_.grid.name;
  return cfg_.grid.name_prefix + incrementToString(inc) + "_" +
         formatRegion(region, RegionFormat::Fn) + "_" +
         std::to_string(thisYear());
}

std::string DataDEM::layerPath(const std::string& name,
                               const char* suffix) const {
  return std::string(suffix).empty() ? name : name + "_" + suffix;
}

// ─── Gridding ───────────────────────────────────────────────────────────────

Raster DataDEM::gridChunk(const std::vector<std::string>& catalogs,
                          const Region& chunk, double inc) const {
  const Region proc = buffer(chunk, inc * cfg_.grid.extend_proc);
  auto resolver = makeResolver();
  resolver.setRegion(proc);
  auto points = resolver.resolve(catalogs);

  Raster full;
  if (cfg_.grid.module == GridModule::Surface) {
    if (!engine_) throw ExternalToolFailure("no grid engine configured");
    GridRequest req;
    req.region = proc;
    req.cell_size = inc;
    req.nodata = cfg_.grid.nodata;
    req.use_weights = cfg_.catalog.use_weights;
    full = engine_->interpolate(req, *points);
  } else {
    const auto spec = GridSpec::fromRegion(proc, inc, cfg_.grid.nodata);
    GridBinner binner(cfg_.grid.mode);
    if (cfg_.grid.mode == BinMode::Mean) {
      auto blocks = blockMean(*points, spec, cfg_.catalog.use_weights);
      full = binner.bin(*blocks, spec);
    } else {
      full = binner.bin(*points, spec);
    }
  }
  return crop(full, chunk);
}

std::optional<Raster> DataDEM::gridAll(const std::vector<std::string>& catalogs,
                                       const Region& region, double inc,
                                       DemProducts& products) const {
  Raster out(GridSpec::fromRegion(region, inc, cfg_.grid.nodata));

  if (cfg_.grid.chunk <= 0) {
    products.chunks = 1;
    try {
      mosaic(out, gridChunk(catalogs, region, inc));
    } catch (const ExternalToolFailure& e) {
      spdlog::error("[DataDEM] Gridding failed: {}", e.what());
      throw;
    }
    if (!out.hasData()) {
      spdlog::warn("[DataDEM] No data gridded in {}", formatRegion(region));
      return std::nullopt;
    }
    return out;
  }

  const int chunk_cells = out.cols() / cfg_.grid.chunk + 1;
  const auto chunks = tile(region, inc, chunk_cells);
  products.chunks = chunks.size();
  spdlog::info("[DataDEM] Processing {} chunks of {} cells", chunks.size(),
               chunk_cells);

  for (size_t i = 0; i < chunks.size(); ++i) {
    Raster part;
    try {
      part = gridChunk(catalogs, chunks[i], inc);
    } catch (const ExternalToolFailure& e) {
      spdlog::warn("[DataDEM] Dropping chunk {}/{} {}: {}", i + 1,
                   chunks.size(), formatRegion(chunks[i]), e.what());
      ++products.chunks_dropped;
      continue;
    }
    if (!part.hasData()) {
      spdlog::warn("[DataDEM] Dropping chunk {}/{} {}: no data", i + 1,
                   chunks.size(), formatRegion(chunks[i]));
      ++products.chunks_dropped;
      continue;
    }
    mosaic(out, part);
  }

  if (products.chunks_dropped == products.chunks) {
    spdlog::error("[DataDEM] All {} chunks failed, no output", chunks.size());
    return std::nullopt;
  }
  return out;
}

std::optional<Raster> DataDEM::grid(const std::vector<std::string>& catalogs) {
  const Region r = region(catalogs);
  const double inc = increment(r);
  DemProducts products;
  return gridAll(catalogs, distributionRegion(r, inc), inc, products);
}

Raster DataDEM::mask(const std::vector<std::string>& catalogs) {
  const Region r = region(catalogs);
  const double inc = increment(r);
  const Region dist = distributionRegion(r, inc);

  auto resolver = makeResolver();
  resolver.setRegion(dist);
  auto points = resolver.resolve(catalogs);
  return GridBinner(BinMode::Presence)
      .bin(*points, GridSpec::fromRegion(dist, inc, cfg_.grid.nodata));
}

std::optional<DemProducts> DataDEM::run(
    const std::vector<std::string>& catalogs) {
  if (catalogs.empty()) {
    throw std::invalid_argument("DataDEM::run needs at least one catalog");
  }

  const Region r = region(catalogs);
  const double inc = increment(r);
  const Region dist = distributionRegion(r, inc);
  const std::string name = outputName(r, inc);
  spdlog::info("[DataDEM] {}: region {} increment {} ({} module)", name,
               formatRegion(dist), inc,
               cfg_.grid.module == GridModule::Surface ? "surface" : "num");

  DemProducts products;
  auto dem = gridAll(catalogs, dist, inc, products);
  if (!dem) return std::nullopt;
  products.dem = io_->write(*dem, layerPath(name, layer::dem));

  const bool need_mask = cfg_.grid.mask || cfg_.uncertainty.enabled;
  Raster data_mask;
  if (need_mask) {
    data_mask = mask(catalogs);
    if (cfg_.grid.mask) {
      products.mask = io_->write(data_mask, layerPath(name, layer::mask));
      const auto stats = maskAnalysis(data_mask);
      spdlog::info("[DataDEM] Mask: {} of {} cells ({:.2f}%)", stats.sum,
                   stats.max, stats.percent);
    }
  }

  if (cfg_.uncertainty.enabled) {
    UncertaintyEstimator estimator(cfg_.uncertainty, engine_, proxy_);
    GridRequest req;
    req.region = dist;
    req.cell_size = inc;
    req.nodata = cfg_.grid.nodata;
    req.use_weights = cfg_.catalog.use_weights;

    const auto result = estimator.estimate(*dem, data_mask, req);
    if (result.distance_model) {
      products.proximity_uncertainty =
          io_->write(result.proximity_uncertainty,
                     layerPath(name, layer::proximity_uncertainty));
    }
    if (result.slope_model) {
      products.slope_uncertainty = io_->write(
          result.slope_uncertainty, layerPath(name, layer::slope_uncertainty));
    }
    if (result.combined) {
      products.uncertainty =
          io_->write(*result.combined, layerPath(name, layer::uncertainty));
    }
    if (cfg_.uncertainty.write_errors && !result.samples.empty()) {
      writeErrorSamples(layerPath(name, layer::proximity) + ".err",
                        result.samples, Predictor::Distance);
      writeErrorSamples(layerPath(name, layer::slope) + ".err",
                        result.samples, Predictor::Slope);
    }
  }

  if (cfg_.metadata.enabled) {
    const auto path = layerPath(name, layer::spatial_metadata) + ".tsv";
    WktTextLayer footprints(path, metadataFieldNames());
    const auto resolver = makeResolver();
    SpatialMetadata sm(cfg_.metadata, resolver);
    for (const auto& root : catalogs) sm.run(root, dist, inc, footprints);
    products.spatial_metadata = path;
  }

  spdlog::info("[DataDEM] Wrote {}", products.dem);
  return products;
}

}  // namespace datadem
