// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <spdlog/spdlog.h>

#include <tuple>
#include <utility>

#include "datadem/grid/raster_stats.hpp"
#include "datadem/services/raster_io.hpp"

namespace datadem {

namespace {

/// Cell centers of the valid cells of one raster window.
class RasterPointStream : public PointStream {
 public:
  RasterPointStream(Raster raster, std::optional<Region> region,
                    std::optional<double> z_lower,
                    std::optional<double> z_upper,
                    std::shared_ptr<Reprojector> reprojector, int src_epsg,
                    int dst_epsg)
      : raster_(std::move(raster)),
        region_(std::move(region)),
        z_lower_(z_lower),
        z_upper_(z_upper),
        reprojector_(std::move(reprojector)),
        src_epsg_(src_epsg),
        dst_epsg_(dst_epsg) {}

  bool next(PointRecord& out) override {
    while (row_ < raster_.rows()) {
      const int r = row_;
      const int c = col_;
      if (++col_ >= raster_.cols()) {
        col_ = 0;
        ++row_;
      }
      if (!raster_.isValid(r, c)) continue;

      auto [x, y] = raster_.spec().cellCenter(r, c);
      if (reprojector_) {
        std::tie(x, y) = reprojector_->transform(x, y, src_epsg_, dst_epsg_);
      }
      const double z = raster_(r, c);
      if (region_ && !contains(*region_, x, y)) continue;
      if (!zPass(z, z_lower_, z_upper_)) continue;

      out = {x, y, z, 1.0};
      return true;
    }
    return false;
  }

 private:
  Raster raster_;
  std::optional<Region> region_;
  std::optional<double> z_lower_;
  std::optional<double> z_upper_;
  std::shared_ptr<Reprojector> reprojector_;
  int src_epsg_;
  int dst_epsg_;
  int row_ = 0;
  int col_ = 0;
};

}  // namespace

PointStreamPtr GridRasterScanner::scan(const std::string& path,
                                       const std::optional<Region>& region,
                                       std::optional<double> z_lower,
                                       std::optional<double> z_upper) {
  const RasterInfo info = io_->open(path);

  const bool warp = reprojector_ && target_epsg_ && info.epsg &&
                    *info.epsg != *target_epsg_;

  // A region in the target CRS cannot select a source window
  RasterWindow window{0, 0, info.width, info.height};
  if (region && !warp) window = windowFor(info, *region);
  if (window.empty()) {
    spdlog::debug("[RasterScan] {} does not overlap {}", path,
                  formatRegion(*region));
    return std::make_unique<VectorPointStream>();
  }

  Raster raster = io_->readWindow(path, window);
  return std::make_unique<RasterPointStream>(
      std::move(raster), region, z_lower, z_upper,
      warp ? reprojector_ : nullptr, info.epsg.value_or(0),
      target_epsg_.value_or(0));
}

std::optional<Region> GridRasterScanner::extent(const std::string& path) {
  const RasterInfo info = io_->open(path);
  const Raster raster =
      io_->readWindow(path, RasterWindow{0, 0, info.width, info.height});
  const auto z = zRange(raster);
  if (!z) return std::nullopt;
  return rasterExtent(info).withZ(z->first, z->second);
}

}  // namespace datadem
