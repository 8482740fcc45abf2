// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster_io.hpp
 *
 * Raster persistence and raster-to-points scanning seams.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_SERVICES_RASTER_IO_HPP
#define DATADEM_SERVICES_RASTER_IO_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "datadem/grid/raster.hpp"
#include "datadem/point_types.hpp"

namespace datadem {

/// Header information of a raster source.
struct RasterInfo {
  int width = 0;
  int height = 0;
  int band_count = 1;
  GeoTransform transform;
  std::string projection;     ///< WKT or empty
  std::optional<int> epsg;    ///< Horizontal CRS code if known
  std::optional<double> nodata;
};

/// Pixel window (GDAL "srcwin").
struct RasterWindow {
  int col_off = 0;
  int row_off = 0;
  int cols = 0;
  int rows = 0;

  bool empty() const { return cols <= 0 || rows <= 0; }
};

/// Window of a raster intersecting region, clamped to the raster bounds.
RasterWindow windowFor(const RasterInfo& info, const Region& region);

/// Region covered by a raster.
Region rasterExtent(const RasterInfo& info);

/**
 * @brief Raster file collaborator.
 *
 * All methods throw ExternalToolFailure when the file cannot be read or
 * written, and SourceUnavailable when it does not exist.
 */
class RasterIO {
 public:
  virtual ~RasterIO() = default;

  virtual RasterInfo open(const std::string& path) = 0;
  virtual Raster readWindow(const std::string& path,
                            const RasterWindow& window) = 0;
  /// @return Path actually written (may carry a format extension)
  virtual std::string write(const Raster& raster, const std::string& path) = 0;

  /// Extension appended by write() to extension-less names.
  virtual std::string extension() const = 0;
};

/**
 * @brief ESRI ASCII grid reader/writer.
 *
 * Header keys: ncols, nrows, xllcorner|xllcenter, yllcorner|yllcenter,
 * cellsize, NODATA_value (optional). Rows are stored north first.
 */
class AsciiGridIO : public RasterIO {
 public:
  RasterInfo open(const std::string& path) override;
  Raster readWindow(const std::string& path,
                    const RasterWindow& window) override;
  std::string write(const Raster& raster, const std::string& path) override;
  std::string extension() const override { return ".asc"; }
};

/// Coordinate reprojection collaborator.
class Reprojector {
 public:
  virtual ~Reprojector() = default;
  virtual std::pair<double, double> transform(double x, double y, int src_epsg,
                                              int dst_epsg) = 0;
};

/**
 * @brief Turns raster sources into point streams (cell centers of valid
 * cells) and reports their extents.
 */
class RasterScanner {
 public:
  virtual ~RasterScanner() = default;

  virtual PointStreamPtr scan(const std::string& path,
                              const std::optional<Region>& region,
                              std::optional<double> z_lower,
                              std::optional<double> z_upper) = 0;

  /// x/y/z extent of the raster's valid cells; nullopt if none.
  virtual std::optional<Region> extent(const std::string& path) = 0;
};

/**
 * @brief RasterScanner over any RasterIO.
 *
 * Reads only the window intersecting the query region. When a target CRS
 * and a reprojector are set, points from rasters with a different known
 * CRS are transformed before the region test.
 */
class GridRasterScanner : public RasterScanner {
 public:
  explicit GridRasterScanner(std::shared_ptr<RasterIO> io)
      : io_(std::move(io)) {}

  GridRasterScanner& setReprojection(std::shared_ptr<Reprojector> reprojector,
                                     int target_epsg) {
    reprojector_ = std::move(reprojector);
    target_epsg_ = target_epsg;
    return *this;
  }

  PointStreamPtr scan(const std::string& path,
                      const std::optional<Region>& region,
                      std::optional<double> z_lower,
                      std::optional<double> z_upper) override;

  std::optional<Region> extent(const std::string& path) override;

 private:
  std::shared_ptr<RasterIO> io_;
  std::shared_ptr<Reprojector> reprojector_;
  std::optional<int> target_epsg_;
};

}  // namespace datadem

#endif  // DATADEM_SERVICES_RASTER_IO_HPP
