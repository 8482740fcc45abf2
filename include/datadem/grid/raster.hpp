// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster.hpp
 *
 * Single-band float raster over a GridSpec, plus output layer names.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_GRID_RASTER_HPP
#define DATADEM_GRID_RASTER_HPP

#include <Eigen/Core>
#include <cmath>
#include <optional>
#include <utility>

#include "datadem/grid/grid_spec.hpp"

namespace datadem {

// ─── Layer name constants ───────────────────────────────────────────────────

/// Output name suffixes ("<name>_<suffix>"). The DEM itself has none.
namespace layer {

constexpr auto dem = "";
constexpr auto mask = "msk";
constexpr auto proximity = "prox";
constexpr auto slope = "slp";
constexpr auto proximity_uncertainty = "prox_unc";
constexpr auto slope_uncertainty = "slp_unc";
constexpr auto uncertainty = "unc";
constexpr auto spatial_metadata = "sm";

}  // namespace layer

// ─── Raster ─────────────────────────────────────────────────────────────────

/**
 * @brief Float raster, row 0 at the north edge.
 *
 * Storage is an Eigen::MatrixXf of size (height, width), initialized to the
 * spec's nodata value. A cell is valid when it is finite and != nodata.
 */
class Raster {
 public:
  Raster() = default;
  explicit Raster(const GridSpec& spec)
      : spec_(spec),
        data_(Eigen::MatrixXf::Constant(spec.height, spec.width,
                                        spec.nodata)) {}
  Raster(const GridSpec& spec, Eigen::MatrixXf data)
      : spec_(spec), data_(std::move(data)) {}

  const GridSpec& spec() const { return spec_; }
  float nodata() const { return spec_.nodata; }
  int rows() const { return static_cast<int>(data_.rows()); }
  int cols() const { return static_cast<int>(data_.cols()); }
  bool empty() const { return data_.size() == 0; }

  Eigen::MatrixXf& data() { return data_; }
  const Eigen::MatrixXf& data() const { return data_; }

  float& operator()(int row, int col) { return data_(row, col); }
  float operator()(int row, int col) const { return data_(row, col); }

  bool isValid(int row, int col) const {
    const float v = data_(row, col);
    return std::isfinite(v) && v != spec_.nodata;
  }

  /// Value of the cell containing (x, y); nullopt if outside or nodata.
  std::optional<float> sample(double x, double y) const {
    auto idx = spec_.cellAt(x, y);
    if (!idx || !isValid(idx->row, idx->col)) return std::nullopt;
    return data_(idx->row, idx->col);
  }

  size_t validCount() const;
  bool hasData() const { return validCount() > 0; }

 private:
  GridSpec spec_;
  Eigen::MatrixXf data_;
};

/**
 * @brief Sub-raster of the cells whose centers fall inside region.
 * @return Empty raster if no cell center is inside.
 */
Raster crop(const Raster& src, const Region& region);

/**
 * @brief Copy valid cells of src into dst where their centers land.
 * @return Number of cells written.
 */
size_t mosaic(Raster& dst, const Raster& src);

}  // namespace datadem

#endif  // DATADEM_GRID_RASTER_HPP
