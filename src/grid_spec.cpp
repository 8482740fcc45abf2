// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/grid/grid_spec.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "datadem/errors.hpp"

namespace datadem {

GridSpec GridSpec::fromRegion(const Region& region, double cell_size,
                              float nodata) {
  if (!isValid(region)) {
    throw InvalidRegion("grid region is degenerate: " + formatRegion(region));
  }
  if (!(cell_size > 0.0)) {
    throw std::invalid_argument("grid cell size must be > 0");
  }

  GridSpec spec;
  spec.region = region;
  spec.cell_size = cell_size;
  spec.width = std::max(
      1, static_cast<int>(std::floor(region.width() / cell_size + 0.5)));
  spec.height = std::max(
      1, static_cast<int>(std::floor(region.height() / cell_size + 0.5)));
  spec.transform = {region.west(), cell_size, region.north(), -cell_size};
  spec.nodata = nodata;
  return spec;
}

CellIndex GridSpec::toCell(double x, double y) const {
  const double col = std::floor((x - transform.origin_x) / transform.cell_x);
  const double row = std::floor((y - transform.origin_y) / transform.cell_y);
  return {static_cast<int>(row), static_cast<int>(col)};
}

std::optional<CellIndex> GridSpec::cellAt(double x, double y) const {
  if (!std::isfinite(x) || !std::isfinite(y)) return std::nullopt;
  const double col = std::floor((x - transform.origin_x) / transform.cell_x);
  const double row = std::floor((y - transform.origin_y) / transform.cell_y);
  if (col < 0.0 || row < 0.0 || col >= width || row >= height) {
    return std::nullopt;
  }
  return CellIndex{static_cast<int>(row), static_cast<int>(col)};
}

std::pair<double, double> GridSpec::cellCenter(int row, int col) const {
  return {transform.origin_x + (col + 0.5) * transform.cell_x,
          transform.origin_y + (row + 0.5) * transform.cell_y};
}

Region GridSpec::extent() const {
  const double east = transform.origin_x + width * transform.cell_x;
  const double south = transform.origin_y + height * transform.cell_y;
  return {transform.origin_x, east, south, transform.origin_y};
}

bool GridSpec::sameGeometry(const GridSpec& other) const {
  return width == other.width && height == other.height &&
         transform.origin_x == other.transform.origin_x &&
         transform.origin_y == other.transform.origin_y &&
         transform.cell_x == other.transform.cell_x &&
         transform.cell_y == other.transform.cell_y;
}

}  // namespace datadem
