// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/grid/raster.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace datadem {

size_t Raster::validCount() const {
  size_t n = 0;
  for (int r = 0; r < rows(); ++r) {
    for (int c = 0; c < cols(); ++c) {
      if (isValid(r, c)) ++n;
    }
  }
  return n;
}

Raster crop(const Raster& src, const Region& region) {
  const auto& s = src.spec();
  const auto& gt = s.transform;

  // First/last cell whose center lies inside the region
  const auto col_of = [&](double x) {
    return (x - gt.origin_x) / gt.cell_x - 0.5;
  };
  const auto row_of = [&](double y) {
    return (y - gt.origin_y) / gt.cell_y - 0.5;
  };
  const int c0 =
      std::max(0, static_cast<int>(std::ceil(col_of(region.west()))));
  const int c1 = std::min(s.width - 1,
                          static_cast<int>(std::floor(col_of(region.east()))));
  const int r0 =
      std::max(0, static_cast<int>(std::ceil(row_of(region.north()))));
  const int r1 = std::min(
      s.height - 1, static_cast<int>(std::floor(row_of(region.south()))));
  if (c0 > c1 || r0 > r1) return {};

  GridSpec sub = s;
  sub.width = c1 - c0 + 1;
  sub.height = r1 - r0 + 1;
  sub.transform.origin_x = gt.origin_x + c0 * gt.cell_x;
  sub.transform.origin_y = gt.origin_y + r0 * gt.cell_y;
  sub.region = sub.extent();

  Eigen::MatrixXf window = src.data().block(r0, c0, sub.height, sub.width);
  return Raster(sub, std::move(window));
}

size_t mosaic(Raster& dst, const Raster& src) {
  size_t written = 0;
  for (int r = 0; r < src.rows(); ++r) {
    for (int c = 0; c < src.cols(); ++c) {
      if (!src.isValid(r, c)) continue;
      const auto [x, y] = src.spec().cellCenter(r, c);
      auto idx = dst.spec().cellAt(x, y);
      if (!idx) continue;
      dst(idx->row, idx->col) = src(r, c);
      ++written;
    }
  }
  return written;
}

}  // namespace datadem
