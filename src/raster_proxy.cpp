// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster_proxy.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/services/raster_proxy.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace datadem {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// 1D squared distance transform of f (Felzenszwalb & Huttenlocher).
// Infinite samples are not parabola sites.
void distanceTransform1D(const std::vector<double>& f, std::vector<double>& d,
                         std::vector<int>& v, std::vector<double>& z) {
  const int n = static_cast<int>(f.size());
  int k = -1;
  for (int q = 0; q < n; ++q) {
    if (f[q] == kInf) continue;
    double s = -kInf;
    while (k >= 0) {
      s = ((f[q] + 1.0 * q * q) - (f[v[k]] + 1.0 * v[k] * v[k])) /
          (2.0 * (q - v[k]));
      if (s > z[k]) break;
      --k;
      s = -kInf;
    }
    ++k;
    v[k] = q;
    z[k] = s;
    z[k + 1] = kInf;
  }

  if (k < 0) {
    std::fill(d.begin(), d.end(), kInf);
    return;
  }
  k = 0;
  for (int q = 0; q < n; ++q) {
    while (z[k + 1] < q) ++k;
    const double diff = q - v[k];
    d[q] = diff * diff + f[v[k]];
  }
}

}  // namespace

Raster GridProxyService::proximity(const Raster& mask) {
  const int rows = mask.rows();
  const int cols = mask.cols();
  Raster out(mask.spec());

  Eigen::MatrixXd dist(rows, cols);
  bool any = false;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const bool target = mask.isValid(r, c) && mask(r, c) != 0.0f;
      dist(r, c) = target ? 0.0 : kInf;
      any = any || target;
    }
  }
  if (!any) return out;

  const int n = std::max(rows, cols);
  std::vector<double> f, d;
  std::vector<int> v(n);
  std::vector<double> z(n + 1);

  // Columns, then rows
  f.resize(rows);
  d.resize(rows);
  for (int c = 0; c < cols; ++c) {
    for (int r = 0; r < rows; ++r) f[r] = dist(r, c);
    distanceTransform1D(f, d, v, z);
    for (int r = 0; r < rows; ++r) dist(r, c) = d[r];
  }
  f.resize(cols);
  d.resize(cols);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) f[c] = dist(r, c);
    distanceTransform1D(f, d, v, z);
    for (int c = 0; c < cols; ++c) {
      out(r, c) = static_cast<float>(std::sqrt(d[c]));
    }
  }
  return out;
}

Raster GridProxyService::slope(const Raster& dem) {
  const int rows = dem.rows();
  const int cols = dem.cols();
  Raster out(dem.spec());

  const auto& gt = dem.spec().transform;
  const double ew = std::abs(gt.cell_x) * scale_;
  const double ns = std::abs(gt.cell_y) * scale_;
  constexpr double kRadToDeg = 180.0 / M_PI;

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!dem.isValid(r, c)) continue;
      const double center = dem(r, c);

      // Missing or out-of-grid neighbours take the center value
      const auto at = [&](int dr, int dc) -> double {
        const int nr = r + dr;
        const int nc = c + dc;
        if (!dem.spec().contains(nr, nc) || !dem.isValid(nr, nc)) {
          return center;
        }
        return dem(nr, nc);
      };

      const double dzdx = ((at(-1, 1) + 2.0 * at(0, 1) + at(1, 1)) -
                           (at(-1, -1) + 2.0 * at(0, -1) + at(1, -1))) /
                          (8.0 * ew);
      const double dzdy = ((at(1, -1) + 2.0 * at(1, 0) + at(1, 1)) -
                           (at(-1, -1) + 2.0 * at(-1, 0) + at(-1, 1))) /
                          (8.0 * ns);
      out(r, c) = static_cast<float>(
          std::atan(std::sqrt(dzdx * dzdx + dzdy * dzdy)) * kRadToDeg);
    }
  }
  return out;
}

}  // namespace datadem
