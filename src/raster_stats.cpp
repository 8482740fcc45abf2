// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/grid/raster_stats.hpp"

#include <algorithm>
#include <cmath>

namespace datadem {

std::optional<double> percentile(std::vector<double> values, double p) {
  if (values.empty()) return std::nullopt;
  std::sort(values.begin(), values.end());

  const double rank =
      std::clamp(p, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
  const size_t lo = static_cast<size_t>(std::floor(rank));
  const size_t hi = std::min(lo + 1, values.size() - 1);
  const double t = rank - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * t;
}

std::optional<double> percentile(const Raster& raster, double p) {
  std::vector<double> values;
  values.reserve(static_cast<size_t>(raster.rows()) * raster.cols());
  for (int r = 0; r < raster.rows(); ++r) {
    for (int c = 0; c < raster.cols(); ++c) {
      if (raster.isValid(r, c)) values.push_back(raster(r, c));
    }
  }
  return percentile(std::move(values), p);
}

MaskStats maskAnalysis(const Raster& mask) {
  MaskStats s;
  s.max = static_cast<double>(mask.rows()) * mask.cols();
  for (int r = 0; r < mask.rows(); ++r) {
    for (int c = 0; c < mask.cols(); ++c) {
      if (mask.isValid(r, c) && mask(r, c) > 0.0f) s.sum += 1.0;
    }
  }
  s.percent = s.max > 0.0 ? s.sum / s.max * 100.0 : 0.0;
  return s;
}

std::optional<std::pair<float, float>> zRange(const Raster& raster) {
  std::optional<std::pair<float, float>> out;
  for (int r = 0; r < raster.rows(); ++r) {
    for (int c = 0; c < raster.cols(); ++c) {
      if (!raster.isValid(r, c)) continue;
      const float v = raster(r, c);
      if (!out) {
        out = std::make_pair(v, v);
      } else {
        out->first = std::min(out->first, v);
        out->second = std::max(out->second, v);
      }
    }
  }
  return out;
}

}  // namespace datadem
