// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * binning.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/grid/binning.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace datadem {

// ─── BinAccumulator ─────────────────────────────────────────────────────────

BinAccumulator::BinAccumulator(const GridSpec& spec)
    : spec_(spec),
      sum_wz_(Eigen::MatrixXd::Zero(spec.height, spec.width)),
      sum_w_(Eigen::MatrixXd::Zero(spec.height, spec.width)),
      count_(Eigen::MatrixXd::Zero(spec.height, spec.width)) {}

bool BinAccumulator::add(const PointRecord& pt) {
  auto idx = spec_.cellAt(pt.x, pt.y);
  if (!idx) return false;

  sum_wz_(idx->row, idx->col) += pt.weight * pt.z;
  sum_w_(idx->row, idx->col) += pt.weight;
  count_(idx->row, idx->col) += 1.0;
  ++binned_;
  return true;
}

size_t BinAccumulator::addAll(PointStream& stream) {
  size_t n = 0;
  PointRecord pt;
  while (stream.next(pt)) {
    if (add(pt)) ++n;
  }
  return n;
}

void BinAccumulator::merge(const BinAccumulator& other) {
  if (!spec_.sameGeometry(other.spec_)) {
    throw std::invalid_argument(
        "BinAccumulator::merge: grids have different geometry");
  }
  sum_wz_ += other.sum_wz_;
  sum_w_ += other.sum_w_;
  count_ += other.count_;
  binned_ += other.binned_;
}

Raster BinAccumulator::finalize(BinMode mode) const {
  Raster out(spec_);
  auto& data = out.data();

  for (int r = 0; r < spec_.height; ++r) {
    for (int c = 0; c < spec_.width; ++c) {
      const double n = count_(r, c);
      switch (mode) {
        case BinMode::Count:
          data(r, c) = static_cast<float>(n);
          break;
        case BinMode::Presence:
          data(r, c) = n > 0.0 ? 1.0f : 0.0f;
          break;
        case BinMode::Mean:
          if (n > 0.0 && sum_w_(r, c) != 0.0) {
            data(r, c) = static_cast<float>(sum_wz_(r, c) / sum_w_(r, c));
          }
          break;
      }
    }
  }
  return out;
}

// ─── GridBinner ─────────────────────────────────────────────────────────────

Raster GridBinner::bin(PointStream& points, const GridSpec& spec) const {
  BinAccumulator acc(spec);
  const size_t n = acc.addAll(points);
  spdlog::debug("[Binning] binned {} points into {}x{} grid", n, spec.width,
                spec.height);
  return acc.finalize(mode_);
}

// ─── Block mean ─────────────────────────────────────────────────────────────

PointStreamPtr blockMean(PointStream& input, const GridSpec& spec,
                         bool use_weights) {
  BinAccumulator acc(spec);
  PointRecord pt;
  while (input.next(pt)) {
    if (!use_weights) pt.weight = 1.0;
    acc.add(pt);
  }

  std::vector<PointRecord> blocks;
  const auto& count = acc.count();
  for (int r = 0; r < spec.height; ++r) {
    for (int c = 0; c < spec.width; ++c) {
      const double n = count(r, c);
      const double w = acc.sumWeight()(r, c);
      if (n <= 0.0 || w == 0.0) continue;
      const auto [x, y] = spec.cellCenter(r, c);
      blocks.push_back({x, y, acc.sumWeightedZ()(r, c) / w, w / n});
    }
  }
  return std::make_unique<VectorPointStream>(std::move(blocks));
}

}  // namespace datadem
