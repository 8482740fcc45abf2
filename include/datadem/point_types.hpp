// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_types.hpp
 *
 * Point record and the pull-based stream interface every source
 * (point files, raster scans, fetch plugins, catalogs) is read through.
 */

#ifndef DATADEM_POINT_TYPES_HPP
#define DATADEM_POINT_TYPES_HPP

#include <memory>
#include <utility>
#include <vector>

namespace datadem {

/// One elevation sample. Produced and consumed one at a time.
struct PointRecord {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
  double weight = 1.0;
};

/**
 * @brief Single-pass, pull-based point sequence.
 *
 * Not replayable: a fresh stream has to be requested to read again.
 *
 * @code
 *   PointRecord pt;
 *   while (stream.next(pt)) { ... }
 * @endcode
 */
class PointStream {
 public:
  virtual ~PointStream() = default;

  /// Advance to the next record. Returns false once exhausted.
  virtual bool next(PointRecord& out) = 0;
};

using PointStreamPtr = std::unique_ptr<PointStream>;

/// Stream over an explicitly materialized set of records.
class VectorPointStream : public PointStream {
 public:
  VectorPointStream() = default;
  explicit VectorPointStream(std::vector<PointRecord> points)
      : points_(std::move(points)) {}

  bool next(PointRecord& out) override {
    if (pos_ >= points_.size()) return false;
    out = points_[pos_++];
    return true;
  }

 private:
  std::vector<PointRecord> points_;
  size_t pos_ = 0;
};

/// Chains several streams back to back.
class ConcatPointStream : public PointStream {
 public:
  explicit ConcatPointStream(std::vector<PointStreamPtr> parts)
      : parts_(std::move(parts)) {}

  bool next(PointRecord& out) override {
    while (current_ < parts_.size()) {
      if (parts_[current_] && parts_[current_]->next(out)) return true;
      parts_[current_].reset();
      ++current_;
    }
    return false;
  }

 private:
  std::vector<PointStreamPtr> parts_;
  size_t current_ = 0;
};

/// Drain a stream into memory.
inline std::vector<PointRecord> collect(PointStream& stream) {
  std::vector<PointRecord> out;
  PointRecord pt;
  while (stream.next(pt)) out.push_back(pt);
  return out;
}

}  // namespace datadem

#endif  // DATADEM_POINT_TYPES_HPP
