// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * vector_io.hpp
 *
 * Polygon feature layers for spatial metadata output.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_SERVICES_VECTOR_IO_HPP
#define DATADEM_SERVICES_VECTOR_IO_HPP

#include <fstream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace datadem {

using Ring = std::vector<std::pair<double, double>>;  ///< Closed (x, y) ring
using Polygon = std::vector<Ring>;                    ///< Outer ring first
using MultiPolygon = std::vector<Polygon>;

struct Feature {
  MultiPolygon geometry;
  std::map<std::string, std::string> attributes;
};

/// Well-known text of a multipolygon.
std::string toWkt(const MultiPolygon& geometry);

/**
 * @brief Feature sink with a fixed attribute schema.
 *
 * Implementations must tolerate append() being called from one thread at
 * a time only; callers serialize access.
 */
class VectorLayer {
 public:
  virtual ~VectorLayer() = default;

  virtual const std::vector<std::string>& fields() const = 0;
  virtual void append(const Feature& feature) = 0;
  virtual size_t size() const = 0;
};

/// In-memory layer.
class MemoryLayer : public VectorLayer {
 public:
  explicit MemoryLayer(std::vector<std::string> fields)
      : fields_(std::move(fields)) {}

  const std::vector<std::string>& fields() const override { return fields_; }
  void append(const Feature& feature) override { features_.push_back(feature); }
  size_t size() const override { return features_.size(); }

  const std::vector<Feature>& features() const { return features_; }

 private:
  std::vector<std::string> fields_;
  std::vector<Feature> features_;
};

/**
 * @brief Tab-separated text layer: one header line with the field names
 * followed by "geometry", then one line per feature with WKT geometry.
 *
 * @throws ExternalToolFailure if the file cannot be created or written
 */
class WktTextLayer : public VectorLayer {
 public:
  WktTextLayer(const std::string& path, std::vector<std::string> fields);

  const std::vector<std::string>& fields() const override { return fields_; }
  void append(const Feature& feature) override;
  size_t size() const override { return count_; }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::vector<std::string> fields_;
  std::ofstream out_;
  size_t count_ = 0;
};

}  // namespace datadem

#endif  // DATADEM_SERVICES_VECTOR_IO_HPP
