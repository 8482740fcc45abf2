// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "datadem/services/vector_io.hpp"

#include <spdlog/fmt/fmt.h>

#include "datadem/errors.hpp"

namespace datadem {

std::string toWkt(const MultiPolygon& geometry) {
  if (geometry.empty()) return "MULTIPOLYGON EMPTY";

  std::string wkt = "MULTIPOLYGON (";
  for (size_t p = 0; p < geometry.size(); ++p) {
    wkt += p ? ", (" : "(";
    for (size_t r = 0; r < geometry[p].size(); ++r) {
      wkt += r ? ", (" : "(";
      const auto& ring = geometry[p][r];
      for (size_t i = 0; i < ring.size(); ++i) {
        wkt += fmt::format("{}{:.12g} {:.12g}", i ? ", " : "", ring[i].first,
                           ring[i].second);
      }
      wkt += ")";
    }
    wkt += ")";
  }
  wkt += ")";
  return wkt;
}

WktTextLayer::WktTextLayer(const std::string& path,
                           std::vector<std::string> fields)
    : path_(path), fields_(std::move(fields)), out_(path) {
  if (!out_.is_open()) {
    throw ExternalToolFailure("cannot create vector layer " + path);
  }
  for (const auto& f : fields_) out_ << f << '\t';
  out_ << "geometry\n";
}

void WktTextLayer::append(const Feature& feature) {
  for (const auto& f : fields_) {
    auto it = feature.attributes.find(f);
    out_ << (it == feature.attributes.end() ? "" : it->second) << '\t';
  }
  out_ << toWkt(feature.geometry) << '\n';
  out_.flush();
  if (!out_) throw ExternalToolFailure("write failed: " + path_);
  ++count_;
}

}  // namespace datadem
