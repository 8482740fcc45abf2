// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * xyz_reader.hpp
 *
 * Streaming reader for delimited x/y/z text files.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_CATALOG_XYZ_READER_HPP
#define DATADEM_CATALOG_XYZ_READER_HPP

#include <fstream>
#include <optional>
#include <string>

#include "datadem/config/catalog.hpp"
#include "datadem/point_types.hpp"
#include "datadem/region.hpp"

namespace datadem {

/// Delimiter candidates, tried in this order.
constexpr char kDelimiterCandidates[] = {',', ' ', '\t', '/', ':'};

/// First candidate that splits the line into more than one field.
std::optional<char> detectDelimiter(const std::string& line);

/**
 * @brief Parse one record with the given delimiter and column layout.
 *
 * Whitespace delimiters collapse runs of blanks. Weight is left at 1.
 *
 * @throws MalformedRecord if a column is missing or not a number
 */
PointRecord parseXyzLine(const std::string& line, char delimiter,
                         const config::Xyz& layout);

/**
 * @brief Pull-based reader over one delimited point file.
 *
 * The delimiter is detected once from the first data line (unless fixed by
 * the layout). Malformed lines are logged and skipped. Optional region
 * (inclusive) and z-limit filters are applied before a record is returned.
 *
 * @code
 *   XyzReader reader("soundings.xyz", config::Xyz{});
 *   PointRecord pt;
 *   while (reader.next(pt)) { ... }
 * @endcode
 */
class XyzReader : public PointStream {
 public:
  /// @throws SourceUnavailable if the file cannot be opened
  XyzReader(const std::string& path, const config::Xyz& layout);

  XyzReader& setRegion(const Region& region) {
    region_ = region;
    return *this;
  }
  XyzReader& setZLimits(std::optional<double> lower,
                        std::optional<double> upper) {
    z_lower_ = lower;
    z_upper_ = upper;
    return *this;
  }
  XyzReader& setWeight(double weight) {
    weight_ = weight;
    return *this;
  }

  bool next(PointRecord& out) override;

  std::optional<char> delimiter() const { return delimiter_; }
  size_t recordsRead() const { return records_; }
  size_t malformedLines() const { return malformed_; }

 private:
  std::string path_;
  std::ifstream in_;
  config::Xyz layout_;
  std::optional<char> delimiter_;
  std::optional<Region> region_;
  std::optional<double> z_lower_;
  std::optional<double> z_upper_;
  double weight_ = 1.0;
  size_t line_no_ = 0;
  size_t records_ = 0;
  size_t malformed_ = 0;
};

/// Scan a point file and return its x/y/z extent (nullopt if no records).
std::optional<Region> scanXyzExtent(const std::string& path,
                                    const config::Xyz& layout);

}  // namespace datadem

#endif  // DATADEM_CATALOG_XYZ_READER_HPP
